/**
 * @file Utils.hpp
 * @brief General-purpose shape utility functions.
 *
 * Provides helpers for checked element counting and leading-axis (row)
 * arithmetic.
 */

#ifndef CADENCE_UTILS_HPP
#define CADENCE_UTILS_HPP

#include <cstdint>
#include <limits>
#include <vector>

#include "Errors.hpp"

namespace cadence::utils
{

/**
 * @brief Product of the extents of @p shape starting at axis @p first.
 *
 * Returns 1 when @p first is past the last axis.
 *
 * @throws cadence::bounds_error if the product overflows uint64_t.
 */
inline uint64_t checked_product(const std::vector<uint64_t>& shape,
    size_t first = 0)
{
    constexpr uint64_t U64_MAX = std::numeric_limits<uint64_t>::max();

    uint64_t prod = 1;
    for (size_t i = first; i < shape.size(); ++i)
    {
        const uint64_t d = shape[i];
        CADENCE_CHECK(d != 0 && prod > U64_MAX / d,
            bounds_error,
            "checked_product: element count overflow.");
        prod *= d;
    }
    return prod;
}

/**
 * @brief Shape with the leading (example) axis removed.
 *
 * A rank-1 shape yields an empty vector.
 */
inline std::vector<uint64_t>
trailing_shape(const std::vector<uint64_t>& shape)
{
    if (shape.empty())
    {
        return {};
    }
    return std::vector<uint64_t>(shape.begin() + 1, shape.end());
}

} // namespace cadence::utils

#endif // CADENCE_UTILS_HPP

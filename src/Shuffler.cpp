/**
 * @file Shuffler.cpp
 * @brief Shuffler function definitions.
 */

#include "cadence/Shuffler.hpp"
#include "cadence/Errors.hpp"

#include <limits>
#include <numeric>
#include <utility>

namespace cadence
{

uint64_t resolve_seed(uint64_t seed)
{
    if (seed == 0ULL)
    {
        std::random_device rd;
        seed = (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
        if (seed == 0ULL) seed = 0x9e3779b97f4a7c15ULL;
    }
    return seed;
}

Shuffler::Shuffler(uint64_t seed)
    : m_seed(resolve_seed(seed)),
      m_engine(m_seed)
{
}

uint64_t Shuffler::uniform_upto(uint64_t bound)
{
    if (bound == std::numeric_limits<uint64_t>::max())
    {
        return m_engine();
    }

    const uint64_t range = bound + 1;
    // Largest multiple of range that fits; draws above it are rejected.
    const uint64_t limit = std::numeric_limits<uint64_t>::max() -
        (std::numeric_limits<uint64_t>::max() % range + 1) % range;

    uint64_t draw = m_engine();
    while (draw > limit)
    {
        draw = m_engine();
    }
    return draw % range;
}

std::vector<uint64_t> Shuffler::permutation(uint64_t n)
{
    CADENCE_CHECK(n == 0,
        validation_error,
        R"(Shuffler(permutation): n must be > 0.)");

    std::vector<uint64_t> order(static_cast<size_t>(n));
    std::iota(order.begin(), order.end(), uint64_t{0});

    for (uint64_t i = n - 1; i > 0; --i)
    {
        const uint64_t j = uniform_upto(i);
        std::swap(order[i], order[j]);
    }
    return order;
}

uint64_t Shuffler::get_seed() const noexcept
{
    return m_seed;
}

} // namespace cadence

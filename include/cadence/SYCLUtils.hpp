/**
 * @file SYCLUtils.hpp
 * @brief Small, inline helpers for SYCL allocations and kernels.
 *
 */

#ifndef CADENCE_SYCLUTILS_HPP
#define CADENCE_SYCLUTILS_HPP

#include <sycl/sycl.hpp>
#include <cstdint>
#include <type_traits>
#include <vector>

#include "Errors.hpp"
#include "Tensor.hpp"

namespace cadence::sycl_utils
{

/**
 * @brief RAII owner of a USM scratch array.
 *
 * Allocates shared (HOST) or device (DEVICE) memory on construction and
 * frees it on destruction. Converts implicitly to a raw pointer so it
 * can be captured by value in kernels.
 */
template <typename value_t>
class SyclArray
{
public:
    /**
     * @brief Allocate @p count uninitialized elements.
     *
     * @throws cadence::device_error if the allocation fails.
     */
    SyclArray(sycl::queue& q, size_t count, MemoryLocation loc)
        : m_queue(q), m_count(count)
    {
        if (loc == MemoryLocation::HOST)
        {
            m_p_data = sycl::malloc_shared<value_t>(count, m_queue);
        }
        else
        {
            m_p_data = sycl::malloc_device<value_t>(count, m_queue);
        }
        CADENCE_CHECK(m_p_data == nullptr,
            device_error,
            "SyclArray: allocation failed.");
    }

    /**
     * @brief Allocate and fill from host @p values.
     *
     * @throws cadence::device_error if the allocation fails.
     */
    SyclArray(sycl::queue& q,
              const std::vector<value_t>& values,
              MemoryLocation loc)
        : SyclArray(q, values.size(), loc)
    {
        if (!values.empty())
        {
            m_queue.memcpy(m_p_data, values.data(),
                values.size() * sizeof(value_t)).wait();
        }
    }

    ~SyclArray()
    {
        if (m_p_data)
        {
            sycl::free(m_p_data, m_queue);
        }
    }

    SyclArray(const SyclArray&) = delete;
    SyclArray& operator=(const SyclArray&) = delete;

    operator value_t*() noexcept { return m_p_data; }
    operator const value_t*() const noexcept { return m_p_data; }

    size_t size() const noexcept { return m_count; }

private:
    sycl::queue& m_queue;
    value_t*     m_p_data {nullptr};
    size_t       m_count {0};
};

/**
 * @brief Safe isnan wrapper that is valid for both floating and integer types.
 *
 * For floating types it forwards to sycl::isnan(). For integral types it
 * returns false (integers can't be NaN).
 */
template <typename value_t>
inline bool is_nan(value_t v)
{
    if constexpr (std::is_floating_point_v<value_t>)
    {
        return sycl::isnan(v);
    }
    else
    {
        (void)v;
        return false;
    }
}

/**
 * @brief Safe isfinite wrapper for floating/integral types.
 */
template <typename value_t>
inline bool is_finite(value_t v)
{
    if constexpr (std::is_floating_point_v<value_t>)
    {
        return sycl::isfinite(v);
    }
    else
    {
        (void)v;
        return true;
    }
}

/**
 * @brief Safe round wrapper.
 *
 * For floating types it forwards to sycl::round(). Integers are returned
 * unchanged.
 */
template <typename value_t>
inline value_t round(value_t v)
{
    if constexpr (std::is_floating_point_v<value_t>)
    {
        return sycl::round(v);
    }
    else
    {
        return v;
    }
}

/**
 * @brief Safe fabs wrapper.
 */
template <typename value_t>
inline value_t fabs(value_t v)
{
    if constexpr (std::is_floating_point_v<value_t>)
    {
        return sycl::fabs(v);
    }
    else if constexpr (std::is_signed_v<value_t>)
    {
        return v < 0 ? -v : v;
    }
    else
    {
        return v;
    }
}

} // namespace cadence::sycl_utils

#endif // CADENCE_SYCLUTILS_HPP

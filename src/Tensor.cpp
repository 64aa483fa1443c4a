/**
 * @file Tensor.cpp
 * @brief Tensor class function definitions.
 */

#include "cadence/Tensor.hpp"
#include "cadence/Utils.hpp"
#include "cadence/Errors.hpp"

#include <functional>
#include <limits>
#include <string>

namespace cadence
{

template<typename value_t>
void Tensor<value_t>::compute_strides()
{
    m_strides.resize(m_dimensions.size());

    if (m_dimensions.empty())
    {
        return;
    }

    constexpr uint64_t U64_MAX = std::numeric_limits<uint64_t>::max();

    m_strides.back() = 1;

    for (int64_t i = this->get_rank() - 1; i > 0; --i)
    {
        uint64_t dim = m_dimensions[i];
        uint64_t next_stride = m_strides[i];

        CADENCE_CHECK(next_stride > U64_MAX / dim,
            bounds_error,
            R"(Tensor(compute_strides): stride multiplication overflow.)");

        m_strides[i - 1] = next_stride * dim;
    }
}

template<typename value_t>
void Tensor<value_t>::allocate(uint64_t count, MemoryLocation loc)
{
    constexpr uint64_t U64_MAX = std::numeric_limits<uint64_t>::max();
    const uint64_t elem_size_u64 = static_cast<uint64_t>(sizeof(value_t));

    CADENCE_CHECK(count > U64_MAX / elem_size_u64,
        bounds_error,
        R"(Tensor(allocate): allocation size (bytes) overflow (uint64_t).)");

    const uint64_t alloc_bytes_u64 = count * elem_size_u64;

    CADENCE_CHECK(alloc_bytes_u64 > static_cast<uint64_t>
        (std::numeric_limits<size_t>::max()),
        bounds_error,
        R"(Tensor(allocate): allocation size
            (bytes) doesn't fit into size_t on this platform.)");

    auto dev = g_sycl_queue.get_device();
    const uint64_t dev_max_alloc = static_cast<uint64_t>(
        dev.get_info<sycl::info::device::max_mem_alloc_size>());

    CADENCE_CHECK(alloc_bytes_u64 > dev_max_alloc,
        device_error,
        R"(Tensor(allocate):
            requested allocation exceeds device max_mem_alloc_size.)");

    const size_t allocation_bytes = static_cast<size_t>(alloc_bytes_u64);

    // Shared USM for HOST so the host can read it directly.
    value_t* raw_ptr = nullptr;
    if (loc == MemoryLocation::HOST)
    {
        raw_ptr = static_cast<value_t*>(
            sycl::malloc_shared(allocation_bytes, g_sycl_queue));
    }
    else
    {
        raw_ptr = static_cast<value_t*>(
            sycl::malloc_device(allocation_bytes, g_sycl_queue));
    }

    CADENCE_CHECK(!raw_ptr,
        device_error,
        R"(Tensor(allocate): error allocating tensor memory on device.)");

    m_p_data = std::shared_ptr<value_t>(raw_ptr,
        [](value_t* p)
        {
            if (p)
            {
                sycl::free(p, g_sycl_queue);
            }
        }
    );
    m_mem_loc = loc;
}

template<typename value_t>
Tensor<value_t>::Tensor(const std::vector<uint64_t> & dimensions,
                        MemoryLocation loc)
    : m_dimensions(dimensions),
      m_strides(dimensions.size()),
      m_mem_loc(loc)
{
    CADENCE_CHECK(m_dimensions.empty(),
        validation_error,
        R"(Tensor(main constructor):
            dims must not be empty (rank-0 not supported).)");

    for (uint64_t d : m_dimensions)
    {
        CADENCE_CHECK(d == 0,
            validation_error,
            R"(Tensor(main constructor):
                zero-sized dimension is not allowed.)");
    }

    const uint64_t total_size = utils::checked_product(m_dimensions);

    compute_strides();
    allocate(total_size, loc);

    g_sycl_queue.memset(m_p_data.get(), 0,
        static_cast<size_t>(total_size) * sizeof(value_t)).wait();
}

template<typename value_t>
Tensor<value_t>::Tensor(const Tensor & other)
    : m_dimensions(other.m_dimensions),
      m_strides(other.m_strides),
      m_mem_loc(other.m_mem_loc)
{
    // Copy of a default-constructed tensor stays empty.
    if (m_dimensions.empty() || !other.m_p_data)
    {
        return;
    }

    const uint64_t total_size = other.get_num_elements();
    allocate(total_size, m_mem_loc);

    g_sycl_queue.memcpy(m_p_data.get(), other.m_p_data.get(),
        static_cast<size_t>(total_size) * sizeof(value_t)).wait();
}

template<typename value_t>
Tensor<value_t>::Tensor(Tensor && other) noexcept
    : m_p_data(std::move(other.m_p_data)),
      m_dimensions(std::move(other.m_dimensions)),
      m_strides(std::move(other.m_strides)),
      m_mem_loc(other.m_mem_loc)
{
    other.m_dimensions.clear();
    other.m_strides.clear();
    other.m_p_data.reset();
}

template<typename value_t>
Tensor<value_t> & Tensor<value_t>::operator=(const Tensor & other)
{
    if (this != &other)
    {
        Tensor tmp(other);
        *this = std::move(tmp);
    }
    return *this;
}

template<typename value_t>
Tensor<value_t>& Tensor<value_t>::operator=(Tensor && other) noexcept
{
    if (this != &other)
    {
        m_p_data = std::move(other.m_p_data);
        m_dimensions = std::move(other.m_dimensions);
        m_strides = std::move(other.m_strides);
        m_mem_loc = other.m_mem_loc;

        other.m_p_data.reset();
        other.m_dimensions.clear();
        other.m_strides.clear();
    }
    return *this;
}

template<typename value_t>
Tensor<value_t> & Tensor<value_t>::operator=(const std::vector<value_t> & values)
{
    CADENCE_CHECK(m_dimensions.empty() || !m_p_data,
        validation_error,
        R"(Tensor(values assignment):
            target tensor has no elements.)");

    const uint64_t total_size = this->get_num_elements();

    CADENCE_CHECK(static_cast<uint64_t>(values.size()) != total_size,
        validation_error,
        R"(Tensor(values assignment):
            size mismatch in 1D vector assignment.)");

    g_sycl_queue.memcpy(m_p_data.get(), values.data(),
        static_cast<size_t>(total_size) * sizeof(value_t)).wait();
    return *this;
}

template<typename value_t>
std::vector<value_t> Tensor<value_t>::to_vector() const
{
    const uint64_t total_size = this->get_num_elements();
    std::vector<value_t> out(static_cast<size_t>(total_size));

    if (total_size != 0 && m_p_data)
    {
        g_sycl_queue.memcpy(out.data(), m_p_data.get(),
            static_cast<size_t>(total_size) * sizeof(value_t)).wait();
    }
    return out;
}

template<typename value_t>
void Tensor<value_t>::to(MemoryLocation target_loc)
{
    if (m_mem_loc == target_loc)
    {
        return;
    }
    if (!m_p_data)
    {
        m_mem_loc = target_loc;
        return;
    }

    std::shared_ptr<value_t> old_data = m_p_data;
    const uint64_t total_size = this->get_num_elements();

    allocate(total_size, target_loc);

    g_sycl_queue.memcpy(m_p_data.get(), old_data.get(),
        static_cast<size_t>(total_size) * sizeof(value_t)).wait();
}

template<typename value_t>
void Tensor<value_t>::reshape(const std::vector<uint64_t>& new_dimensions)
{
    CADENCE_CHECK(new_dimensions.empty(),
        validation_error,
        R"(Tensor(reshape): new dimensions must not be empty.)");

    for (uint64_t d : new_dimensions)
    {
        CADENCE_CHECK(d == 0,
            validation_error,
            R"(Tensor(reshape): zero-sized dimension is not allowed.)");
    }

    CADENCE_CHECK(utils::checked_product(new_dimensions) !=
        this->get_num_elements(),
        validation_error,
        R"(Tensor(reshape): total number of elements must not change.)");

    m_dimensions = new_dimensions;
    compute_strides();
}

template<typename value_t>
void Tensor<value_t>::print(std::ostream& os) const
{
    if (m_dimensions.empty())
    {
        os << "[]\n";
        return;
    }

    // One bulk transfer, then format from host memory.
    const std::vector<value_t> host = this->to_vector();

    std::function<void(uint64_t, uint64_t)> recurse
        = [&](uint64_t dim, uint64_t offset)
    {
        os << "[";
        for (uint64_t i = 0; i < m_dimensions[dim]; ++i)
        {
            const uint64_t current_offset = offset + i * m_strides[dim];
            if (dim == m_dimensions.size() - 1)
            {
                os << host[current_offset];
                if (i != m_dimensions[dim] - 1)
                {
                    os << ", ";
                }
            }
            else
            {
                recurse(dim + 1, current_offset);
                if (i != m_dimensions[dim] - 1)
                {
                    os << ",\n" << std::string(dim + 1, ' ');
                }
            }
        }
        os << "]";
    };

    recurse(0, 0);
    os << "\n";
}

template<typename value_t>
void Tensor<value_t>::print_shape(std::ostream& os) const
{
    os << "[";
    for (size_t i = 0; i < m_dimensions.size(); ++i)
    {
        if (i > 0) os << ", ";
        os << m_dimensions[i];
    }
    os << "]\n";
}

template<typename value_t>
const value_t * Tensor<value_t>::get_data() const noexcept
{
    return m_p_data.get();
}

template<typename value_t>
value_t * Tensor<value_t>::get_data() noexcept
{
    return m_p_data.get();
}

template<typename value_t>
const std::vector<uint64_t> & Tensor<value_t>::get_dimensions() const noexcept
{
    return m_dimensions;
}

template<typename value_t>
const std::vector<uint64_t> & Tensor<value_t>::get_strides() const noexcept
{
    return m_strides;
}

template<typename value_t>
int64_t Tensor<value_t>::get_rank() const noexcept
{
    return static_cast<int64_t>(m_dimensions.size());
}

template<typename value_t>
uint64_t Tensor<value_t>::get_num_elements() const noexcept
{
    if (m_dimensions.empty())
    {
        return 0;
    }

    uint64_t total_size = 1;
    for (uint64_t d : m_dimensions)
    {
        total_size *= d;
    }
    return total_size;
}

template<typename value_t>
MemoryLocation Tensor<value_t>::get_memory_location() const noexcept
{
    return m_mem_loc;
}

template<typename value_t>
uint64_t Tensor<value_t>::get_num_rows() const noexcept
{
    if (m_dimensions.empty())
    {
        return 0;
    }
    return m_dimensions.front();
}

template<typename value_t>
uint64_t Tensor<value_t>::get_row_size() const noexcept
{
    if (m_dimensions.empty())
    {
        return 0;
    }
    return m_strides.front();
}

template class Tensor<float>;
template class Tensor<uint64_t>;

} // namespace cadence

/**
 * @file Tensor.hpp
 * @brief Declaration of the Tensor data structure.
 */

#ifndef CADENCE_TENSOR_HPP
#define CADENCE_TENSOR_HPP

#include <vector>
#include <cstdint>
#include <iostream>
#include <memory>
#include "SYCLQueue.hpp"

namespace cadence
{

/**
 * @brief Supported device types for Tensor storage.
 */
enum class MemoryLocation
{
    HOST,   ///< Host memory (SYCL shared USM)
    DEVICE  ///< Device memory (SYCL device USM)
};

/**
 * @brief Class template for the Tensor data structure.
 * @tparam value_t Element type (float, uint64_t).
 *
 * The class manages a contiguous linear buffer in row-major order. Axis 0
 * is the example axis wherever a tensor is used as part of a dataset.
 */
template <typename value_t>
class Tensor
{

private:

    /// Member pointer to data.
    std::shared_ptr<value_t> m_p_data {};

    /// Member dimensions for each axis.
    std::vector<uint64_t>    m_dimensions {};

    /// Member strides for each axis.
    std::vector<uint64_t>    m_strides {};

    /// Member enumeration to indicate if data is on host or device.
    MemoryLocation           m_mem_loc {MemoryLocation::DEVICE};

    /**
     * @brief Computes strides using dimensions.
     *
     * Resizes `m_strides` and fills each element so that
     * `m_strides[i]` equals the product of all dimensions to the right of `i`.
     *
     * @throws cadence::bounds_error if stride multiplication
     * would overflow `uint64_t`.
     */
    void compute_strides();

    /**
     * @brief Allocate an uninitialized buffer of @p count elements on
     * @p loc and take ownership of it.
     *
     * @throws cadence::bounds_error if the byte count overflows.
     * @throws cadence::device_error if the request exceeds the device
     * `max_mem_alloc_size` or the allocation fails.
     */
    void allocate(uint64_t count, MemoryLocation loc);

public:

    /**
     * @brief Tensor default class constructor.
     *
     * Produces an empty tensor with no shape and no storage.
     */
    Tensor() = default;

    /**
     * @brief Construct a tensor given the shape and
     * allocate the memory for its data.
     *
     * Sets the tensor's dimensions to @p dimensions, computes strides,
     * and allocates zero-initialized memory on the specified location.
     *
     * @param dimensions Shape of the tensor (each entry must be > 0).
     * @param loc Memory location for data (HOST or DEVICE).
     *
     * @throws cadence::validation_error if:
     * - @p dimensions is empty
     * - any entry in @p dimensions is zero
     * @throws cadence::bounds_error if the element or byte count overflows.
     * @throws cadence::device_error if the allocation fails.
     */
    Tensor(const std::vector<uint64_t>& dimensions,
        MemoryLocation loc = MemoryLocation::DEVICE);

    /**
     * @brief Copy constructor.
     *
     * Performs a deep copy of data and metadata.
     */
    Tensor(const Tensor & other);

    /**
     * @brief Move constructor.
     *
     * Transfers ownership of data and metadata. The source is left empty.
     */
    Tensor(Tensor && other) noexcept;

    /**
     * @brief Copy assignment operator.
     *
     * Performs a deep copy of metadata and the underlying buffer.
     *
     * @throws cadence::device_error if allocation fails.
     */
    Tensor& operator=(const Tensor & other);

    /**
     * @brief Move assignment operator.
     */
    Tensor& operator=(Tensor && other) noexcept;

    /**
     * @brief Assign values from a flat host vector.
     *
     * Copies @p values into the tensor in row-major order.
     *
     * @throws cadence::validation_error if the tensor has no shape or
     * the number of values does not match the element count.
     */
    Tensor& operator=(const std::vector<value_t> & values);

    /**
     * @brief Copy the contents back to a host vector in row-major order.
     *
     * An empty tensor yields an empty vector.
     */
    std::vector<value_t> to_vector() const;

    /**
     * @brief Move the storage to @p target_loc.
     *
     * No-op if the tensor is already there or has no storage.
     */
    void to(MemoryLocation target_loc);

    /**
     * @brief Change the shape without touching the data.
     *
     * @throws cadence::validation_error if @p new_dimensions is empty,
     * contains a zero, or does not preserve the element count.
     */
    void reshape(const std::vector<uint64_t>& new_dimensions);

    /**
     * @brief Print the tensor contents as nested brackets.
     *
     * @param os The output stream to print to. Defaults to std::cout.
     */
    void print(std::ostream & os = std::cout) const;

    /**
     * @brief Print the tensor shape, e.g. `[60000, 28, 28, 1]`.
     *
     * @param os The output stream to print to. Defaults to std::cout.
     */
    void print_shape(std::ostream & os = std::cout) const;

    /// Raw pointer to the first element (nullptr if empty).
    const value_t * get_data() const noexcept;

    /// Raw pointer to the first element (nullptr if empty).
    value_t * get_data() noexcept;

    /// Extents of each axis.
    const std::vector<uint64_t> & get_dimensions() const noexcept;

    /// Row-major strides of each axis.
    const std::vector<uint64_t> & get_strides() const noexcept;

    /// Number of axes.
    int64_t get_rank() const noexcept;

    /// Total number of elements (0 if empty).
    uint64_t get_num_elements() const noexcept;

    /// Where the storage lives.
    MemoryLocation get_memory_location() const noexcept;

    /// Extent of axis 0 (0 if empty).
    uint64_t get_num_rows() const noexcept;

    /// Number of elements per index of axis 0 (0 if empty).
    uint64_t get_row_size() const noexcept;
};

/// Explicit instantiation of Tensor for float
extern template class Tensor<float>;
/// Explicit instantiation of Tensor for uint64_t
extern template class Tensor<uint64_t>;

} // namespace cadence

#endif // CADENCE_TENSOR_HPP

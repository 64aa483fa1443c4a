/**
 * @file ML.hpp
 * @brief Dataset preparation utilities.
 *
 * Provides the transformations applied to raw arrays before they are
 * cycled into training batches.
 */

#ifndef CADENCE_ML_HPP
#define CADENCE_ML_HPP

#include <cstdint>

#include "Tensor.hpp"

namespace cadence::ml
{

/**
 * @brief Multiply every element by a constant.
 *
 * Typical use is pixel normalization, e.g. `rescale(images, 1.0f / 255)`.
 *
 * @param tensor Input tensor. Must contain at least one element.
 * @param factor Finite scale factor.
 * @return A new tensor with the same shape and memory location.
 *
 * @throws cadence::validation_error If the tensor is empty or @p factor is
 * not finite.
 * @throws cadence::nan_error If the input contains NaN.
 */
template<typename value_t>
Tensor<value_t> rescale(const Tensor<value_t>& tensor, value_t factor);
/// Explicit instantiation of rescale for float
extern template Tensor<float> rescale<float>(const Tensor<float>&, float);

/**
 * @brief Expand integer class labels into one-hot rows.
 *
 * Labels of shape [N] or [N, 1] become a tensor of shape [N, depth]
 * where row i holds @p on_value at column labels[i] and @p off_value
 * elsewhere.
 *
 * @param labels Label tensor, shape [N] or [N, 1].
 * @param depth Number of classes (must be > 0).
 * @param on_value Value for the hot entry (default 1).
 * @param off_value Value for all other entries (default 0).
 *
 * @throws cadence::validation_error If depth == 0, the tensor is empty or
 * has another shape, or a label is non-integer or outside [0, depth).
 * @throws cadence::nan_error If a label is NaN.
 *
 * @note When the labels hold both a NaN and an invalid label, the first
 * failure recorded on the device decides which of the two is thrown.
 */
template <typename value_t>
Tensor<value_t> one_hot(const Tensor<value_t>& labels,
    uint64_t depth,
    value_t on_value = static_cast<value_t>(1),
    value_t off_value = static_cast<value_t>(0));
/// Explicit instantiation of one_hot for float
extern template Tensor<float> one_hot<float>
    (const Tensor<float>&, uint64_t, float, float);
/// Explicit instantiation of one_hot for uint64_t
extern template Tensor<uint64_t> one_hot<uint64_t>
    (const Tensor<uint64_t>&, uint64_t, uint64_t, uint64_t);

} // namespace cadence::ml

#endif // CADENCE_ML_HPP

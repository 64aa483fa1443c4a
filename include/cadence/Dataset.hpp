/**
 * @file Dataset.hpp
 * @brief Declaration of the labeled Dataset container.
 *
 * A dataset pairs a features tensor with a labels tensor whose axis 0
 * indexes the same examples in the same order.
 */

#ifndef CADENCE_DATASET_HPP
#define CADENCE_DATASET_HPP

#include <cstdint>
#include <vector>

#include "Tensor.hpp"

namespace cadence
{

/**
 * @brief Aligned features/labels pair.
 * @tparam feature_t Element type of the features tensor.
 * @tparam label_t Element type of the labels tensor.
 *
 * Both tensors are deep copies owned by the dataset, so later changes to
 * the caller's tensors do not affect it and vice versa.
 */
template <typename feature_t, typename label_t>
class Dataset
{

private:

    /// Features, shape [N, ...].
    Tensor<feature_t> m_features {};

    /// Labels, shape [N, ...].
    Tensor<label_t>   m_labels {};

public:

    Dataset() = default;

    /**
     * @brief Build a dataset from aligned features and labels.
     *
     * @param features Tensor of shape [N, ...].
     * @param labels Tensor of shape [N, ...].
     *
     * @throws cadence::validation_error if either tensor is empty or
     * their axis-0 extents differ.
     */
    Dataset(const Tensor<feature_t>& features, const Tensor<label_t>& labels);

    /**
     * @brief Build a dataset taking ownership of the given tensors.
     *
     * @throws cadence::validation_error under the same conditions as the
     * copying constructor.
     */
    Dataset(Tensor<feature_t>&& features, Tensor<label_t>&& labels);

    /**
     * @brief Select examples by index.
     *
     * Row i of the result (in both tensors) is row @p indices[i] of this
     * dataset. Indices may repeat. Result tensors keep the memory
     * location of the source tensors.
     *
     * @param indices Example indices, each in [0, size()).
     * @return A new dataset with indices.size() examples.
     *
     * @throws cadence::validation_error if the dataset or @p indices is
     * empty.
     * @throws cadence::bounds_error if any index is >= size().
     */
    Dataset gather(const std::vector<uint64_t>& indices) const;

    /// Number of examples (axis-0 extent).
    uint64_t size() const noexcept;

    /// Features tensor, shape [N, ...].
    const Tensor<feature_t>& get_features() const noexcept;

    /// Labels tensor, shape [N, ...].
    const Tensor<label_t>& get_labels() const noexcept;

    /// Shape of a single example's features (axis 0 removed).
    std::vector<uint64_t> feature_shape() const;

    /// Shape of a single example's label (axis 0 removed).
    std::vector<uint64_t> label_shape() const;

    /// Release the features tensor, leaving it empty in the dataset.
    Tensor<feature_t> release_features() noexcept;

    /// Release the labels tensor, leaving it empty in the dataset.
    Tensor<label_t> release_labels() noexcept;
};

/// Explicit instantiation of Dataset for float features and float labels
extern template class Dataset<float, float>;
/// Explicit instantiation of Dataset for float features and integer labels
extern template class Dataset<float, uint64_t>;

} // namespace cadence

#endif // CADENCE_DATASET_HPP

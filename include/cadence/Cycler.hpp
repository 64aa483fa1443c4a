/**
 * @file Cycler.hpp
 * @brief Declaration of the minibatch cycler.
 *
 * The cycler turns a finite dataset into an endless stream of shuffled,
 * fixed-size training batches. Each pass over the data draws a fresh
 * permutation, cuts it into consecutive chunks of the batch size and
 * drops the tail that does not fill a whole batch.
 */

#ifndef CADENCE_CYCLER_HPP
#define CADENCE_CYCLER_HPP

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "Dataset.hpp"
#include "Shuffler.hpp"
#include "Tensor.hpp"

namespace cadence
{

/**
 * @brief Position of the cycler within its pass.
 */
enum class CyclerState
{
    AWAITING_PERMUTATION, ///< Next call draws a new permutation.
    MID_PASS              ///< Next call continues the current permutation.
};

/**
 * @brief Human-readable name of a cycler state.
 */
std::string to_string(CyclerState state);

/**
 * @brief One training batch.
 *
 * Row i of `features` and row i of `labels` both belong to the original
 * example `indices[i]`.
 */
template <typename feature_t, typename label_t>
struct Batch
{
    Tensor<feature_t>     features;       ///< Shape [batch_size, ...].
    Tensor<label_t>       labels;         ///< Shape [batch_size, ...].
    std::vector<uint64_t> indices;        ///< Source example of each row.
    uint64_t              pass {0};       ///< 1-based pass number.
    uint64_t              index_in_pass {0}; ///< 0-based batch position.
};

/**
 * @brief Infinite shuffled minibatch generator over a dataset.
 * @tparam feature_t Element type of the features tensor.
 * @tparam label_t Element type of the labels tensor.
 *
 * The cycler owns a private copy of the dataset; the caller's tensors are
 * never modified.
 */
template <typename feature_t, typename label_t>
class MinibatchCycler
{

private:

    /// Private copy of the examples.
    Dataset<feature_t, label_t> m_dataset;

    /// Examples per batch, 1..N.
    uint64_t              m_batch_size {0};

    /// Permutation source.
    Shuffler              m_shuffler;

    /// Example order of the current pass.
    std::vector<uint64_t> m_order {};

    /// Position of the next batch within m_order.
    uint64_t              m_cursor {0};

    /// Number of permutations drawn so far.
    uint64_t              m_pass {0};

    CyclerState           m_state {CyclerState::AWAITING_PERMUTATION};

    /**
     * @brief Check the batch size against the dataset.
     *
     * @throws cadence::validation_error if the batch size is zero or
     * larger than the number of examples.
     */
    void validate() const;

    /**
     * @brief Draw a new permutation and start a pass.
     */
    void reshuffle();

public:

    /**
     * @brief Construct a cycler from features and labels.
     *
     * @param features Tensor of shape [N, ...].
     * @param labels Tensor of shape [N, ...].
     * @param batch_size Examples per batch, 1..N.
     * @param seed RNG seed (0 => seeded from std::random_device).
     *        Non-zero seed yields a deterministic batch sequence.
     *
     * @throws cadence::validation_error if features and labels disagree
     * on N, or @p batch_size is 0 or greater than N.
     */
    MinibatchCycler(const Tensor<feature_t>& features,
        const Tensor<label_t>& labels,
        uint64_t batch_size,
        uint64_t seed = 0ULL);

    /**
     * @brief Construct a cycler from a prepared dataset.
     *
     * @throws cadence::validation_error if @p batch_size is 0 or greater
     * than the dataset size.
     */
    MinibatchCycler(Dataset<feature_t, label_t> dataset,
        uint64_t batch_size,
        uint64_t seed = 0ULL);

    /**
     * @brief Construct a cycler with an explicitly supplied shuffler.
     *
     * @throws cadence::validation_error if @p batch_size is 0 or greater
     * than the dataset size.
     */
    MinibatchCycler(Dataset<feature_t, label_t> dataset,
        uint64_t batch_size,
        Shuffler shuffler);

    /**
     * @brief Produce the next batch.
     *
     * Draws a new permutation first when the previous pass is exhausted.
     * Never signals the end of the stream.
     */
    Batch<feature_t, label_t> next();

    /// Current state.
    CyclerState get_state() const noexcept;

    /// Examples per batch.
    uint64_t get_batch_size() const noexcept;

    /// Number of examples in the dataset.
    uint64_t get_num_examples() const noexcept;

    /// Whole batches per pass, N / batch_size.
    uint64_t batches_per_pass() const noexcept;

    /// Number of the current pass (0 before the first batch).
    uint64_t get_pass() const noexcept;

    /// Position of the next batch within the current permutation.
    uint64_t get_cursor() const noexcept;

    /// Effective RNG seed.
    uint64_t get_seed() const noexcept;

    /// The cycler's private copy of the dataset.
    const Dataset<feature_t, label_t>& get_dataset() const noexcept;

    /**
     * @brief Write a one-line summary of the cycler.
     *
     * @param os The output stream to print to. Defaults to std::cout.
     */
    void print(std::ostream & os = std::cout) const;
};

/// Explicit instantiation of MinibatchCycler for float features and labels
extern template class MinibatchCycler<float, float>;
/// Explicit instantiation of MinibatchCycler for float features and
/// integer labels
extern template class MinibatchCycler<float, uint64_t>;

} // namespace cadence

#endif // CADENCE_CYCLER_HPP

/**
 * @file Cycler.cpp
 * @brief MinibatchCycler function definitions.
 */

#include "cadence/Cycler.hpp"
#include "cadence/Errors.hpp"

#include <utility>

namespace cadence
{

std::string to_string(CyclerState state)
{
    switch (state)
    {
        case CyclerState::AWAITING_PERMUTATION:
            return "awaiting-permutation";
        case CyclerState::MID_PASS:
            return "mid-pass";
    }
    return "unknown";
}

template<typename feature_t, typename label_t>
MinibatchCycler<feature_t, label_t>::MinibatchCycler(
    const Tensor<feature_t>& features,
    const Tensor<label_t>& labels,
    uint64_t batch_size,
    uint64_t seed)
    : MinibatchCycler(Dataset<feature_t, label_t>(features, labels),
        batch_size, Shuffler(seed))
{
}

template<typename feature_t, typename label_t>
MinibatchCycler<feature_t, label_t>::MinibatchCycler(
    Dataset<feature_t, label_t> dataset,
    uint64_t batch_size,
    uint64_t seed)
    : MinibatchCycler(std::move(dataset), batch_size, Shuffler(seed))
{
}

template<typename feature_t, typename label_t>
MinibatchCycler<feature_t, label_t>::MinibatchCycler(
    Dataset<feature_t, label_t> dataset,
    uint64_t batch_size,
    Shuffler shuffler)
    : m_dataset(std::move(dataset)),
      m_batch_size(batch_size),
      m_shuffler(std::move(shuffler))
{
    validate();
}

template<typename feature_t, typename label_t>
void MinibatchCycler<feature_t, label_t>::validate() const
{
    CADENCE_CHECK(m_dataset.size() == 0,
        validation_error,
        R"(MinibatchCycler: dataset has no examples.)");

    CADENCE_CHECK(m_batch_size == 0,
        validation_error,
        R"(MinibatchCycler: batch_size must be > 0.)");

    CADENCE_CHECK(m_batch_size > m_dataset.size(),
        validation_error,
        R"(MinibatchCycler: batch_size must not exceed
            the number of examples.)");
}

template<typename feature_t, typename label_t>
void MinibatchCycler<feature_t, label_t>::reshuffle()
{
    m_order = m_shuffler.permutation(m_dataset.size());
    m_cursor = 0;
    ++m_pass;
    m_state = CyclerState::MID_PASS;
}

template<typename feature_t, typename label_t>
Batch<feature_t, label_t> MinibatchCycler<feature_t, label_t>::next()
{
    if (m_state == CyclerState::AWAITING_PERMUTATION)
    {
        reshuffle();
    }

    std::vector<uint64_t> indices(m_order.begin() + m_cursor,
        m_order.begin() + m_cursor + m_batch_size);

    Dataset<feature_t, label_t> picked = m_dataset.gather(indices);

    Batch<feature_t, label_t> batch;
    batch.features = picked.release_features();
    batch.labels = picked.release_labels();
    batch.indices = std::move(indices);
    batch.pass = m_pass;
    batch.index_in_pass = m_cursor / m_batch_size;

    m_cursor += m_batch_size;

    // The tail shorter than a batch is dropped.
    if (m_dataset.size() - m_cursor < m_batch_size)
    {
        m_state = CyclerState::AWAITING_PERMUTATION;
    }

    return batch;
}

template<typename feature_t, typename label_t>
CyclerState MinibatchCycler<feature_t, label_t>::get_state() const noexcept
{
    return m_state;
}

template<typename feature_t, typename label_t>
uint64_t MinibatchCycler<feature_t, label_t>::get_batch_size() const noexcept
{
    return m_batch_size;
}

template<typename feature_t, typename label_t>
uint64_t MinibatchCycler<feature_t, label_t>::get_num_examples()
    const noexcept
{
    return m_dataset.size();
}

template<typename feature_t, typename label_t>
uint64_t MinibatchCycler<feature_t, label_t>::batches_per_pass()
    const noexcept
{
    return m_dataset.size() / m_batch_size;
}

template<typename feature_t, typename label_t>
uint64_t MinibatchCycler<feature_t, label_t>::get_pass() const noexcept
{
    return m_pass;
}

template<typename feature_t, typename label_t>
uint64_t MinibatchCycler<feature_t, label_t>::get_cursor() const noexcept
{
    return m_cursor;
}

template<typename feature_t, typename label_t>
uint64_t MinibatchCycler<feature_t, label_t>::get_seed() const noexcept
{
    return m_shuffler.get_seed();
}

template<typename feature_t, typename label_t>
const Dataset<feature_t, label_t>&
MinibatchCycler<feature_t, label_t>::get_dataset() const noexcept
{
    return m_dataset;
}

template<typename feature_t, typename label_t>
void MinibatchCycler<feature_t, label_t>::print(std::ostream& os) const
{
    os << "MinibatchCycler(examples=" << m_dataset.size()
       << ", batch_size=" << m_batch_size
       << ", batches_per_pass=" << batches_per_pass()
       << ", pass=" << m_pass
       << ", cursor=" << m_cursor
       << ", state=" << to_string(m_state) << ")\n";
}

template class MinibatchCycler<float, float>;
template class MinibatchCycler<float, uint64_t>;

} // namespace cadence

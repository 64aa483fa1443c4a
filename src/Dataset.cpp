/**
 * @file Dataset.cpp
 * @brief Dataset class function definitions.
 */

#include "cadence/Dataset.hpp"
#include "cadence/SYCLUtils.hpp"
#include "cadence/Utils.hpp"
#include "cadence/Errors.hpp"

namespace cadence
{

namespace
{

/**
 * @brief Copy rows of @p src selected by @p p_indices into a new tensor.
 *
 * @p p_indices must be readable on the device and hold @p count entries.
 * Out-of-range indices are reported through the device error flag and
 * surface as a bounds_error after the kernel completes.
 */
template<typename value_t>
Tensor<value_t> gather_rows(const Tensor<value_t>& src,
    const uint64_t* p_indices,
    uint64_t count)
{
    std::vector<uint64_t> out_shape = src.get_dimensions();
    out_shape[0] = count;

    Tensor<value_t> result(out_shape, src.get_memory_location());

    const uint64_t num_rows = src.get_num_rows();
    const uint64_t row_size = src.get_row_size();
    // Element count already overflow-checked by the Tensor constructor.
    const uint64_t total_out_elems = result.get_num_elements();

    sycl_utils::SyclArray<int32_t> error_flag_arr(g_sycl_queue,
        1, MemoryLocation::HOST);
    int32_t* p_error_flag = error_flag_arr;
    *p_error_flag = 0;

    const value_t* p_src = src.get_data();
    value_t* p_dst = result.get_data();

    g_sycl_queue.submit([&](sycl::handler& cgh)
    {
        cgh.parallel_for(sycl::range<1>(static_cast<size_t>(total_out_elems)),
            [=](sycl::id<1> id)
        {
            const uint64_t flat = static_cast<uint64_t>(id[0]);
            const uint64_t dst_row = flat / row_size;
            const uint64_t col = flat % row_size;
            const uint64_t src_row = p_indices[dst_row];

            CADENCE_DEVICE_CHECK(src_row >= num_rows, p_error_flag, 1);

            p_dst[flat] = p_src[src_row * row_size + col];
        });
    }).wait();

    const int32_t err = *p_error_flag;

    CADENCE_CHECK(err == 1,
        bounds_error,
        R"(Dataset(gather): example index out of range.)");

    return result;
}

} // namespace

template<typename feature_t, typename label_t>
Dataset<feature_t, label_t>::Dataset(const Tensor<feature_t>& features,
    const Tensor<label_t>& labels)
    : Dataset(Tensor<feature_t>(features), Tensor<label_t>(labels))
{
    // Delegated; copies are validated by the owning constructor.
}

template<typename feature_t, typename label_t>
Dataset<feature_t, label_t>::Dataset(Tensor<feature_t>&& features,
    Tensor<label_t>&& labels)
    : m_features(std::move(features)),
      m_labels(std::move(labels))
{
    CADENCE_CHECK(m_features.get_rank() == 0,
        validation_error,
        R"(Dataset: features tensor has no elements.)");

    CADENCE_CHECK(m_labels.get_rank() == 0,
        validation_error,
        R"(Dataset: labels tensor has no elements.)");

    CADENCE_CHECK(m_features.get_num_rows() != m_labels.get_num_rows(),
        validation_error,
        R"(Dataset: features and labels must have the same number
            of examples along axis 0.)");
}

template<typename feature_t, typename label_t>
Dataset<feature_t, label_t> Dataset<feature_t, label_t>::gather(
    const std::vector<uint64_t>& indices) const
{
    CADENCE_CHECK(this->size() == 0,
        validation_error,
        R"(Dataset(gather): dataset is empty.)");

    CADENCE_CHECK(indices.empty(),
        validation_error,
        R"(Dataset(gather): no indices provided.)");

    const uint64_t count = static_cast<uint64_t>(indices.size());

    sycl_utils::SyclArray<uint64_t> indices_arr(g_sycl_queue,
        indices, MemoryLocation::DEVICE);
    const uint64_t* p_indices = indices_arr;

    Tensor<feature_t> features = gather_rows(m_features, p_indices, count);
    Tensor<label_t> labels = gather_rows(m_labels, p_indices, count);

    return Dataset(std::move(features), std::move(labels));
}

template<typename feature_t, typename label_t>
uint64_t Dataset<feature_t, label_t>::size() const noexcept
{
    return m_features.get_num_rows();
}

template<typename feature_t, typename label_t>
const Tensor<feature_t>& Dataset<feature_t, label_t>::get_features()
    const noexcept
{
    return m_features;
}

template<typename feature_t, typename label_t>
const Tensor<label_t>& Dataset<feature_t, label_t>::get_labels()
    const noexcept
{
    return m_labels;
}

template<typename feature_t, typename label_t>
std::vector<uint64_t> Dataset<feature_t, label_t>::feature_shape() const
{
    return utils::trailing_shape(m_features.get_dimensions());
}

template<typename feature_t, typename label_t>
std::vector<uint64_t> Dataset<feature_t, label_t>::label_shape() const
{
    return utils::trailing_shape(m_labels.get_dimensions());
}

template<typename feature_t, typename label_t>
Tensor<feature_t> Dataset<feature_t, label_t>::release_features() noexcept
{
    return std::move(m_features);
}

template<typename feature_t, typename label_t>
Tensor<label_t> Dataset<feature_t, label_t>::release_labels() noexcept
{
    return std::move(m_labels);
}

template class Dataset<float, float>;
template class Dataset<float, uint64_t>;

} // namespace cadence

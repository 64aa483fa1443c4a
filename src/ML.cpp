/**
 * @file ML.cpp
 * @brief Dataset preparation utility definitions.
 */

#include "cadence/ML.hpp"
#include "cadence/SYCLUtils.hpp"
#include "cadence/Errors.hpp"

#include <cmath>

namespace cadence::ml
{

template<typename value_t>
Tensor<value_t> rescale(const Tensor<value_t>& tensor, value_t factor)
{
    CADENCE_CHECK(tensor.get_rank() == 0,
        validation_error,
        R"(rescale: input tensor has no elements.)");

    CADENCE_CHECK(!std::isfinite(factor),
        validation_error,
        R"(rescale: factor must be finite.)");

    Tensor<value_t> result(tensor.get_dimensions(),
        tensor.get_memory_location());

    const uint64_t total_elems = tensor.get_num_elements();

    sycl_utils::SyclArray<int32_t> error_flag_arr(g_sycl_queue,
        1, MemoryLocation::HOST);
    int32_t* p_error_flag = error_flag_arr;
    *p_error_flag = 0;

    const value_t* p_in = tensor.get_data();
    value_t* p_out = result.get_data();

    g_sycl_queue.submit([&](sycl::handler& cgh)
    {
        cgh.parallel_for(sycl::range<1>(static_cast<size_t>(total_elems)),
            [=](sycl::id<1> id)
        {
            const uint64_t flat = static_cast<uint64_t>(id[0]);
            const value_t v = p_in[flat];

            CADENCE_DEVICE_CHECK(sycl_utils::is_nan(v), p_error_flag, 1);

            p_out[flat] = v * factor;
        });
    }).wait();

    const int32_t err = *p_error_flag;

    CADENCE_CHECK(err == 1,
        nan_error,
        R"(rescale: NaN detected in inputs.)");

    return result;
}
template Tensor<float> rescale<float>(const Tensor<float>&, float);

template <typename value_t>
Tensor<value_t> one_hot(const Tensor<value_t>& labels,
    uint64_t depth,
    value_t on_value,
    value_t off_value)
{
    CADENCE_CHECK(depth == 0,
        validation_error,
        R"(one_hot: depth must be > 0.)");

    const int64_t rank = labels.get_rank();
    CADENCE_CHECK(rank == 0,
        validation_error,
        R"(one_hot: input tensor has no elements.)");

    const std::vector<uint64_t>& in_shape = labels.get_dimensions();
    CADENCE_CHECK(rank > 2 || (rank == 2 && in_shape[1] != 1),
        validation_error,
        R"(one_hot: labels must have shape [N] or [N, 1].)");

    const uint64_t num_labels = in_shape[0];

    Tensor<value_t> result({num_labels, depth},
        labels.get_memory_location());

    sycl_utils::SyclArray<int32_t> error_flag_arr(g_sycl_queue,
        1, MemoryLocation::HOST);
    int32_t* p_error_flag = error_flag_arr;
    *p_error_flag = 0;

    const value_t integer_eps = static_cast<value_t>(1e-3);

    const value_t* p_in = labels.get_data();
    value_t* p_out = result.get_data();

    // One work-item per output row writes the whole row.
    g_sycl_queue.submit([&](sycl::handler& cgh)
    {
        cgh.parallel_for(sycl::range<1>(static_cast<size_t>(num_labels)),
            [=](sycl::id<1> id)
        {
            const uint64_t row = static_cast<uint64_t>(id[0]);
            const value_t lbl_val = p_in[row];

            value_t* p_row = p_out + row * depth;
            for (uint64_t c = 0; c < depth; ++c)
            {
                p_row[c] = off_value;
            }

            CADENCE_DEVICE_CHECK(sycl_utils::is_nan(lbl_val), p_error_flag, 1);

            const value_t rounded = sycl_utils::round(lbl_val);
            const value_t diff = sycl_utils::fabs(lbl_val - rounded);

            CADENCE_DEVICE_CHECK(diff > integer_eps, p_error_flag, 2);
            CADENCE_DEVICE_CHECK(rounded < static_cast<value_t>(0),
                p_error_flag, 2);
            CADENCE_DEVICE_CHECK(!sycl_utils::is_finite(rounded),
                p_error_flag, 2);
            CADENCE_DEVICE_CHECK(rounded >= static_cast<value_t>(depth),
                p_error_flag, 2);

            const uint64_t lbl = static_cast<uint64_t>(rounded);
            p_row[lbl] = on_value;
        });
    }).wait();

    const int32_t err = *p_error_flag;

    CADENCE_CHECK(err == 1,
        nan_error,
        R"(one_hot: NaN detected in labels.)");

    CADENCE_CHECK(err == 2,
        validation_error,
        R"(one_hot: label non-integer or out of range.)");

    return result;
}
template Tensor<float> one_hot<float>
    (const Tensor<float>&, uint64_t, float, float);
template Tensor<uint64_t> one_hot<uint64_t>
    (const Tensor<uint64_t>&, uint64_t, uint64_t, uint64_t);

} // namespace cadence::ml

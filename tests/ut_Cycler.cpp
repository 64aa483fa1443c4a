/**
 * @file ut_Cycler.cpp
 * @brief Google Test suite for the minibatch cycler.
 *
 * Contains unit tests for batch shape, feature/label alignment, pass
 * bookkeeping, reproducibility and construction errors.
 */

#include <gtest/gtest.h>
#include <sycl/sycl.hpp>
#include <algorithm>
#include <cstdint>
#include <random>
#include <set>
#include <sstream>

#include "cadence/Errors.hpp"

#define private public
#define protected public
#include "cadence/Cycler.hpp"
#undef private
#undef protected

using namespace cadence;

namespace Test
{

/**
 * @brief Features [n, 3] with row i = {i, 100 + i, 200 + i}, labels [n] = i.
 */
static void make_indexed_tensors(uint64_t n,
    Tensor<float>& features,
    Tensor<uint64_t>& labels)
{
    features = Tensor<float>({n, 3});
    labels = Tensor<uint64_t>({n});

    std::vector<float> f(3 * n);
    std::vector<uint64_t> l(n);
    for (uint64_t i = 0; i < n; ++i)
    {
        f[3 * i] = static_cast<float>(i);
        f[3 * i + 1] = static_cast<float>(100 + i);
        f[3 * i + 2] = static_cast<float>(200 + i);
        l[i] = i;
    }
    features = f;
    labels = l;
}

/**
 * @brief Check that every row of @p batch belongs to the example named by
 * batch.indices.
 */
static void expect_aligned(const Batch<float, uint64_t>& batch)
{
    const std::vector<float> f = batch.features.to_vector();
    const std::vector<uint64_t> l = batch.labels.to_vector();

    ASSERT_EQ(l.size(), batch.indices.size());
    ASSERT_EQ(f.size(), 3 * batch.indices.size());

    for (size_t i = 0; i < batch.indices.size(); ++i)
    {
        const uint64_t idx = batch.indices[i];
        EXPECT_EQ(l[i], idx);
        EXPECT_FLOAT_EQ(f[3 * i], static_cast<float>(idx));
        EXPECT_FLOAT_EQ(f[3 * i + 1], static_cast<float>(100 + idx));
        EXPECT_FLOAT_EQ(f[3 * i + 2], static_cast<float>(200 + idx));
    }
}

/**
 * @test CYCLER.constructor_initial_state
 */
TEST(CYCLER, constructor_initial_state)
{
    Tensor<float> features;
    Tensor<uint64_t> labels;
    make_indexed_tensors(10, features, labels);

    MinibatchCycler<float, uint64_t> cycler(features, labels, 3, 11);

    EXPECT_EQ(cycler.get_state(), CyclerState::AWAITING_PERMUTATION);
    EXPECT_EQ(cycler.get_batch_size(), 3u);
    EXPECT_EQ(cycler.get_num_examples(), 10u);
    EXPECT_EQ(cycler.batches_per_pass(), 3u);
    EXPECT_EQ(cycler.get_pass(), 0u);
    EXPECT_EQ(cycler.get_cursor(), 0u);
    EXPECT_EQ(cycler.get_seed(), 11u);
}

/**
 * @test CYCLER.batch_size_larger_than_dataset_throws
 */
TEST(CYCLER, batch_size_larger_than_dataset_throws)
{
    Tensor<float> features;
    Tensor<uint64_t> labels;
    make_indexed_tensors(10, features, labels);

    EXPECT_THROW((MinibatchCycler<float, uint64_t>(features, labels, 11)),
        validation_error);
}

/**
 * @test CYCLER.zero_batch_size_throws
 */
TEST(CYCLER, zero_batch_size_throws)
{
    Tensor<float> features;
    Tensor<uint64_t> labels;
    make_indexed_tensors(10, features, labels);

    EXPECT_THROW((MinibatchCycler<float, uint64_t>(features, labels, 0)),
        std::invalid_argument);
}

/**
 * @test CYCLER.length_mismatch_throws
 */
TEST(CYCLER, length_mismatch_throws)
{
    Tensor<float> features({10, 3});
    Tensor<uint64_t> labels({9});

    EXPECT_THROW((MinibatchCycler<float, uint64_t>(features, labels, 3)),
        validation_error);
}

/**
 * @test CYCLER.empty_dataset_throws
 */
TEST(CYCLER, empty_dataset_throws)
{
    EXPECT_THROW((MinibatchCycler<float, float>(Dataset<float, float>(), 1)),
        validation_error);
}

/**
 * @test CYCLER.ten_examples_batch_of_three
 * @brief Three batches of three per pass; the tenth example is dropped
 * and the fourth call starts a new pass.
 */
TEST(CYCLER, ten_examples_batch_of_three)
{
    Tensor<float> features;
    Tensor<uint64_t> labels;
    make_indexed_tensors(10, features, labels);

    MinibatchCycler<float, uint64_t> cycler(features, labels, 3, 5);

    std::set<uint64_t> seen;
    for (uint64_t b = 0; b < 3; ++b)
    {
        Batch<float, uint64_t> batch = cycler.next();

        EXPECT_EQ(batch.pass, 1u);
        EXPECT_EQ(batch.index_in_pass, b);
        EXPECT_EQ(batch.features.get_dimensions(),
            std::vector<uint64_t>({3, 3}));
        EXPECT_EQ(batch.labels.get_dimensions(),
            std::vector<uint64_t>({3}));
        expect_aligned(batch);

        seen.insert(batch.indices.begin(), batch.indices.end());
    }

    EXPECT_EQ(seen.size(), 9u);
    EXPECT_EQ(cycler.get_state(), CyclerState::AWAITING_PERMUTATION);
    EXPECT_EQ(cycler.get_cursor(), 9u);

    // The dropped example is the last entry of the first permutation.
    const uint64_t dropped = cycler.m_order.back();
    EXPECT_EQ(seen.count(dropped), 0u);

    Batch<float, uint64_t> fourth = cycler.next();
    EXPECT_EQ(fourth.pass, 2u);
    EXPECT_EQ(fourth.index_in_pass, 0u);
    EXPECT_EQ(cycler.get_pass(), 2u);
    EXPECT_EQ(cycler.get_state(), CyclerState::MID_PASS);
    EXPECT_EQ(cycler.get_cursor(), 3u);
    expect_aligned(fourth);
}

/**
 * @test CYCLER.batch_equal_to_dataset
 * @brief Every batch is a shuffled copy of the whole dataset.
 */
TEST(CYCLER, batch_equal_to_dataset)
{
    Tensor<float> features;
    Tensor<uint64_t> labels;
    make_indexed_tensors(10, features, labels);

    MinibatchCycler<float, uint64_t> cycler(features, labels, 10, 77);

    for (uint64_t pass = 1; pass <= 4; ++pass)
    {
        Batch<float, uint64_t> batch = cycler.next();

        EXPECT_EQ(batch.pass, pass);
        EXPECT_EQ(batch.index_in_pass, 0u);
        EXPECT_EQ(cycler.get_state(), CyclerState::AWAITING_PERMUTATION);

        std::vector<uint64_t> sorted = batch.indices;
        std::sort(sorted.begin(), sorted.end());
        EXPECT_EQ(sorted,
            std::vector<uint64_t>({0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
        expect_aligned(batch);
    }
}

/**
 * @test CYCLER.no_repeats_within_a_pass
 * @brief Over many random configurations no index appears twice within
 * one pass, and every batch is full.
 */
TEST(CYCLER, no_repeats_within_a_pass)
{
    std::mt19937_64 config_rng(314);

    for (int trial = 0; trial < 20; ++trial)
    {
        const uint64_t n = 1 + config_rng() % 40;
        const uint64_t batch_size = 1 + config_rng() % n;

        Tensor<float> features;
        Tensor<uint64_t> labels;
        make_indexed_tensors(n, features, labels);

        MinibatchCycler<float, uint64_t> cycler(features, labels,
            batch_size, 1000 + trial);

        const uint64_t per_pass = n / batch_size;
        for (uint64_t pass = 1; pass <= 3; ++pass)
        {
            std::set<uint64_t> seen;
            for (uint64_t b = 0; b < per_pass; ++b)
            {
                Batch<float, uint64_t> batch = cycler.next();
                ASSERT_EQ(batch.indices.size(), batch_size);
                ASSERT_EQ(batch.pass, pass);

                for (uint64_t idx : batch.indices)
                {
                    EXPECT_LT(idx, n);
                    EXPECT_TRUE(seen.insert(idx).second);
                }
            }
        }
    }
}

/**
 * @test CYCLER.same_seed_same_batches
 */
TEST(CYCLER, same_seed_same_batches)
{
    Tensor<float> features;
    Tensor<uint64_t> labels;
    make_indexed_tensors(17, features, labels);

    MinibatchCycler<float, uint64_t> a(features, labels, 4, 2718);
    MinibatchCycler<float, uint64_t> b(features, labels, 4, 2718);

    for (int step = 0; step < 12; ++step)
    {
        Batch<float, uint64_t> ba = a.next();
        Batch<float, uint64_t> bb = b.next();

        EXPECT_EQ(ba.indices, bb.indices);
        EXPECT_EQ(ba.features.to_vector(), bb.features.to_vector());
        EXPECT_EQ(ba.labels.to_vector(), bb.labels.to_vector());
    }
}

/**
 * @test CYCLER.injected_shuffler_matches_seed
 * @brief Passing a shuffler is equivalent to passing its seed.
 */
TEST(CYCLER, injected_shuffler_matches_seed)
{
    Tensor<float> features;
    Tensor<uint64_t> labels;
    make_indexed_tensors(8, features, labels);
    Dataset<float, uint64_t> ds(features, labels);

    MinibatchCycler<float, uint64_t> seeded(ds, 2, 99);
    MinibatchCycler<float, uint64_t> injected(ds, 2, Shuffler(99));

    for (int step = 0; step < 6; ++step)
    {
        EXPECT_EQ(seeded.next().indices, injected.next().indices);
    }
}

/**
 * @test CYCLER.caller_tensors_unchanged
 */
TEST(CYCLER, caller_tensors_unchanged)
{
    Tensor<float> features;
    Tensor<uint64_t> labels;
    make_indexed_tensors(6, features, labels);

    const std::vector<float> f_before = features.to_vector();
    const std::vector<uint64_t> l_before = labels.to_vector();

    MinibatchCycler<float, uint64_t> cycler(features, labels, 4, 8);
    for (int step = 0; step < 5; ++step)
    {
        (void)cycler.next();
    }

    EXPECT_EQ(features.to_vector(), f_before);
    EXPECT_EQ(labels.to_vector(), l_before);
    EXPECT_NE(cycler.get_dataset().get_features().get_data(),
        features.get_data());
}

/**
 * @test CYCLER.float_labels_one_hot_rows
 * @brief Multi-column labels are gathered row by row.
 */
TEST(CYCLER, float_labels_one_hot_rows)
{
    Tensor<float> features({4, 1});
    features = std::vector<float>{0.0f, 1.0f, 2.0f, 3.0f};
    Tensor<float> labels({4, 2});
    labels = std::vector<float>{
        1.0f, 0.0f,
        0.0f, 1.0f,
        1.0f, 0.0f,
        0.0f, 1.0f
    };

    MinibatchCycler<float, float> cycler(features, labels, 2, 4);
    Batch<float, float> batch = cycler.next();

    const std::vector<float> f = batch.features.to_vector();
    const std::vector<float> l = batch.labels.to_vector();
    ASSERT_EQ(l.size(), 4u);
    for (size_t i = 0; i < 2; ++i)
    {
        const uint64_t idx = batch.indices[i];
        EXPECT_FLOAT_EQ(f[i], static_cast<float>(idx));
        EXPECT_FLOAT_EQ(l[2 * i], idx % 2 == 0 ? 1.0f : 0.0f);
        EXPECT_FLOAT_EQ(l[2 * i + 1], idx % 2 == 0 ? 0.0f : 1.0f);
    }
}

/**
 * @test CYCLER.print_summary
 */
TEST(CYCLER, print_summary)
{
    Tensor<float> features;
    Tensor<uint64_t> labels;
    make_indexed_tensors(10, features, labels);

    MinibatchCycler<float, uint64_t> cycler(features, labels, 3, 1);
    (void)cycler.next();

    std::ostringstream os;
    cycler.print(os);
    EXPECT_EQ(os.str(), "MinibatchCycler(examples=10, batch_size=3, "
        "batches_per_pass=3, pass=1, cursor=3, state=mid-pass)\n");

    EXPECT_EQ(to_string(CyclerState::AWAITING_PERMUTATION),
        "awaiting-permutation");
}

} // namespace Test

/**
 * @file ut_Utils.cpp
 * @brief Google Test suite for shape utilities and error checking.
 */

#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "cadence/Errors.hpp"
#include "cadence/Utils.hpp"

using namespace cadence;

namespace Test
{

/**
 * @test UTILS.checked_product_counts_elements
 */
TEST(UTILS, checked_product_counts_elements)
{
    const std::vector<uint64_t> images = {60000, 28, 28, 1};
    const std::vector<uint64_t> labels = {5};
    const std::vector<uint64_t> scalar;

    EXPECT_EQ(utils::checked_product(images), 47040000u);
    EXPECT_EQ(utils::checked_product(images, 1), 784u);
    EXPECT_EQ(utils::checked_product(labels, 1), 1u);
    EXPECT_EQ(utils::checked_product(scalar), 1u);
}

/**
 * @test UTILS.checked_product_overflow_throws
 * @brief A row count times a row size past uint64_t is rejected.
 */
TEST(UTILS, checked_product_overflow_throws)
{
    const uint64_t big = std::numeric_limits<uint64_t>::max() / 2 + 1;
    const std::vector<uint64_t> doubled = {big, 2};
    const std::vector<uint64_t> square = {1ULL << 40, 1ULL << 40};

    EXPECT_THROW(utils::checked_product(doubled), bounds_error);
    EXPECT_THROW(utils::checked_product(square), bounds_error);
    EXPECT_EQ(utils::checked_product(doubled, 1), 2u);
}

/**
 * @test UTILS.trailing_shape_drops_example_axis
 */
TEST(UTILS, trailing_shape_drops_example_axis)
{
    const std::vector<uint64_t> images = {8, 28, 28};
    const std::vector<uint64_t> labels = {8};

    EXPECT_EQ(utils::trailing_shape(images),
        std::vector<uint64_t>({28, 28}));
    EXPECT_TRUE(utils::trailing_shape(labels).empty());
    EXPECT_TRUE(utils::trailing_shape(std::vector<uint64_t>()).empty());
}

/**
 * @test ERRORS.check_macro_throws_with_prefix
 */
TEST(ERRORS, check_macro_throws_with_prefix)
{
    try
    {
        CADENCE_CHECK(true, validation_error, "batch_size must be > 0.");
        FAIL() << "CADENCE_CHECK did not throw";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_EQ(std::string(e.what()),
            "Validation Error: batch_size must be > 0.");
    }

    EXPECT_NO_THROW(CADENCE_CHECK(false, bounds_error, "unused"));
}

} // namespace Test

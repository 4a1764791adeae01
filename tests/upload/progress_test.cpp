#include "mpu/upload/progress.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using mpu::upload::ChunkState;
using mpu::upload::ensure_int;
using mpu::upload::ProgressValue;

TEST(ProgressTest, EnsureIntAcceptsNumbersAndDigitStrings) {
    EXPECT_EQ(ensure_int(ProgressValue{std::uint64_t{1234}}), 1234u);
    EXPECT_EQ(ensure_int(ProgressValue{1234.9}), 1234u);
    EXPECT_EQ(ensure_int(ProgressValue{std::string("5242880")}), 5242880u);
    EXPECT_EQ(ensure_int(ProgressValue{std::string("0")}), 0u);
}

TEST(ProgressTest, EnsureIntRejectsGarbage) {
    EXPECT_THROW(ensure_int(ProgressValue{std::string("")}), std::invalid_argument);
    EXPECT_THROW(ensure_int(ProgressValue{std::string("12abc")}), std::invalid_argument);
    EXPECT_THROW(ensure_int(ProgressValue{std::string("-3")}), std::invalid_argument);
    EXPECT_THROW(ensure_int(ProgressValue{std::string("99999999999999999999999")}), std::invalid_argument);
    EXPECT_THROW(ensure_int(ProgressValue{-1.0}), std::invalid_argument);
    EXPECT_THROW(ensure_int(ProgressValue{std::numeric_limits<double>::quiet_NaN()}), std::invalid_argument);
}

TEST(ProgressTest, TotalIsSumOfParts) {
    std::vector<ChunkState> states(3);
    EXPECT_EQ(mpu::upload::total_uploaded(states), 0u);

    states[0].uploaded_bytes = 10;
    states[2].uploaded_bytes = 5;
    EXPECT_EQ(mpu::upload::total_uploaded(states), 15u);
}

#include "mpu/upload/cancellation.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using mpu::upload::CancellationSource;
using mpu::upload::CancelReason;

TEST(CancellationTest, FreshSourceIsNotCancelled) {
    CancellationSource source;
    auto token = source.token();

    EXPECT_FALSE(source.is_cancelled());
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_EQ(token.reason(), CancelReason::None);
}

TEST(CancellationTest, CancelRunsCallbacksOnceAndFirstReasonWins) {
    CancellationSource source;
    auto token = source.token();
    std::vector<CancelReason> seen;
    token.on_cancel([&seen](CancelReason reason) { seen.push_back(reason); });

    EXPECT_TRUE(source.cancel(CancelReason::Pausing));
    EXPECT_FALSE(source.cancel(CancelReason::Aborted));

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], CancelReason::Pausing);
    EXPECT_EQ(token.reason(), CancelReason::Pausing);
}

TEST(CancellationTest, CopiesShareState) {
    CancellationSource source;
    auto first = source.token();
    auto second = first;

    source.cancel(CancelReason::Aborted);
    EXPECT_TRUE(first.is_cancelled());
    EXPECT_TRUE(second.is_cancelled());
    EXPECT_EQ(second.reason(), CancelReason::Aborted);
}

TEST(CancellationTest, LateRegistrationRunsImmediately) {
    CancellationSource source;
    source.cancel(CancelReason::Pausing);

    bool called = false;
    source.token().on_cancel([&called](CancelReason reason) {
        called = true;
        EXPECT_EQ(reason, CancelReason::Pausing);
    });
    EXPECT_TRUE(called);
}

TEST(CancellationTest, RemovedCallbackIsNotRun) {
    CancellationSource source;
    auto token = source.token();
    int calls = 0;
    const auto id = token.on_cancel([&calls](CancelReason) { ++calls; });
    token.on_cancel([&calls](CancelReason) { calls += 10; });

    token.remove_callback(id);
    source.cancel(CancelReason::Pausing);
    EXPECT_EQ(calls, 10);
}

TEST(CancellationTest, ReplacedSourceDoesNotAffectOldTokens) {
    CancellationSource source;
    auto old_token = source.token();
    source.cancel(CancelReason::Pausing);

    source = CancellationSource();
    EXPECT_FALSE(source.token().is_cancelled());
    EXPECT_TRUE(old_token.is_cancelled());
}

TEST(CancellationTest, RequiresReason) {
    CancellationSource source;
    EXPECT_THROW(source.cancel(CancelReason::None), std::invalid_argument);
    EXPECT_FALSE(source.is_cancelled());
}

TEST(CancellationTest, IntentionalReasons) {
    EXPECT_TRUE(mpu::upload::is_intentional(CancelReason::Pausing));
    EXPECT_TRUE(mpu::upload::is_intentional(CancelReason::Aborted));
    EXPECT_FALSE(mpu::upload::is_intentional(CancelReason::None));
    EXPECT_STREQ(mpu::upload::to_string(CancelReason::Pausing), "pausing");
}

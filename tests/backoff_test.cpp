#include <gtest/gtest.h>
#include "../src/core/backoff.hpp"

using namespace trade_gate;

TEST(BackoffPolicyTest, RestScheduleGrowsToCap) {
    auto p = BackoffPolicy::rest();
    EXPECT_NEAR(to_seconds(p.delay_for(1)), 0.2, 1e-6);
    EXPECT_NEAR(to_seconds(p.delay_for(2)), 0.24, 1e-6);
    EXPECT_NEAR(to_seconds(p.delay_for(20)), 6.0, 1e-6);
    EXPECT_NEAR(to_seconds(p.delay_for(500)), 6.0, 1e-6);
}

TEST(BackoffPolicyTest, DelaysAreNonDecreasingAndBounded) {
    for (const auto& p : {BackoffPolicy::rest(), BackoffPolicy::order(), BackoffPolicy::throttle()}) {
        double prev = 0.0;
        for (int n = 1; n <= 2000; ++n) {
            double d = to_seconds(p.delay_for(n));
            EXPECT_GE(d, prev);
            EXPECT_LE(d, p.max_seconds + 1e-6);
            prev = d;
        }
    }
}

TEST(BackoffPolicyTest, ThrottleLadderHasFourSteps) {
    auto p = BackoffPolicy::throttle();
    EXPECT_NEAR(to_seconds(p.delay_for(1)), 2.0, 1e-6);
    EXPECT_NEAR(to_seconds(p.delay_for(4)), 16.0, 1e-6);
    EXPECT_FALSE(p.exhausted(4));
    EXPECT_TRUE(p.exhausted(5));
    EXPECT_FALSE(BackoffPolicy::rest().exhausted(10000));
}

TEST(BackoffPolicyTest, WarnThreshold) {
    auto p = BackoffPolicy::order();
    EXPECT_FALSE(p.should_warn(15));
    EXPECT_TRUE(p.should_warn(16));
    EXPECT_FALSE(p.should_warn(17));   // once per streak
    EXPECT_FALSE(BackoffPolicy::throttle().should_warn(100));
}

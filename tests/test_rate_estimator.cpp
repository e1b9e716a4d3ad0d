#include <gtest/gtest.h>
#include <limits>
#include <vector>
#include "rate_estimator.hpp"

TEST(RateEstimator, UniformSpacing) {
    std::vector<double> ts;
    for (int i = 0; i < 201; i++) {
        ts.push_back(10.0 + i * 0.02);
    }
    EXPECT_NEAR(estimate_sample_rate(ts, 100.0), 50.0, 1e-9);
}

TEST(RateEstimator, AbsorbsJitterOverTheSpan) {
    // 0, 0.011, 0.019, 0.031, 0.040 -> 4 intervals over 40 ms
    std::vector<double> ts = {0.0, 0.011, 0.019, 0.031, 0.040};
    EXPECT_NEAR(estimate_sample_rate(ts, 50.0), 100.0, 1e-9);
}

TEST(RateEstimator, FallsBackToNominal) {
    EXPECT_DOUBLE_EQ(estimate_sample_rate({}, 100.0), 100.0);
    EXPECT_DOUBLE_EQ(estimate_sample_rate({1.0}, 100.0), 100.0);
    EXPECT_DOUBLE_EQ(estimate_sample_rate({1.0, 1.0, 1.0}, 80.0), 80.0);  // zero span
    EXPECT_DOUBLE_EQ(estimate_sample_rate({2.0, 1.0}, 80.0), 80.0);       // negative span
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_DOUBLE_EQ(estimate_sample_rate({0.0, nan}, 80.0), 80.0);
}

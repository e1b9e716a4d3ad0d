#include <gtest/gtest.h>
#include <vector>
#include "candidate_detector.hpp"

namespace {
// 1 g everywhere with a 1,3,5,7,5,3,1 bump centred on each entry of centers
std::vector<double> bumps(size_t n, const std::vector<size_t>& centers) {
    std::vector<double> x(n, 1.0);
    for (size_t c : centers) {
        x[c - 2] = 3.0;
        x[c - 1] = 5.0;
        x[c]     = 7.0;
        x[c + 1] = 5.0;
        x[c + 2] = 3.0;
    }
    return x;
}
} // namespace

TEST(CandidateDetector, AbsFirstDifference) {
    const std::vector<double> d = abs_first_difference({1.0, 3.0, 2.0, 2.0});
    ASSERT_EQ(d.size(), 3u);
    EXPECT_DOUBLE_EQ(d[0], 2.0);
    EXPECT_DOUBLE_EQ(d[1], 1.0);
    EXPECT_DOUBLE_EQ(d[2], 0.0);
    EXPECT_TRUE(abs_first_difference({4.0}).empty());
}

TEST(CandidateDetector, ShortSeriesHasNoCandidates) {
    EXPECT_TRUE(find_candidates({}, 1.0, 0).empty());
    EXPECT_TRUE(find_candidates({1.0, 9.0}, 1.0, 0).empty());
}

TEST(CandidateDetector, FlatSeriesHasNoCandidates) {
    double threshold = -1.0;
    EXPECT_TRUE(find_candidates(std::vector<double>(200, 1.0), 1.0, 50, &threshold).empty());
    EXPECT_DOUBLE_EQ(threshold, 0.0);
}

TEST(CandidateDetector, SingleBumpGivesOneCandidateAtItsLeadingEdge) {
    double threshold = 0.0;
    const std::vector<size_t> c = find_candidates(bumps(200, {100}), 1.0, 50, &threshold);
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(c[0], 98u);
    EXPECT_GT(threshold, 0.0);
    EXPECT_LT(threshold, 2.0);
}

TEST(CandidateDetector, MinimumSeparationMergesCloseBumps) {
    const std::vector<double> x = bumps(200, {60, 90});
    const std::vector<size_t> merged = find_candidates(x, 1.0, 50);
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0], 58u);

    const std::vector<size_t> split = find_candidates(x, 1.0, 20);
    ASSERT_EQ(split.size(), 2u);
    EXPECT_EQ(split[0], 58u);
    EXPECT_EQ(split[1], 88u);
}

TEST(CandidateDetector, HighMultiplierSuppressesEverything) {
    EXPECT_TRUE(find_candidates(bumps(200, {100}), 100.0, 50).empty());
}

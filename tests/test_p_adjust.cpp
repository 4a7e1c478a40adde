/**
 * @file test_p_adjust.cpp
 * @brief Unit tests for multiple-testing correction
 *
 * Reference values follow the canonical step-up / step-down definitions
 * (identical to R's p.adjust).
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

#include "core/PValueAdjust.hpp"

using namespace AnnoEnrich;

static void expect_all_near(const std::vector<double>& actual, const std::vector<double>& expected) {
    ASSERT_EQ(actual.size(), expected.size());
    for (size_t k = 0; k < actual.size(); ++k) {
        EXPECT_NEAR(actual[k], expected[k], 1e-9) << "index " << k;
    }
}

class PValueAdjustTest : public ::testing::Test {
protected:
    std::vector<double> p = {0.01, 0.04, 0.03, 0.005, 0.5, 0.02};
};

TEST_F(PValueAdjustTest, BenjaminiHochberg) {
    expect_all_near(adjust_pvalues(p, PAdjustMethod::BH), {0.03, 0.048, 0.045, 0.03, 0.5, 0.04});
}

TEST_F(PValueAdjustTest, BenjaminiYekutieli) {
    expect_all_near(adjust_pvalues(p, PAdjustMethod::BY), {0.0735, 0.1176, 0.11025, 0.0735, 1.0, 0.098});
}

TEST_F(PValueAdjustTest, Bonferroni) {
    expect_all_near(adjust_pvalues(p, PAdjustMethod::BONFERRONI), {0.06, 0.24, 0.18, 0.03, 1.0, 0.12});
}

TEST_F(PValueAdjustTest, Holm) {
    expect_all_near(adjust_pvalues(p, PAdjustMethod::HOLM), {0.05, 0.09, 0.09, 0.03, 0.5, 0.08});
}

TEST_F(PValueAdjustTest, Hochberg) {
    expect_all_near(adjust_pvalues(p, PAdjustMethod::HOCHBERG), {0.05, 0.08, 0.08, 0.03, 0.5, 0.08});
}

TEST_F(PValueAdjustTest, Hommel) {
    expect_all_near(adjust_pvalues(p, PAdjustMethod::HOMMEL), {0.05, 0.08, 0.06, 0.03, 0.5, 0.06});
}

TEST(PValueAdjustEdgeTest, HommelWithTwoValuesIsHochberg) {
    std::vector<double> two = {0.02, 0.04};
    expect_all_near(adjust_pvalues(two, PAdjustMethod::HOMMEL), adjust_pvalues(two, PAdjustMethod::HOCHBERG));
    expect_all_near(adjust_pvalues(two, PAdjustMethod::HOMMEL), {0.04, 0.04});
}

TEST(PValueAdjustEdgeTest, ShortInputsUnchanged) {
    EXPECT_TRUE(adjust_pvalues({}, PAdjustMethod::BH).empty());
    expect_all_near(adjust_pvalues({0.3}, PAdjustMethod::BONFERRONI), {0.3});
}

TEST(PValueAdjustEdgeTest, NaNPassesThroughAndDoesNotCount) {
    std::vector<double> p = {0.01, std::nan(""), 0.04};
    std::vector<double> adj = adjust_pvalues(p, PAdjustMethod::BONFERRONI);
    EXPECT_NEAR(adj[0], 0.02, 1e-12);
    EXPECT_TRUE(std::isnan(adj[1]));
    EXPECT_NEAR(adj[2], 0.08, 1e-12);
}

TEST(PValueAdjustEdgeTest, BHMonotoneInRawOrder) {
    std::vector<double> p = {0.001, 0.2, 0.5, 0.8};
    std::vector<double> adj = adjust_pvalues(p, PAdjustMethod::BH);
    expect_all_near(adj, {0.004, 0.4, 2.0 / 3.0, 0.8});
    for (size_t k = 1; k < adj.size(); ++k) {
        EXPECT_LE(adj[k - 1], adj[k]);
    }
}

TEST(PValueAdjustEdgeTest, AllMethodsBoundedAndMonotone) {
    std::vector<double> p = {0.9, 0.001, 0.3, 0.3, 0.05, 1.0, 0.0, 0.7};
    std::vector<size_t> o(p.size());
    std::iota(o.begin(), o.end(), 0);
    std::sort(o.begin(), o.end(), [&p](size_t a, size_t b) { return p[a] < p[b]; });

    for (PAdjustMethod m : {PAdjustMethod::BH, PAdjustMethod::BY, PAdjustMethod::BONFERRONI, PAdjustMethod::HOLM,
                            PAdjustMethod::HOCHBERG, PAdjustMethod::HOMMEL}) {
        std::vector<double> adj = adjust_pvalues(p, m);
        for (size_t k = 0; k < adj.size(); ++k) {
            EXPECT_GE(adj[k], 0.0);
            EXPECT_LE(adj[k], 1.0);
            EXPECT_GE(adj[k], p[k] - 1e-12);
        }
        for (size_t k = 1; k < o.size(); ++k) {
            EXPECT_LE(adj[o[k - 1]], adj[o[k]] + 1e-12) << p_adjust_to_string(m);
        }
    }
}

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <vector>

#include "factoreval/core/errors.h"
#include "factoreval/eval/quantile_grouping.h"
#include "factoreval/math/statistics.h"
#include "utils/panel_gen.h"

using namespace factoreval;
using namespace factoreval::testutil;

class QuantileGroupingTest : public ::testing::Test {
protected:
    static constexpr double kTightTol = 1e-12;
};

// ==================== 单期分组 ====================

/**
 * @test 降序分组
 * @brief 组 0 为因子最大的一组；缺失因子的列为 -1
 */
TEST_F(QuantileGroupingTest, AssignsDescendingBuckets) {
    EXPECT_EQ(assign_buckets({1.0, 2.0, 3.0}, 3), (std::vector<int>{2, 1, 0}));
    EXPECT_EQ(assign_buckets({3.0, 1.0, 2.0}, 3), (std::vector<int>{0, 2, 1}));
    EXPECT_EQ(assign_buckets({kNaN, 5.0, 1.0}, 2), (std::vector<int>{-1, 0, 1}));
}

TEST_F(QuantileGroupingTest, TiesKeepColumnOrder) {
    EXPECT_EQ(assign_buckets({1.0, 1.0, 1.0}, 3), (std::vector<int>{0, 1, 2}));
}

/**
 * @test 余数归入最后一组
 * @brief 7 个标的分 3 组：2 / 2 / 3
 */
TEST_F(QuantileGroupingTest, RemainderGoesToLastBucket) {
    auto b = assign_buckets({7, 6, 5, 4, 3, 2, 1}, 3);
    EXPECT_EQ(b, (std::vector<int>{0, 0, 1, 1, 2, 2, 2}));
}

TEST_F(QuantileGroupingTest, TooFewValidValuesGivesEmpty) {
    EXPECT_TRUE(assign_buckets({1.0, kNaN, 2.0}, 3).empty());
    EXPECT_THROW(assign_buckets({1.0, 2.0}, 1), ConfigurationError);
}

/**
 * @test 随机面板上的分组划分
 * @brief 40 期 × 37 标的、约 20% 缺失、k = 7：
 *        每行有效标的恰好划入 k 组，前 k-1 组各 n/k 个，余数归最后一组，组间因子单调不增
 */
TEST_F(QuantileGroupingTest, RandomPanelPartitionsValidSet) {
    constexpr int k = 7;
    constexpr std::size_t n_rows = 40;
    constexpr std::size_t n_cols = 37;
    std::mt19937 rng(20240102u);
    std::normal_distribution<double> value(0.0, 1.0);
    std::bernoulli_distribution missing(0.2);

    for (std::size_t t = 0; t < n_rows; ++t) {
        std::vector<double> row(n_cols);
        for (auto& v : row) v = missing(rng) ? kNaN : value(rng);
        const std::size_t n_valid = static_cast<std::size_t>(
            std::count_if(row.begin(), row.end(), [](double v) { return !std::isnan(v); }));

        const auto b = assign_buckets(row, k);
        if (n_valid < static_cast<std::size_t>(k)) {
            EXPECT_TRUE(b.empty()) << "row " << t;
            continue;
        }
        ASSERT_EQ(b.size(), n_cols) << "row " << t;

        std::vector<std::size_t> sizes(k, 0);
        std::vector<double> lo(k, std::numeric_limits<double>::infinity());
        std::vector<double> hi(k, -std::numeric_limits<double>::infinity());
        for (std::size_t c = 0; c < n_cols; ++c) {
            if (std::isnan(row[c])) {
                EXPECT_EQ(b[c], -1) << "row " << t << " col " << c;
                continue;
            }
            ASSERT_GE(b[c], 0);
            ASSERT_LT(b[c], k);
            ++sizes[b[c]];
            lo[b[c]] = std::min(lo[b[c]], row[c]);
            hi[b[c]] = std::max(hi[b[c]], row[c]);
        }

        const std::size_t per = n_valid / k;
        std::size_t total = 0;
        for (int g = 0; g < k; ++g) {
            total += sizes[g];
            if (g + 1 < k) {
                EXPECT_EQ(sizes[g], per) << "row " << t << " group " << g;
                EXPECT_GE(lo[g], hi[g + 1]) << "row " << t << " group " << g;
            } else {
                EXPECT_EQ(sizes[g], n_valid - per * (k - 1)) << "row " << t;
            }
        }
        EXPECT_EQ(total, n_valid) << "row " << t;
    }
}

// ==================== 全区间分组收益 ====================

/**
 * @test 4 期 × 3 标的
 * @brief 组收益为当期组内成员收益；并列行按列顺序分组
 */
TEST_F(QuantileGroupingTest, ComputesGroupReturns) {
    Panel f = make_panel({{1, 2, 3}, {3, 1, 2}, {2, 3, 1}, {1, 1, 1}});
    Panel r = make_panel({{0.01, 0.02, 0.03},
                          {0.03, 0.01, 0.02},
                          {0.02, 0.03, 0.01},
                          {0.01, 0.02, 0.03}});

    GroupReturns g = QuantileGroupingEngine(3).compute(AlignedPair{f, r});
    ASSERT_EQ(g.period_returns.rows(), 4);
    ASSERT_EQ(g.period_returns.cols(), 3);
    EXPECT_EQ(g.periods, f.periods());

    for (int t = 0; t < 3; ++t) {
        EXPECT_NEAR(g.period_returns(t, 0), 0.03, kTightTol);
        EXPECT_NEAR(g.period_returns(t, 1), 0.02, kTightTol);
        EXPECT_NEAR(g.period_returns(t, 2), 0.01, kTightTol);
    }
    EXPECT_NEAR(g.period_returns(3, 0), 0.01, kTightTol);
    EXPECT_NEAR(g.period_returns(3, 2), 0.03, kTightTol);

    const double cum0 = 1.03 * 1.03 * 1.03 * 1.01 - 1.0;
    EXPECT_NEAR(g.cumulative[0], cum0, 1e-12);
    EXPECT_NEAR(g.annualized[0], math::annualize(cum0, 4), 1e-9);
    EXPECT_NEAR(g.cumulative[1], std::pow(1.02, 4) - 1.0, 1e-12);
    EXPECT_EQ(g.diagnostics.total(), 0u);
}

/**
 * @test 数据不足
 * @brief 有效标的少于 k 的期整行缺失，计入 insufficient_data，复利时跳过
 */
TEST_F(QuantileGroupingTest, InsufficientRowIsMissing) {
    Panel f = make_panel({{1.0, kNaN}, {2.0, 1.0}});
    Panel r = make_panel({{0.5, 0.5}, {0.1, kNaN}});

    GroupReturns g = QuantileGroupingEngine(2).compute(AlignedPair{f, r});
    EXPECT_TRUE(is_missing(g.period_returns(0, 0)));
    EXPECT_TRUE(is_missing(g.period_returns(0, 1)));
    EXPECT_EQ(g.diagnostics.insufficient_data, 1u);
    EXPECT_NEAR(g.cumulative[0], 0.1, kTightTol);
    // 缺失收益按 0 计
    EXPECT_DOUBLE_EQ(g.period_returns(1, 1), 0.0);
    EXPECT_DOUBLE_EQ(g.cumulative[1], 0.0);
}

TEST_F(QuantileGroupingTest, RejectsBadParameters) {
    EXPECT_THROW(QuantileGroupingEngine(1), ConfigurationError);
    EXPECT_THROW(QuantileGroupingEngine(5, 0), ConfigurationError);
    EXPECT_EQ(QuantileGroupingEngine(5).group_num(), 5);
}

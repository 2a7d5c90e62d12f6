#include <gtest/gtest.h>

#include <cmath>
#include <random>
#include <vector>

#include "factoreval/core/errors.h"
#include "factoreval/eval/portfolio_construction.h"
#include "utils/panel_gen.h"

using namespace factoreval;
using namespace factoreval::testutil;

class PortfolioConstructionTest : public ::testing::Test {
protected:
    static constexpr double kTightTol = 1e-12;

    void SetUp() override {
        cfg.min_breadth = 2;
    }

    config::EvaluationConfig cfg;
};

// ==================== 权重 ====================

/**
 * @test 多空权重
 * @brief 90/10 分位：最大者 +0.5，最小者 -0.5，合计为 0
 */
TEST_F(PortfolioConstructionTest, LongShortWeightsNetToZero) {
    Panel f = make_panel({{1, 2, 3, 4, 5}, {5, kNaN, 3, 2, 1}});
    PortfolioConstructionEngine engine(cfg);
    Diagnostics diag;
    Panel w = engine.long_short_weights(f, &diag);

    EXPECT_TRUE(w.same_labels(f));
    EXPECT_NEAR(w.at(0, 4), 0.5, kTightTol);
    EXPECT_NEAR(w.at(0, 0), -0.5, kTightTol);
    EXPECT_DOUBLE_EQ(w.at(0, 2), 0.0);
    EXPECT_NEAR(w.values().row(0).sum(), 0.0, kTightTol);
    EXPECT_NEAR(w.values().row(1).sum(), 0.0, kTightTol);
    // 缺失因子权重为 0（不是缺失）
    EXPECT_DOUBLE_EQ(w.at(1, 1), 0.0);
    EXPECT_EQ(diag.total(), 0u);
}

/**
 * @test 随机面板上的权重守恒
 * @brief 40 期 × 37 标的、约 20% 缺失：多空每行合计 0、两腿各 ±0.5；仅多头每行合计 1；
 *        缺失因子权重为 0；有效数低于 min_breadth 的行整行为 0
 */
TEST_F(PortfolioConstructionTest, RandomPanelWeightsConserved) {
    constexpr std::size_t n_rows = 40;
    constexpr std::size_t n_cols = 37;
    cfg.min_breadth = 10;
    std::mt19937 rng(7u);
    std::normal_distribution<double> value(0.0, 1.0);
    std::bernoulli_distribution missing(0.2);

    std::vector<std::vector<double>> rows(n_rows, std::vector<double>(n_cols));
    for (auto& row : rows) {
        for (auto& v : row) v = missing(rng) ? kNaN : value(rng);
    }
    Panel f = make_panel(rows);

    PortfolioConstructionEngine engine(cfg);
    Diagnostics diag;
    Panel ls = engine.long_short_weights(f, &diag);
    Panel lo = engine.long_only_weights(f);
    EXPECT_EQ(diag.computation_failures, 0u);

    for (std::size_t t = 0; t < n_rows; ++t) {
        double long_leg = 0.0, short_leg = 0.0;
        for (std::size_t c = 0; c < n_cols; ++c) {
            const double w = ls.at(t, c);
            if (std::isnan(f.at(t, c))) {
                EXPECT_DOUBLE_EQ(w, 0.0) << "row " << t << " col " << c;
                EXPECT_DOUBLE_EQ(lo.at(t, c), 0.0) << "row " << t << " col " << c;
            }
            if (w > 0.0) long_leg += w;
            if (w < 0.0) short_leg += w;
        }
        if (f.valid_count(t) < static_cast<std::size_t>(cfg.min_breadth)) {
            EXPECT_DOUBLE_EQ(ls.values().row(static_cast<Eigen::Index>(t)).cwiseAbs().sum(), 0.0);
            EXPECT_DOUBLE_EQ(lo.values().row(static_cast<Eigen::Index>(t)).cwiseAbs().sum(), 0.0);
            continue;
        }
        EXPECT_NEAR(ls.values().row(static_cast<Eigen::Index>(t)).sum(), 0.0, kTightTol) << "row " << t;
        EXPECT_NEAR(long_leg, 0.5, kTightTol) << "row " << t;
        EXPECT_NEAR(short_leg, -0.5, kTightTol) << "row " << t;
        EXPECT_NEAR(lo.values().row(static_cast<Eigen::Index>(t)).sum(), 1.0, kTightTol) << "row " << t;
    }
}

TEST_F(PortfolioConstructionTest, LongOnlyWeightsSumToOne) {
    cfg.long_percentile = 50.0;
    Panel f = make_panel({{1, 2, 3, 4}});
    Panel w = PortfolioConstructionEngine(cfg).long_only_weights(f);
    // 50 分位 = 2.5 -> 选中 3、4
    EXPECT_DOUBLE_EQ(w.at(0, 2), 0.5);
    EXPECT_DOUBLE_EQ(w.at(0, 3), 0.5);
    EXPECT_NEAR(w.values().row(0).sum(), 1.0, kTightTol);
}

/**
 * @test 宽度不足
 * @brief 有效标的低于 min_breadth 的期全部零权重并计数
 */
TEST_F(PortfolioConstructionTest, NarrowRowGetsZeroWeights) {
    Panel f = make_panel({{kNaN, 3.0, kNaN}});
    PortfolioConstructionEngine engine(cfg);
    Diagnostics diag;
    EXPECT_DOUBLE_EQ(engine.long_short_weights(f, &diag).values().cwiseAbs().sum(), 0.0);
    EXPECT_DOUBLE_EQ(engine.long_only_weights(f, &diag).values().cwiseAbs().sum(), 0.0);
    EXPECT_EQ(diag.insufficient_data, 2u);
}

/**
 * @test 阈值重合
 * @brief 截面全部相同使多空两腿重叠，该期零权重并计入 computation_failures
 */
TEST_F(PortfolioConstructionTest, CoincidingThresholdsCountAsFailure) {
    Panel f = make_panel({{2.0, 2.0, 2.0}});
    Diagnostics diag;
    Panel w = PortfolioConstructionEngine(cfg).long_short_weights(f, &diag);
    EXPECT_DOUBLE_EQ(w.values().cwiseAbs().sum(), 0.0);
    EXPECT_EQ(diag.computation_failures, 1u);
}

TEST_F(PortfolioConstructionTest, InvalidConfigThrows) {
    cfg.short_percentile = 95.0;
    EXPECT_THROW(PortfolioConstructionEngine{cfg}, ConfigurationError);
}

// ==================== 换手率 ====================

/**
 * @test 平均换手
 * @brief 首期与全零权重比较；均值按期数计算
 */
TEST_F(PortfolioConstructionTest, AverageTurnover) {
    Panel w = make_panel({{0.5, -0.5}, {0.5, -0.5}, {-0.5, 0.5}});
    EXPECT_NEAR(average_turnover(w), (1.0 + 0.0 + 2.0) / 3.0, kTightTol);
    EXPECT_DOUBLE_EQ(average_turnover(Panel{}), 0.0);
}

// ==================== 组合收益 ====================

/**
 * @test 多空 / 多头组合收益
 * @brief 同期权重乘同期收益；缺失收益按 0；基准为当期有效收益均值，无有效收益时为 0
 */
TEST_F(PortfolioConstructionTest, EvaluatesReturnsAndBenchmark) {
    Panel f = make_panel({{1, 2, 3, 4, 5}, {1, 2, 3, 4, 5}});
    Panel r = make_panel({{0.01, 0.0, 0.0, 0.0, 0.03}, {kNaN, kNaN, kNaN, kNaN, kNaN}});
    AlignedPair aligned{f, r};
    PortfolioConstructionEngine engine(cfg);

    PortfolioResult ls = engine.evaluate_long_short(aligned);
    ASSERT_EQ(ls.returns.size(), 2u);
    EXPECT_NEAR(ls.returns.values[0], 0.01, kTightTol);
    EXPECT_DOUBLE_EQ(ls.returns.values[1], 0.0);
    EXPECT_NEAR(ls.total_return, 0.01, kTightTol);
    EXPECT_NEAR(ls.turnover, 0.5, kTightTol);
    EXPECT_DOUBLE_EQ(ls.max_drawdown, 0.0);
    EXPECT_FALSE(ls.benchmark.has_value());

    PortfolioResult lo = engine.evaluate_long_only(aligned);
    EXPECT_NEAR(lo.returns.values[0], 0.03, kTightTol);
    ASSERT_TRUE(lo.benchmark.has_value());
    const auto& b = *lo.benchmark;
    EXPECT_NEAR(b.benchmark_returns.values[0], 0.008, kTightTol);
    EXPECT_DOUBLE_EQ(b.benchmark_returns.values[1], 0.0);
    EXPECT_NEAR(b.excess_returns.values[0], 0.022, kTightTol);
    EXPECT_NEAR(b.excess_total_return, 0.022, kTightTol);
    EXPECT_NEAR(b.benchmark_nav.back(), 1.008, kTightTol);
}

TEST_F(PortfolioConstructionTest, DrawdownTracksNav) {
    Panel f = make_panel({{1, 2}, {1, 2}, {1, 2}});
    Panel r = make_panel({{0.0, 0.10}, {0.0, -0.20}, {0.0, 0.05}});
    PortfolioResult lo = PortfolioConstructionEngine(cfg).evaluate_long_only(AlignedPair{f, r});
    // 净值 1.1 -> 0.88 -> 0.924
    EXPECT_NEAR(lo.nav.values[1], 0.88, kTightTol);
    EXPECT_NEAR(lo.max_drawdown, 0.2, kTightTol);
    EXPECT_NEAR(lo.total_return, 0.924 - 1.0, kTightTol);
}

TEST_F(PortfolioConstructionTest, MismatchedLabelsThrow) {
    Panel f = make_panel({{1, 2, 3}});
    Panel r = make_panel({{0.1, 0.2, 0.3}}, {}, 1);
    EXPECT_THROW(PortfolioConstructionEngine(cfg).evaluate_long_short(AlignedPair{f, r}), AlignmentError);
}

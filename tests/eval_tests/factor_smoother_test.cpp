#include <gtest/gtest.h>

#include <cmath>

#include "factoreval/core/errors.h"
#include "factoreval/eval/factor_smoother.h"
#include "utils/panel_gen.h"

using namespace factoreval;
using namespace factoreval::testutil;

class FactorSmootherTest : public ::testing::Test {
protected:
    static constexpr double kTightTol = 1e-12;

    // 单列面板，方便逐行检查
    static Panel column_panel(const std::vector<double>& xs) {
        std::vector<std::vector<double>> rows;
        for (double x : xs) rows.push_back({x});
        return make_panel(rows);
    }
};

// ==================== 滚动统计 ====================

/**
 * @test 滚动均值
 * @brief 起始阶段窗口变短；窗口内缺失跳过
 */
TEST_F(FactorSmootherTest, RollingMeanShrinkingWindow) {
    Panel p = column_panel({1.0, 2.0, 3.0, 4.0, kNaN, 6.0});
    Panel m = FactorSmoother::rolling_mean(p, 2);
    EXPECT_TRUE(m.same_labels(p));
    EXPECT_NEAR(m.at(0, 0), 1.0, kTightTol);
    EXPECT_NEAR(m.at(1, 0), 1.5, kTightTol);
    EXPECT_NEAR(m.at(3, 0), 3.5, kTightTol);
    EXPECT_NEAR(m.at(4, 0), 4.0, kTightTol);
    EXPECT_NEAR(m.at(5, 0), 6.0, kTightTol);
}

TEST_F(FactorSmootherTest, RollingStdNeedsTwoValues) {
    Panel s = FactorSmoother::rolling_std(column_panel({1.0, 2.0, 3.0, 7.0}), 3);
    EXPECT_TRUE(is_missing(s.at(0, 0)));
    EXPECT_NEAR(s.at(1, 0), std::sqrt(0.5), kTightTol);
    EXPECT_NEAR(s.at(2, 0), 1.0, kTightTol);
    EXPECT_NEAR(s.at(3, 0), std::sqrt(7.0), kTightTol);
}

/**
 * @test 滚动标准化
 * @brief 标准差为 0 / 缺失输入 / 首期 等非有限结果一律置 0
 */
TEST_F(FactorSmootherTest, ZscoreZeroFillsNonFinite) {
    Panel p = make_panel({{1.0, 5.0}, {2.0, 5.0}, {3.0, kNaN}});
    Panel z = FactorSmoother::zscore(p, 3);
    EXPECT_DOUBLE_EQ(z.at(0, 0), 0.0);
    EXPECT_NEAR(z.at(1, 0), 0.5 / std::sqrt(0.5), kTightTol);
    EXPECT_NEAR(z.at(2, 0), 1.0, kTightTol);
    EXPECT_DOUBLE_EQ(z.at(1, 1), 0.0);
    EXPECT_DOUBLE_EQ(z.at(2, 1), 0.0);
}

TEST_F(FactorSmootherTest, ZeroWindowThrows) {
    Panel p = column_panel({1.0});
    EXPECT_THROW(FactorSmoother::rolling_mean(p, 0), ConfigurationError);
    EXPECT_THROW(FactorSmoother::zscore(p, 0), ConfigurationError);
}

// ==================== 指数平滑 ====================

/**
 * @test 指数平滑
 * @brief 首个有效值为起点；中途缺失沿用上一期；起点之前保持缺失
 */
TEST_F(FactorSmootherTest, EmaCarriesForward) {
    Panel e = FactorSmoother::ema(column_panel({kNaN, 2.0, kNaN, 4.0}), 0.5);
    EXPECT_TRUE(is_missing(e.at(0, 0)));
    EXPECT_DOUBLE_EQ(e.at(1, 0), 2.0);
    EXPECT_DOUBLE_EQ(e.at(2, 0), 2.0);
    EXPECT_DOUBLE_EQ(e.at(3, 0), 3.0);

    EXPECT_THROW(FactorSmoother::ema(column_panel({1.0}), 0.0), ConfigurationError);
    EXPECT_THROW(FactorSmoother::ema(column_panel({1.0}), 1.5), ConfigurationError);
}

// ==================== 组合步骤 ====================

TEST_F(FactorSmootherTest, ApplyChainsStepsWithoutMutatingInput) {
    Panel p = column_panel({1.0, 3.0, 5.0});
    const Panel original = p;

    FactorSmoother smoother;
    EXPECT_TRUE(smoother.apply(p, {}).equals(p));

    config::SmoothingConfig cfg;
    cfg.rolling_window = 2;
    FactorSmoother by_cfg(cfg);
    // window 为 0 时沿用 rolling_window = 2
    Panel chained = by_cfg.apply(p, {config::SmoothingStep{"rolling_mean", 0, 0.3},
                                     config::SmoothingStep{"ema", 0, 1.0}});
    EXPECT_NEAR(chained.at(2, 0), 4.0, kTightTol);
    EXPECT_TRUE(p.equals(original));

    EXPECT_THROW(smoother.apply(p, {config::SmoothingStep{"median", 3, 0.3}}), ConfigurationError);
}

/**
 * @test 按配置平滑
 * @brief enable=false 时原样返回；默认配置为 5 期滚动均值
 */
TEST_F(FactorSmootherTest, SmoothHonoursEnableFlag) {
    Panel p = column_panel({1.0, 2.0, 3.0});

    config::SmoothingConfig off;
    off.enable = false;
    EXPECT_TRUE(FactorSmoother(off).smooth(p).equals(p));

    Panel on = FactorSmoother().smooth(p);
    EXPECT_NEAR(on.at(2, 0), 2.0, kTightTol);
}

TEST_F(FactorSmootherTest, InvalidConfigThrows) {
    config::SmoothingConfig bad;
    bad.rolling_window = 0;
    EXPECT_THROW(FactorSmoother{bad}, ConfigurationError);
}

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>

#include "factoreval/math/sliding_statistics.h"
#include "factoreval/math/bad_value_policy.h"

using namespace factoreval::math;

// ==================== RollingWindowStats 测试 ====================

class RollingWindowStatsTest : public ::testing::Test {
protected:
    static constexpr double kTightTol = 1e-12;
    const double NaN = std::numeric_limits<double>::quiet_NaN();
};

/**
 * @test 起始阶段窗口变短
 * @brief 未满窗时按已有样本计算；满窗后最旧一期被弹出
 */
TEST_F(RollingWindowStatsTest, ShrinkingThenFullWindow) {
    RollingWindowStats<double> s(3);
    s.push(1.0);
    EXPECT_NEAR(s.mean(), 1.0, kTightTol);
    EXPECT_TRUE(std::isnan(s.stddev_sample()));

    s.push(2.0);
    s.push(3.0);
    EXPECT_EQ(s.size(), 3u);
    EXPECT_NEAR(s.mean(), 2.0, kTightTol);
    EXPECT_NEAR(s.variance_sample(), 1.0, kTightTol);

    s.push(7.0);  // 窗口 = {2,3,7}
    EXPECT_EQ(s.size(), 3u);
    EXPECT_NEAR(s.mean(), 4.0, kTightTol);
    EXPECT_NEAR(s.variance_sample(), 7.0, kTightTol);
}

/**
 * @test 缺失值占位
 * @brief NaN 占用一个窗口位置但不参与统计；窗口内全缺失时均值为 NaN
 */
TEST_F(RollingWindowStatsTest, MissingValuesOccupySlots) {
    RollingWindowStats<double> s(2);
    s.push(4.0);
    s.push(NaN);
    EXPECT_EQ(s.size(), 2u);
    EXPECT_EQ(s.valid_count(), 1u);
    EXPECT_NEAR(s.mean(), 4.0, kTightTol);

    s.push(NaN);  // 4.0 被挤出
    EXPECT_EQ(s.valid_count(), 0u);
    EXPECT_TRUE(std::isnan(s.mean()));

    s.push(std::numeric_limits<double>::infinity());
    EXPECT_EQ(s.valid_count(), 0u);
}

TEST_F(RollingWindowStatsTest, ConstantSeriesHasZeroVariance) {
    RollingWindowStats<double> s(5);
    for (int i = 0; i < 20; ++i) s.push(0.1 * 3.0);
    EXPECT_DOUBLE_EQ(s.variance_sample(), 0.0);
    EXPECT_DOUBLE_EQ(s.stddev_sample(), 0.0);
}

TEST_F(RollingWindowStatsTest, ClearKeepsWindowSize) {
    RollingWindowStats<double> s(4);
    s.push(1.0);
    s.push(2.0);
    s.clear();
    EXPECT_EQ(s.window_size(), 4u);
    EXPECT_EQ(s.size(), 0u);
    EXPECT_TRUE(std::isnan(s.mean()));

    s.reset(1);
    s.push(5.0);
    s.push(6.0);
    EXPECT_NEAR(s.mean(), 6.0, kTightTol);
}

// ==================== bad value policy ====================

TEST(BadValuePolicyTest, ZeroPolicyReplacesNonFinite) {
    double v = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(ZeroNaNInfPolicy::handle(v, "test"));
    EXPECT_DOUBLE_EQ(v, 0.0);

    double w = -std::numeric_limits<double>::infinity();
    ZeroNaNInfPolicy::handle(w, "test");
    EXPECT_DOUBLE_EQ(w, 0.0);

    double ok = 1.5;
    ZeroNaNInfPolicy::handle(ok, "test");
    EXPECT_DOUBLE_EQ(ok, 1.5);
}

TEST(BadValuePolicyTest, FiniteCheck) {
    EXPECT_TRUE(is_finite_numeric(3));
    EXPECT_TRUE(is_finite_numeric(-2.0));
    EXPECT_FALSE(is_finite_numeric(std::numeric_limits<float>::quiet_NaN()));
}

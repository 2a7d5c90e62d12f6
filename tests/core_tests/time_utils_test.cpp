#include <gtest/gtest.h>

#include <string>

#include "factoreval/utils/time_utils.h"

using namespace factoreval;

// ==================== 日期解析 ====================

TEST(TimeUtilsTest, ParsesSeparatorVariants) {
    const int64_t expected = make_time_ms(2023, 1, 5);
    EXPECT_EQ(parse_date_to_ms("2023-01-05"), expected);
    EXPECT_EQ(parse_date_to_ms("2023.01.05"), expected);
    EXPECT_EQ(parse_date_to_ms("2023/01/05"), expected);
    EXPECT_EQ(parse_date_to_ms("20230105"), expected);
    EXPECT_EQ(parse_date_to_ms("2023-01-05 00:00:00"), expected);
}

TEST(TimeUtilsTest, RejectsInvalidDates) {
    EXPECT_FALSE(parse_date_to_ms("2023-02-30").has_value());
    EXPECT_FALSE(parse_date_to_ms("abc").has_value());
    EXPECT_FALSE(parse_date_to_ms("").has_value());
}

// ==================== 日期格式化 ====================

/**
 * @test 期键格式化
 * @brief 期键取 15:00 UTC，格式化只输出日期；五位年份完整输出不截断
 */
TEST(TimeUtilsTest, FormatsDateOnly) {
    EXPECT_EQ(format_date_ms(make_time_ms(2024, 1, 2)), "2024-01-02");
    EXPECT_EQ(format_date_ms(make_time_ms(1999, 12, 31, 0)), "1999-12-31");
    EXPECT_EQ(format_date_ms(make_time_ms(10000, 3, 4)), "10000-03-04");
}

TEST(TimeUtilsTest, SessionIdShape) {
    const std::string id = session_id_now();
    ASSERT_EQ(id.size(), 15u);
    EXPECT_EQ(id[8], '_');
}

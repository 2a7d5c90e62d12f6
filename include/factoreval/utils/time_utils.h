// include/factoreval/utils/time_utils.h
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace factoreval {

/**
 * @brief 日历日期 (UTC) → 毫秒时间戳，默认取收盘 15:00，作为日频“期”的键
 */
int64_t make_time_ms(int year, int month, int day, int hour = 15);

/**
 * @brief 解析日期字符串为期键
 *
 * 支持 "2023-01-05"、"2023.01.05"、"2023/01/05"、"20230105"，
 * 日期后可跟时间部分（如 "2023-01-05 00:00:00"），时间部分忽略。
 * @return 解析失败或日期非法返回 nullopt
 */
std::optional<int64_t> parse_date_to_ms(const std::string& token);

/// 期键 → "YYYY-MM-DD"
std::string format_date_ms(int64_t ts_ms);

/// 当前本地时间 "YYYY-MM-DD HH:MM:SS"
std::string now_string();

/// 当前本地时间 "YYYYMMDD_HHMMSS"，用作结果文件的会话号
std::string session_id_now();

} // namespace factoreval

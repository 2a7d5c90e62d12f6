#include "factoreval/utils/time_utils.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace factoreval {

namespace {

bool valid_calendar_date(int y, int m, int d) {
    if (y < 1900 || y > 9999 || m < 1 || m > 12 || d < 1) return false;
    static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int limit = kDaysInMonth[m - 1];
    const bool leap = (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
    if (m == 2 && leap) limit = 29;
    return d <= limit;
}

std::tm local_tm(std::time_t t) {
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return tm;
}

} // namespace

int64_t make_time_ms(int year, int month, int day, int hour) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = 0;
    tm.tm_sec = 0;
#if defined(_WIN32)
    return static_cast<int64_t>(_mkgmtime(&tm)) * 1000;
#else
    return static_cast<int64_t>(timegm(&tm)) * 1000;
#endif
}

std::optional<int64_t> parse_date_to_ms(const std::string& token) {
    // 只看日期部分：遇到空格或 'T' 截断
    std::string date = token;
    const auto cut = date.find_first_of(" T");
    if (cut != std::string::npos) date = date.substr(0, cut);
    if (date.empty()) return std::nullopt;

    int y = 0, m = 0, d = 0;
    char tail = 0;
    bool parsed = false;
    for (const char* fmt : {"%d-%d-%d%c", "%d.%d.%d%c", "%d/%d/%d%c"}) {
        if (std::sscanf(date.c_str(), fmt, &y, &m, &d, &tail) == 3) {
            parsed = true;
            break;
        }
    }
    if (!parsed && date.size() == 8) {
        bool all_digits = true;
        for (char ch : date) {
            if (!std::isdigit(static_cast<unsigned char>(ch))) {
                all_digits = false;
                break;
            }
        }
        if (all_digits) {
            y = std::stoi(date.substr(0, 4));
            m = std::stoi(date.substr(4, 2));
            d = std::stoi(date.substr(6, 2));
            parsed = true;
        }
    }
    if (!parsed || !valid_calendar_date(y, m, d)) return std::nullopt;
    return make_time_ms(y, m, d);
}

std::string format_date_ms(int64_t ts_ms) {
    const auto seconds = static_cast<std::time_t>(ts_ms / 1000);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &seconds);
#else
    gmtime_r(&seconds, &tm);
#endif
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    return {buf};
}

std::string now_string() {
    const auto tm = local_tm(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return {buf};
}

std::string session_id_now() {
    const auto tm = local_tm(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return {buf};
}

} // namespace factoreval

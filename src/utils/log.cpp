#include "factoreval/utils/log.h"

#include <mutex>

/**
 * @file log.cpp
 * @brief 日志实现：spdlog 默认 logger 的一次性安装与级别切换。
 */

namespace factoreval {
namespace log {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO:  return spdlog::level::info;
        case LogLevel::WARN:  return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::OFF:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

std::once_flag g_init_flag;

} // namespace

void init_logging_once() {
    std::call_once(g_init_flag, [] {
        // 已有同名 logger（例如宿主程序提前注册）时直接复用
        auto logger = spdlog::get("factoreval");
        if (!logger) {
            logger = spdlog::stdout_color_mt("factoreval");
        }
        spdlog::set_default_logger(logger);
        spdlog::set_level(to_spdlog(default_log_level()));
        spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    });
}

void set_level(LogLevel level) {
    init_logging_once();
    spdlog::set_level(to_spdlog(level));
}

} // namespace log
} // namespace factoreval

// include/factoreval/utils/log.h
#pragma once
/**
 * factoreval 日志门面：统一映射到 spdlog。
 * 使用 fmt 风格占位符，例如 LOG_INFO("aligned {} periods", n)。
 */

// ---- Windows 头文件宏控制（需在包含任何可能引入 windows.h 的头之前定义）----
#if defined(_WIN32)
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#endif

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace factoreval {
namespace log {
// 注意：windows.h 会定义 ERROR/WARN 等宏，需先取消定义以避免与枚举成员冲突
#if defined(_WIN32) && defined(ERROR)
#  undef ERROR
#endif
#if defined(_WIN32) && defined(WARN)
#  undef WARN
#endif
  enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5
  };

  // 编译模式对应的默认级别
  inline LogLevel default_log_level() {
#if defined(FACTOREVAL_NO_DEBUG_TRACE)
    // 编译期裁掉 TRACE/DEBUG 时，运行时级别固定为 INFO
    return LogLevel::INFO;
#elif defined(NDEBUG)
    return LogLevel::INFO;
#else
    return LogLevel::DEBUG;
#endif
  }

  // 进程内只初始化一次：彩色控制台 sink + 统一格式
  void init_logging_once();

  // 运行时调整级别（CLI 的 --quiet、测试的静默输出）
  void set_level(LogLevel level);

} // namespace log
} // namespace factoreval

#if defined(FACTOREVAL_NO_DEBUG_TRACE) || defined(NDEBUG)
  // 编译期裁剪：移除 TRACE/DEBUG 宏
  #define LOG_TRACE(...) do {} while(0)
  #define LOG_DEBUG(...) do {} while(0)
#else
  #define LOG_TRACE(...) do { ::factoreval::log::init_logging_once(); spdlog::trace(__VA_ARGS__); } while(0)
  #define LOG_DEBUG(...) do { ::factoreval::log::init_logging_once(); spdlog::debug(__VA_ARGS__); } while(0)
#endif
// INFO/WARN/ERROR在所有模式下都保留
#define LOG_INFO(...)  do { ::factoreval::log::init_logging_once(); spdlog::info(__VA_ARGS__); } while(0)
#define LOG_WARN(...)  do { ::factoreval::log::init_logging_once(); spdlog::warn(__VA_ARGS__); } while(0)
#define LOG_ERROR(...) do { ::factoreval::log::init_logging_once(); spdlog::error(__VA_ARGS__); } while(0)

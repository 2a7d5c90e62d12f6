// include/factoreval/config/evaluation_config.h
#pragma once

#include <map>
#include <string>
#include <vector>

#include "factoreval/config/runtime_config.h"

namespace factoreval::config {

/**
 * @brief 评估参数。所有字段显式传入评估器，不存在进程级默认实例。
 */
struct EvaluationConfig {
    int group_num = 10;                ///< 分组数 k（>= 2）
    double long_percentile = 90.0;     ///< 多头阈值分位 [0,100]
    double short_percentile = 10.0;    ///< 空头阈值分位 [0,100]，不得高于多头
    double benchmark_return = 0.0;     ///< 年化无风险收益，夏普比率的基准
    int min_breadth = 10;              ///< 组合构建的最少有效标的数
    int annualization_periods = 252;   ///< 年化基数（日频 252）
    /// 评估前是否对因子取反（“因子越大、预期收益越低”时打开）。默认不取反。
    bool invert_factor = false;

    /// 非法取值抛 ConfigurationError
    void validate() const;
};

/**
 * @brief 一个平滑步骤：方法名 + 参数
 *
 * rolling_mean / rolling_std / zscore 使用 window（0 表示沿用 SmoothingConfig::rolling_window），
 * ema 使用 alpha。
 */
struct SmoothingStep {
    std::string method;
    int window = 0;
    double alpha = 0.3;
};

struct SmoothingConfig {
    bool enable = true;
    int rolling_window = 5;
    std::vector<SmoothingStep> methods{SmoothingStep{"rolling_mean", 5, 0.3}};

    /// 已知方法名：rolling_mean / rolling_std / zscore / ema
    static bool is_known_method(const std::string& name);

    void validate() const;
};

struct OutputConfig {
    std::string results_dir = "results";
    bool save_intermediate = true;   ///< 是否额外导出平滑前后的因子面板
};

struct FrameworkConfig {
    EvaluationConfig evaluation;
    SmoothingConfig smoothing;
    OutputConfig output;

    void validate() const {
        evaluation.validate();
        smoothing.validate();
    }
};

/**
 * @brief 解析平滑方法列表，例如 "rolling_mean:5, zscore:10, ema:0.3"
 *
 * 参数可省略（"zscore"），省略时窗口取 0（沿用 rolling_window）、alpha 取 0.3。
 * 未知方法名或参数非法抛 ConfigurationError。
 */
std::vector<SmoothingStep> parse_smoothing_methods(const std::string& text);

/// parse_smoothing_methods 的逆操作，用于回写参数
std::string format_smoothing_methods(const std::vector<SmoothingStep>& steps);

/**
 * @brief 由 INI 键值构造配置（未出现的键保留默认值），并做完整校验
 *
 * 识别的键：
 *   evaluation.group_num / long_percentile / short_percentile / benchmark_return /
 *              min_breadth / annualization_periods / invert_factor
 *   smoothing.enable / rolling_window / methods
 *   output.results_dir / save_intermediate
 */
FrameworkConfig load_framework_config(const IniConfig& ini);

/// 展平为 "section.key" -> 文本，供结果目录里保存参数
std::map<std::string, std::string> to_entries(const FrameworkConfig& cfg);

} // namespace factoreval::config

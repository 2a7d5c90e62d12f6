#include "factoreval/config/evaluation_config.h"

#include <cmath>
#include <sstream>

#include "factoreval/config/config_utils.h"
#include "factoreval/core/errors.h"

namespace factoreval::config {

namespace {

bool in_percent_range(double p) {
    return std::isfinite(p) && p >= 0.0 && p <= 100.0;
}

std::string num_to_string(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

} // namespace

void EvaluationConfig::validate() const {
    if (group_num < 2) {
        throw ConfigurationError("group_num 必须 >= 2，当前为 " + std::to_string(group_num));
    }
    if (!in_percent_range(long_percentile)) {
        throw ConfigurationError("long_percentile 必须位于 [0, 100]，当前为 " + num_to_string(long_percentile));
    }
    if (!in_percent_range(short_percentile)) {
        throw ConfigurationError("short_percentile 必须位于 [0, 100]，当前为 " + num_to_string(short_percentile));
    }
    if (short_percentile > long_percentile) {
        throw ConfigurationError("short_percentile 不能高于 long_percentile");
    }
    if (!std::isfinite(benchmark_return)) {
        throw ConfigurationError("benchmark_return 必须是有限数");
    }
    if (min_breadth < 1) {
        throw ConfigurationError("min_breadth 必须 >= 1，当前为 " + std::to_string(min_breadth));
    }
    if (annualization_periods < 1) {
        throw ConfigurationError("annualization_periods 必须 >= 1，当前为 " + std::to_string(annualization_periods));
    }
}

bool SmoothingConfig::is_known_method(const std::string& name) {
    return name == "rolling_mean" || name == "rolling_std" || name == "zscore" || name == "ema";
}

void SmoothingConfig::validate() const {
    if (rolling_window < 1) {
        throw ConfigurationError("rolling_window 必须 >= 1，当前为 " + std::to_string(rolling_window));
    }
    for (const auto& step : methods) {
        if (!is_known_method(step.method)) {
            throw ConfigurationError("未知的平滑方法: " + step.method);
        }
        if (step.method == "ema") {
            if (!(step.alpha > 0.0 && step.alpha <= 1.0)) {
                throw ConfigurationError("ema 的 alpha 必须位于 (0, 1]，当前为 " + num_to_string(step.alpha));
            }
        } else if (step.window < 0) {
            throw ConfigurationError(step.method + " 的窗口必须 >= 1，当前为 " + std::to_string(step.window));
        }
    }
}

std::vector<SmoothingStep> parse_smoothing_methods(const std::string& text) {
    std::vector<SmoothingStep> steps;
    for (const auto& item : split_trimmed(text, ',')) {
        SmoothingStep step;
        std::string param;
        const auto colon = item.find(':');
        if (colon == std::string::npos) {
            step.method = to_lower_copy(item);
        } else {
            step.method = to_lower_copy(trim_copy(item.substr(0, colon)));
            param = trim_copy(item.substr(colon + 1));
        }
        if (!SmoothingConfig::is_known_method(step.method)) {
            throw ConfigurationError("未知的平滑方法: " + step.method);
        }
        if (!param.empty()) {
            std::size_t consumed = 0;
            try {
                if (step.method == "ema") {
                    step.alpha = std::stod(param, &consumed);
                } else {
                    step.window = std::stoi(param, &consumed);
                    if (step.window < 1) {
                        throw ConfigurationError(step.method + " 的窗口必须 >= 1: " + param);
                    }
                }
            } catch (const std::invalid_argument&) {
                throw ConfigurationError("平滑参数不是合法数值: " + item);
            } catch (const std::out_of_range&) {
                throw ConfigurationError("平滑参数超出取值范围: " + item);
            }
            if (consumed != param.size()) {
                throw ConfigurationError("平滑参数不是合法数值: " + item);
            }
        }
        steps.push_back(step);
    }
    return steps;
}

std::string format_smoothing_methods(const std::vector<SmoothingStep>& steps) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < steps.size(); ++i) {
        if (i > 0) oss << ", ";
        const auto& step = steps[i];
        oss << step.method;
        if (step.method == "ema") {
            oss << ':' << step.alpha;
        } else if (step.window > 0) {
            oss << ':' << step.window;
        }
    }
    return oss.str();
}

FrameworkConfig load_framework_config(const IniConfig& ini) {
    FrameworkConfig cfg;

    auto& ev = cfg.evaluation;
    ev.group_num             = ini.geti("evaluation.group_num", ev.group_num);
    ev.long_percentile       = ini.getd("evaluation.long_percentile", ev.long_percentile);
    ev.short_percentile      = ini.getd("evaluation.short_percentile", ev.short_percentile);
    ev.benchmark_return      = ini.getd("evaluation.benchmark_return", ev.benchmark_return);
    ev.min_breadth           = ini.geti("evaluation.min_breadth", ev.min_breadth);
    ev.annualization_periods = ini.geti("evaluation.annualization_periods", ev.annualization_periods);
    ev.invert_factor         = ini.getb("evaluation.invert_factor", ev.invert_factor);

    auto& sm = cfg.smoothing;
    sm.enable         = ini.getb("smoothing.enable", sm.enable);
    sm.rolling_window = ini.geti("smoothing.rolling_window", sm.rolling_window);
    if (ini.has("smoothing.methods")) {
        sm.methods = parse_smoothing_methods(ini.get("smoothing.methods", ""));
    }

    auto& out = cfg.output;
    out.results_dir       = ini.get("output.results_dir", out.results_dir);
    out.save_intermediate = ini.getb("output.save_intermediate", out.save_intermediate);

    cfg.validate();
    return cfg;
}

std::map<std::string, std::string> to_entries(const FrameworkConfig& cfg) {
    std::map<std::string, std::string> kv;
    const auto& ev = cfg.evaluation;
    kv["evaluation.group_num"] = std::to_string(ev.group_num);
    kv["evaluation.long_percentile"] = num_to_string(ev.long_percentile);
    kv["evaluation.short_percentile"] = num_to_string(ev.short_percentile);
    kv["evaluation.benchmark_return"] = num_to_string(ev.benchmark_return);
    kv["evaluation.min_breadth"] = std::to_string(ev.min_breadth);
    kv["evaluation.annualization_periods"] = std::to_string(ev.annualization_periods);
    kv["evaluation.invert_factor"] = ev.invert_factor ? "true" : "false";

    const auto& sm = cfg.smoothing;
    kv["smoothing.enable"] = sm.enable ? "true" : "false";
    kv["smoothing.rolling_window"] = std::to_string(sm.rolling_window);
    kv["smoothing.methods"] = format_smoothing_methods(sm.methods);

    kv["output.results_dir"] = cfg.output.results_dir;
    kv["output.save_intermediate"] = cfg.output.save_intermediate ? "true" : "false";
    return kv;
}

} // namespace factoreval::config

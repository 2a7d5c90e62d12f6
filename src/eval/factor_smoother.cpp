#include "factoreval/eval/factor_smoother.h"

#include <string>
#include <utility>

#include "factoreval/core/errors.h"
#include "factoreval/math/bad_value_policy.h"
#include "factoreval/math/sliding_statistics.h"
#include "factoreval/utils/log.h"

namespace factoreval {

namespace {

using Rolling = math::RollingWindowStats<double>;

void require_window(std::size_t window, const char* method) {
    if (window == 0) {
        throw ConfigurationError(std::string(method) + ": 窗口必须 >= 1");
    }
}

// 对每一列跑一遍滑窗，fn(stats, x) 给出该格的输出
template<typename Fn>
Panel rolling_apply(const Panel& panel, std::size_t window, Fn&& fn) {
    const PanelMatrix& in = panel.values();
    PanelMatrix out(in.rows(), in.cols());
    Rolling stats(window);
    for (Eigen::Index c = 0; c < in.cols(); ++c) {
        stats.clear();
        for (Eigen::Index t = 0; t < in.rows(); ++t) {
            const double x = in(t, c);
            stats.push(x);
            out(t, c) = fn(stats, x);
        }
    }
    return panel.with_values(std::move(out));
}

} // namespace

FactorSmoother::FactorSmoother(config::SmoothingConfig cfg)
    : _cfg(std::move(cfg)) {
    _cfg.validate();
}

Panel FactorSmoother::rolling_mean(const Panel& panel, std::size_t window) {
    require_window(window, "rolling_mean");
    return rolling_apply(panel, window, [](const Rolling& s, double) { return s.mean(); });
}

Panel FactorSmoother::rolling_std(const Panel& panel, std::size_t window) {
    require_window(window, "rolling_std");
    return rolling_apply(panel, window, [](const Rolling& s, double) { return s.stddev_sample(); });
}

Panel FactorSmoother::zscore(const Panel& panel, std::size_t window) {
    require_window(window, "zscore");
    return rolling_apply(panel, window, [](const Rolling& s, double x) {
        double z = (x - s.mean()) / s.stddev_sample();
        math::ZeroNaNInfPolicy::handle(z, "zscore");
        return z;
    });
}

Panel FactorSmoother::ema(const Panel& panel, double alpha) {
    if (!(alpha > 0.0 && alpha <= 1.0)) {
        throw ConfigurationError("ema: alpha 必须在 (0, 1] 内，当前为 " + std::to_string(alpha));
    }
    const PanelMatrix& in = panel.values();
    PanelMatrix out(in.rows(), in.cols());
    for (Eigen::Index c = 0; c < in.cols(); ++c) {
        double s = missing_value();
        for (Eigen::Index t = 0; t < in.rows(); ++t) {
            const double x = in(t, c);
            if (!is_missing(x)) {
                s = is_missing(s) ? x : alpha * x + (1.0 - alpha) * s;
            }
            out(t, c) = s;
        }
    }
    return panel.with_values(std::move(out));
}

Panel FactorSmoother::apply(const Panel& panel, const std::vector<config::SmoothingStep>& steps) const {
    Panel current = panel;
    for (const auto& step : steps) {
        const std::size_t window = static_cast<std::size_t>(step.window > 0 ? step.window : _cfg.rolling_window);
        if (step.method == "rolling_mean") {
            current = rolling_mean(current, window);
        } else if (step.method == "rolling_std") {
            current = rolling_std(current, window);
        } else if (step.method == "zscore") {
            current = zscore(current, window);
        } else if (step.method == "ema") {
            current = ema(current, step.alpha);
        } else {
            throw ConfigurationError("未知的平滑方法: " + step.method);
        }
        LOG_DEBUG("FactorSmoother: applied {} (window={}, alpha={})", step.method, window, step.alpha);
    }
    return current;
}

Panel FactorSmoother::smooth(const Panel& panel) const {
    if (!_cfg.enable) {
        LOG_DEBUG("FactorSmoother: smoothing disabled, factor passed through");
        return panel;
    }
    Panel out = apply(panel, _cfg.methods);
    LOG_INFO("因子平滑完成 - 方法: {}", config::format_smoothing_methods(_cfg.methods));
    return out;
}

} // namespace factoreval

// include/factoreval/eval/factor_smoother.h
#pragma once

#include <cstddef>
#include <vector>

#include "factoreval/config/evaluation_config.h"
#include "factoreval/core/panel.h"

namespace factoreval {

/**
 * @brief 因子平滑：逐标的、只看过去的时间序列变换。
 *
 * 所有变换返回新面板，不修改输入；标签（日期 / 标的）保持不变。
 * 滚动窗口为“最近 w 行”，窗口内缺失跳过，至少 1 个有效值即可输出
 * （起始阶段窗口自然变短）。
 */
class FactorSmoother {
public:
    explicit FactorSmoother(config::SmoothingConfig cfg = {});

    /// 滚动均值
    static Panel rolling_mean(const Panel& panel, std::size_t window);
    /// 滚动样本标准差（n-1）；窗口内只有 1 个有效值时为缺失
    static Panel rolling_std(const Panel& panel, std::size_t window);
    /// 滚动标准化 (x - mean) / std；所有非有限结果（含缺失输入、std 为 0）置 0
    static Panel zscore(const Panel& panel, std::size_t window);
    /**
     * @brief 指数平滑 s_t = α·x_t + (1-α)·s_{t-1}
     *
     * 以第一个有效值为起点；中途缺失沿用上一期平滑值；起点之前保持缺失。
     * α 须在 (0, 1]，否则抛 ConfigurationError。
     */
    static Panel ema(const Panel& panel, double alpha);

    /**
     * @brief 依次应用平滑步骤
     *
     * 空列表原样返回；window 为 0 的步骤使用配置里的 rolling_window；
     * 未知方法名抛 ConfigurationError。
     */
    Panel apply(const Panel& panel, const std::vector<config::SmoothingStep>& steps) const;

    /// 按配置平滑；enable=false 时原样返回
    Panel smooth(const Panel& panel) const;

    const config::SmoothingConfig& config() const { return _cfg; }

private:
    config::SmoothingConfig _cfg;
};

} // namespace factoreval

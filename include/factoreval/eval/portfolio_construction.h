// include/factoreval/eval/portfolio_construction.h
#pragma once

#include <optional>

#include "factoreval/config/evaluation_config.h"
#include "factoreval/core/panel.h"
#include "factoreval/eval/panel_aligner.h"

namespace factoreval {

/// 仅多头路径才有的基准 / 超额部分
struct BenchmarkComparison {
    TimeSeries benchmark_returns;   ///< 当期有效收益的等权均值（无有效值时为 0）
    TimeSeries benchmark_nav;
    TimeSeries excess_returns;      ///< 组合收益 - 基准收益
    TimeSeries excess_nav;
    double excess_total_return{};
    double annual_excess_return{};
};

/**
 * @brief 一条权重规则的回测结果
 */
struct PortfolioResult {
    Panel weights;                  ///< 与因子同形状的逐期权重
    TimeSeries returns;             ///< Σ w·r，缺失收益按 0
    TimeSeries nav;                 ///< 累乘 (1 + r)
    double total_return{};          ///< nav 末值 - 1
    double annual_return{};
    double turnover{};              ///< Σ|Δw| 的逐期均值，首期与全零行比较
    double sharpe{};                ///< 年化夏普，benchmark_return 作为年化无风险利率
    double max_drawdown{};
    std::optional<BenchmarkComparison> benchmark;
    Diagnostics diagnostics;
};

/**
 * @brief 组合构建引擎
 *
 * 每期按因子截面分位数确定阈值：
 *   - 多空：因子 >= P(long) 做多，总权重 +0.5；因子 <= P(short) 做空，总权重 -0.5；
 *   - 仅多头：因子 >= P(long) 等权做多，总权重 1。
 * 有效因子数低于 min_breadth 的期整行权重为 0 并计入 insufficient_data；
 * 同一标的同时落入两腿（阈值重合）时整行为 0 并计入 computation_failures。
 */
class PortfolioConstructionEngine {
public:
    explicit PortfolioConstructionEngine(const config::EvaluationConfig& cfg);

    Panel long_short_weights(const Panel& factor, Diagnostics* diag = nullptr) const;
    Panel long_only_weights(const Panel& factor, Diagnostics* diag = nullptr) const;

    PortfolioResult evaluate_long_short(const AlignedPair& aligned) const;
    /// 仅多头并附带等权基准与超额收益
    PortfolioResult evaluate_long_only(const AlignedPair& aligned) const;

private:
    /// 由权重与收益得到收益 / 净值 / 换手等指标
    PortfolioResult summarize(Panel weights, const Panel& returns, Diagnostics diag) const;

    config::EvaluationConfig _cfg;
};

/**
 * @brief 换手率：逐期 Σ|w_t - w_{t-1}| 的均值，w_{-1} 视为全零
 * @return 空面板返回 0
 */
double average_turnover(const Panel& weights);

} // namespace factoreval

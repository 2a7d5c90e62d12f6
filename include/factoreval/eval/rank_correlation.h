// include/factoreval/eval/rank_correlation.h
#pragma once

#include <cstddef>

#include "factoreval/core/panel.h"
#include "factoreval/eval/panel_aligner.h"

namespace factoreval {

/**
 * @brief IC 统计结果
 *
 * 序列与对齐后的日期一一对应，首期恒为缺失（没有上一期因子）。
 * 标量统计在样本不足时为缺失（NaN）。
 */
struct IcStatistics {
    TimeSeries rank_ic;        ///< 逐期 Spearman(因子[t-1], 收益[t])
    TimeSeries ic;             ///< 逐期 Pearson(因子[t-1], 收益[t])

    double rank_ic_mean{};     ///< 忽略缺失的均值
    double rank_ic_std{};      ///< 样本标准差（n-1）
    double icir{};             ///< mean / std；有效值 < 2 或 std == 0 时缺失
    double win_rate{};         ///< 有效期中 rank IC > 0 的占比
    double t_stat{};           ///< 均值 t 统计量
    double p_value{};          ///< 双侧 p 值（Student-t, n-1 自由度）
    std::size_t valid_periods{0};

    double ic_mean{};
    double ic_std{};

    Diagnostics diagnostics;
};

/**
 * @brief 秩相关引擎：逐期计算滞后一期的 Rank IC 并汇总。
 *
 * 联合有效标的数低于 min_breadth（默认 2）的期记为缺失并计入 insufficient_data；
 * 秩方差为 0 等退化情况记为缺失并计入 computation_failures，不会中断计算。
 * 各期之间互不依赖。
 */
class RankCorrelationEngine {
public:
    explicit RankCorrelationEngine(std::size_t min_breadth = 2);

    IcStatistics compute(const AlignedPair& aligned) const;

private:
    std::size_t _min_breadth;
};

/**
 * @brief 由 IC 序列汇总均值 / 标准差 / ICIR / 胜率 / t 检验
 *        （只写 rank_ic_* 及其衍生字段）
 */
void summarize_rank_ic(IcStatistics& stats);

} // namespace factoreval

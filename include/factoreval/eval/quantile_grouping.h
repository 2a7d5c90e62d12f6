// include/factoreval/eval/quantile_grouping.h
#pragma once

#include <cstddef>
#include <vector>

#include "factoreval/core/panel.h"
#include "factoreval/eval/panel_aligner.h"

namespace factoreval {

/**
 * @brief 分组收益结果；组 1 为因子最大的一组，组 k 为因子最小的一组
 */
struct GroupReturns {
    std::vector<double> annualized;   ///< 每组年化收益（长度 k）
    std::vector<double> cumulative;   ///< 每组全区间累计收益
    PanelMatrix period_returns;       ///< 期 × 组 的逐期组收益，数据不足的期整行缺失
    std::vector<Period> periods;
    Diagnostics diagnostics;
};

/**
 * @brief 单期分组：返回每列所属的组号（0 起），缺失因子的列为 -1
 *
 * 有效标的少于 k 时返回空向量。按因子降序稳定排序（并列保持列顺序），
 * 前 k-1 组各 n/k 个，最后一组吸收余数。
 */
std::vector<int> assign_buckets(const std::vector<double>& factor_row, int k);

/**
 * @brief 分位分组引擎
 *
 * 逐期独立：组收益为组内成员收益均值（缺失收益按 0 计）；
 * 全区间复利得到累计收益，再按 (1+cum)^(base/n_periods)-1 年化。
 */
class QuantileGroupingEngine {
public:
    explicit QuantileGroupingEngine(int group_num = 10, int annualization_periods = 252);

    GroupReturns compute(const AlignedPair& aligned) const;

    int group_num() const { return _group_num; }

private:
    int _group_num;
    int _annualization_periods;
};

} // namespace factoreval

// include/factoreval/eval/factor_evaluator.h
#pragma once

#include <cstddef>
#include <string>

#include "factoreval/config/evaluation_config.h"
#include "factoreval/core/panel.h"
#include "factoreval/eval/portfolio_construction.h"
#include "factoreval/eval/quantile_grouping.h"
#include "factoreval/eval/rank_correlation.h"

namespace factoreval {

/// 对齐后的数据区间
struct DataPeriod {
    Period start{};
    Period end{};
    std::string start_date;       ///< YYYY-MM-DD
    std::string end_date;
    std::size_t total_periods{0};
    std::size_t total_instruments{0};
};

/**
 * @brief 一次评估的完整结果。评估器构造后即交给调用方，不再修改。
 */
struct EvaluationResult {
    std::string evaluation_time;  ///< YYYY-MM-DD HH:MM:SS
    DataPeriod data_period;
    bool factor_inverted{false};

    IcStatistics ic;
    GroupReturns groups;
    PortfolioResult long_short;
    PortfolioResult long_only;    ///< benchmark 字段必有值

    Diagnostics diagnostics;      ///< 各引擎诊断计数之和
};

/**
 * @brief 评估编排器：对齐 → IC → 分组 → 多空 → 仅多头 → 汇总。
 *
 * 只有 AlignmentError / ConfigurationError 会抛给调用方；
 * 逐期失败已在各引擎内部记为缺失并计入 diagnostics。
 * 不持有可变状态，同一个实例可在多线程里并发调用 evaluate。
 */
class FactorEvaluator {
public:
    explicit FactorEvaluator(config::EvaluationConfig cfg = {});

    EvaluationResult evaluate(const Panel& factor, const Panel& returns) const;

    const config::EvaluationConfig& config() const { return _cfg; }

private:
    config::EvaluationConfig _cfg;
};

/// 以 INFO 级别打印结果摘要
void log_summary(const EvaluationResult& result);

} // namespace factoreval

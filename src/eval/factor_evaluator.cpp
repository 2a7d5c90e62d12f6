#include "factoreval/eval/factor_evaluator.h"

#include <sstream>
#include <utility>

#include "factoreval/eval/panel_aligner.h"
#include "factoreval/utils/log.h"
#include "factoreval/utils/time_utils.h"

namespace factoreval {

FactorEvaluator::FactorEvaluator(config::EvaluationConfig cfg)
    : _cfg(std::move(cfg)) {
    _cfg.validate();
}

EvaluationResult FactorEvaluator::evaluate(const Panel& factor, const Panel& returns) const {
    _cfg.validate();
    LOG_INFO("开始因子评估...");

    AlignedPair aligned = _cfg.invert_factor
        ? align_panels(factor.negated(), returns)
        : align_panels(factor, returns);

    EvaluationResult result;
    result.evaluation_time = now_string();
    result.factor_inverted = _cfg.invert_factor;

    const auto& periods = aligned.factor.periods();
    auto& dp = result.data_period;
    dp.start = periods.front();
    dp.end = periods.back();
    dp.start_date = format_date_ms(dp.start);
    dp.end_date = format_date_ms(dp.end);
    dp.total_periods = aligned.factor.period_count();
    dp.total_instruments = aligned.factor.instrument_count();

    result.ic = RankCorrelationEngine(2).compute(aligned);
    result.groups = QuantileGroupingEngine(_cfg.group_num, _cfg.annualization_periods).compute(aligned);

    PortfolioConstructionEngine portfolio(_cfg);
    result.long_short = portfolio.evaluate_long_short(aligned);
    result.long_only = portfolio.evaluate_long_only(aligned);

    result.diagnostics.merge(result.ic.diagnostics);
    result.diagnostics.merge(result.groups.diagnostics);
    result.diagnostics.merge(result.long_short.diagnostics);
    result.diagnostics.merge(result.long_only.diagnostics);

    LOG_INFO("因子评估完成");
    log_summary(result);
    return result;
}

void log_summary(const EvaluationResult& r) {
    const std::string rule(50, '=');
    LOG_INFO("{}", rule);
    LOG_INFO("因子评估结果摘要");
    LOG_INFO("{}", rule);
    LOG_INFO("数据期间: {} 至 {} ({} 期, {} 只股票)", r.data_period.start_date, r.data_period.end_date,
             r.data_period.total_periods, r.data_period.total_instruments);
    LOG_INFO("ICIR: {:.4f}  |  平均RankIC: {:.4f}  |  胜率: {:.4f}  |  p值: {:.4f}",
             r.ic.icir, r.ic.rank_ic_mean, r.ic.win_rate, r.ic.p_value);
    const double excess = r.long_only.benchmark ? r.long_only.benchmark->annual_excess_return : missing_value();
    LOG_INFO("多空年化收益: {:.4f}  |  超额年化收益: {:.4f}", r.long_short.annual_return, excess);
    LOG_INFO("多空换手率: {:.4f}  |  多头换手率: {:.4f}", r.long_short.turnover, r.long_only.turnover);

    std::ostringstream groups;
    for (std::size_t g = 0; g < r.groups.annualized.size(); ++g) {
        if (g > 0) groups << "  |  ";
        groups << "组" << (g + 1) << ": " << fmt::format("{:.4f}", r.groups.annualized[g]);
    }
    LOG_INFO("分组收益: {}", groups.str());
    if (r.diagnostics.total() > 0) {
        LOG_INFO("逐期诊断 - 数据不足: {}, 数值退化: {}",
                 r.diagnostics.insufficient_data, r.diagnostics.computation_failures);
    }
    LOG_INFO("{}", rule);
}

} // namespace factoreval

#include "factoreval/eval/rank_correlation.h"

#include <algorithm>
#include <cmath>
#include <vector>

#include "factoreval/math/distributions.h"
#include "factoreval/math/statistics.h"
#include "factoreval/utils/log.h"

namespace factoreval {

using StatsD = math::Statistics<double>;

RankCorrelationEngine::RankCorrelationEngine(std::size_t min_breadth)
    : _min_breadth(std::max<std::size_t>(min_breadth, 2)) {}

IcStatistics RankCorrelationEngine::compute(const AlignedPair& aligned) const {
    const Panel& factor = aligned.factor;
    const Panel& returns = aligned.returns;
    const std::size_t n_periods = factor.period_count();
    const std::size_t n_inst = factor.instrument_count();

    IcStatistics stats;
    stats.rank_ic.periods = factor.periods();
    stats.rank_ic.values.assign(n_periods, missing_value());
    stats.ic.periods = factor.periods();
    stats.ic.values.assign(n_periods, missing_value());

    std::vector<double> xs;
    std::vector<double> ys;
    xs.reserve(n_inst);
    ys.reserve(n_inst);

    for (std::size_t t = 1; t < n_periods; ++t) {
        xs.clear();
        ys.clear();
        for (std::size_t c = 0; c < n_inst; ++c) {
            const double f = factor.at(t - 1, c);
            const double r = returns.at(t, c);
            if (is_missing(f) || is_missing(r)) continue;
            xs.push_back(f);
            ys.push_back(r);
        }

        if (xs.size() < _min_breadth) {
            ++stats.diagnostics.insufficient_data;
            continue;
        }

        const double rank_ic = StatsD::spearman(xs, ys);
        if (!std::isfinite(rank_ic)) {
            ++stats.diagnostics.computation_failures;
            LOG_DEBUG("RankCorrelationEngine: degenerate cross-section at row {} ({} names)", t, xs.size());
            continue;
        }
        stats.rank_ic.values[t] = rank_ic;

        // Pearson IC 与 Rank IC 同口径；退化时仅该序列缺失，不重复计数
        const double ic = StatsD::correlation(xs, ys);
        if (std::isfinite(ic)) {
            stats.ic.values[t] = ic;
        }
    }

    summarize_rank_ic(stats);
    stats.ic_mean = StatsD::mean(stats.ic.values);
    stats.ic_std = StatsD::stddev(stats.ic.values);

    LOG_INFO("IC计算完成 - ICIR: {:.4f}, 平均RankIC: {:.4f}, 有效期数: {}",
             stats.icir, stats.rank_ic_mean, stats.valid_periods);
    if (stats.diagnostics.total() > 0) {
        LOG_DEBUG("RankCorrelationEngine: {} periods below breadth, {} degenerate",
                  stats.diagnostics.insufficient_data, stats.diagnostics.computation_failures);
    }
    return stats;
}

void summarize_rank_ic(IcStatistics& stats) {
    const auto& values = stats.rank_ic.values;
    stats.valid_periods = stats.rank_ic.valid_count();
    stats.rank_ic_mean = StatsD::mean(values);
    stats.rank_ic_std = StatsD::stddev(values);

    stats.icir = missing_value();
    if (stats.valid_periods >= 2 && std::isfinite(stats.rank_ic_std) && stats.rank_ic_std != 0.0) {
        stats.icir = stats.rank_ic_mean / stats.rank_ic_std;
    }

    stats.win_rate = missing_value();
    if (stats.valid_periods > 0) {
        const auto wins = std::count_if(values.begin(), values.end(),
                                        [](double v) { return !is_missing(v) && v > 0.0; });
        stats.win_rate = static_cast<double>(wins) / static_cast<double>(stats.valid_periods);
    }

    stats.t_stat = math::Distributions::mean_t_statistic(stats.rank_ic_mean, stats.rank_ic_std,
                                                        stats.valid_periods);
    stats.p_value = std::isfinite(stats.t_stat)
        ? math::Distributions::student_t_two_sided_p(stats.t_stat,
                                                     static_cast<double>(stats.valid_periods - 1))
        : missing_value();
}

} // namespace factoreval

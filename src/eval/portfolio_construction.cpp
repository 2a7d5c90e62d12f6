#include "factoreval/eval/portfolio_construction.h"

#include <cmath>
#include <utility>
#include <vector>

#include "factoreval/core/errors.h"
#include "factoreval/math/statistics.h"
#include "factoreval/utils/log.h"

namespace factoreval {

using StatsD = math::Statistics<double>;

namespace {

TimeSeries make_series(const std::vector<Period>& periods, std::vector<double> values) {
    TimeSeries ts;
    ts.periods = periods;
    ts.values = std::move(values);
    return ts;
}

} // namespace

PortfolioConstructionEngine::PortfolioConstructionEngine(const config::EvaluationConfig& cfg)
    : _cfg(cfg) {
    _cfg.validate();
}

Panel PortfolioConstructionEngine::long_short_weights(const Panel& factor, Diagnostics* diag) const {
    const std::size_t n_periods = factor.period_count();
    const std::size_t n_inst = factor.instrument_count();
    PanelMatrix w = PanelMatrix::Zero(static_cast<Eigen::Index>(n_periods),
                                      static_cast<Eigen::Index>(n_inst));
    const std::size_t min_breadth = static_cast<std::size_t>(_cfg.min_breadth);

    for (std::size_t t = 0; t < n_periods; ++t) {
        const auto row = factor.row(t);
        if (factor.valid_count(t) < min_breadth) {
            if (diag) ++diag->insufficient_data;
            continue;
        }
        const double high = StatsD::percentile(row, _cfg.long_percentile);
        const double low = StatsD::percentile(row, _cfg.short_percentile);

        std::size_t n_long = 0, n_short = 0;
        bool overlap = false;
        for (double f : row) {
            if (is_missing(f)) continue;
            const bool is_long = f >= high;
            const bool is_short = f <= low;
            n_long += is_long;
            n_short += is_short;
            overlap = overlap || (is_long && is_short);
        }
        if (overlap) {
            // 阈值重合，两腿无法区分
            if (diag) ++diag->computation_failures;
            LOG_DEBUG("long_short_weights: thresholds coincide at row {} (high={}, low={})", t, high, low);
            continue;
        }

        for (std::size_t c = 0; c < n_inst; ++c) {
            const double f = row[c];
            if (is_missing(f)) continue;
            if (f >= high) {
                w(static_cast<Eigen::Index>(t), static_cast<Eigen::Index>(c)) = 0.5 / static_cast<double>(n_long);
            } else if (f <= low) {
                w(static_cast<Eigen::Index>(t), static_cast<Eigen::Index>(c)) = -0.5 / static_cast<double>(n_short);
            }
        }
    }
    return factor.with_values(std::move(w));
}

Panel PortfolioConstructionEngine::long_only_weights(const Panel& factor, Diagnostics* diag) const {
    const std::size_t n_periods = factor.period_count();
    const std::size_t n_inst = factor.instrument_count();
    PanelMatrix w = PanelMatrix::Zero(static_cast<Eigen::Index>(n_periods),
                                      static_cast<Eigen::Index>(n_inst));
    const std::size_t min_breadth = static_cast<std::size_t>(_cfg.min_breadth);

    for (std::size_t t = 0; t < n_periods; ++t) {
        const auto row = factor.row(t);
        if (factor.valid_count(t) < min_breadth) {
            if (diag) ++diag->insufficient_data;
            continue;
        }
        const double high = StatsD::percentile(row, _cfg.long_percentile);
        std::size_t n_selected = 0;
        for (double f : row) {
            if (!is_missing(f) && f >= high) ++n_selected;
        }
        for (std::size_t c = 0; c < n_inst; ++c) {
            if (!is_missing(row[c]) && row[c] >= high) {
                w(static_cast<Eigen::Index>(t), static_cast<Eigen::Index>(c)) = 1.0 / static_cast<double>(n_selected);
            }
        }
    }
    return factor.with_values(std::move(w));
}

PortfolioResult PortfolioConstructionEngine::summarize(Panel weights, const Panel& returns, Diagnostics diag) const {
    if (!weights.same_labels(returns)) {
        throw AlignmentError("权重与收益率面板标签不一致");
    }
    const std::size_t n_periods = weights.period_count();
    const double base = static_cast<double>(_cfg.annualization_periods);

    // 收益缺口按 0 参与加权
    const PanelMatrix filled_returns = returns.values().unaryExpr(
        [](double r) { return std::isnan(r) ? 0.0 : r; });
    const Eigen::VectorXd port = weights.values().cwiseProduct(filled_returns).rowwise().sum();

    PortfolioResult out;
    std::vector<double> rets(port.data(), port.data() + port.size());
    out.nav = make_series(weights.periods(), math::compound_nav(rets));
    out.total_return = n_periods > 0 ? out.nav.back() - 1.0 : 0.0;
    out.annual_return = math::annualize(out.total_return, n_periods, base);
    out.turnover = average_turnover(weights);
    out.sharpe = math::sharpe_ratio(rets, _cfg.benchmark_return, base);
    out.max_drawdown = math::max_drawdown(out.nav.values);
    out.returns = make_series(weights.periods(), std::move(rets));
    out.weights = std::move(weights);
    out.diagnostics = diag;
    return out;
}

PortfolioResult PortfolioConstructionEngine::evaluate_long_short(const AlignedPair& aligned) const {
    Diagnostics diag;
    Panel weights = long_short_weights(aligned.factor, &diag);
    PortfolioResult out = summarize(std::move(weights), aligned.returns, diag);

    LOG_INFO("多空组合 - 总收益: {:.4f}, 年化: {:.4f}, 换手率: {:.4f}, 零权重期数: {}",
             out.total_return, out.annual_return, out.turnover, diag.total());
    return out;
}

PortfolioResult PortfolioConstructionEngine::evaluate_long_only(const AlignedPair& aligned) const {
    Diagnostics diag;
    Panel weights = long_only_weights(aligned.factor, &diag);
    PortfolioResult out = summarize(std::move(weights), aligned.returns, diag);

    const Panel& returns = aligned.returns;
    const std::size_t n_periods = returns.period_count();
    std::vector<double> bench(n_periods, 0.0);
    for (std::size_t t = 0; t < n_periods; ++t) {
        const double m = StatsD::mean(returns.row(t));
        bench[t] = is_missing(m) ? 0.0 : m;
    }

    std::vector<double> excess(n_periods);
    for (std::size_t t = 0; t < n_periods; ++t) {
        excess[t] = out.returns.values[t] - bench[t];
    }

    BenchmarkComparison cmp;
    cmp.benchmark_nav = make_series(returns.periods(), math::compound_nav(bench));
    cmp.excess_nav = make_series(returns.periods(), math::compound_nav(excess));
    cmp.excess_total_return = n_periods > 0 ? cmp.excess_nav.back() - 1.0 : 0.0;
    cmp.annual_excess_return = math::annualize(cmp.excess_total_return, n_periods,
                                               static_cast<double>(_cfg.annualization_periods));
    cmp.benchmark_returns = make_series(returns.periods(), std::move(bench));
    cmp.excess_returns = make_series(returns.periods(), std::move(excess));
    out.benchmark = std::move(cmp);

    LOG_INFO("多头组合 - 总收益: {:.4f}, 超额总收益: {:.4f}, 年化超额: {:.4f}, 换手率: {:.4f}",
             out.total_return, out.benchmark->excess_total_return,
             out.benchmark->annual_excess_return, out.turnover);
    return out;
}

double average_turnover(const Panel& weights) {
    const std::size_t n_periods = weights.period_count();
    if (n_periods == 0) return 0.0;
    const PanelMatrix& w = weights.values();
    double total = w.row(0).cwiseAbs().sum();
    for (Eigen::Index t = 1; t < w.rows(); ++t) {
        total += (w.row(t) - w.row(t - 1)).cwiseAbs().sum();
    }
    return total / static_cast<double>(n_periods);
}

} // namespace factoreval

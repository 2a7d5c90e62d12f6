#include "factoreval/eval/quantile_grouping.h"

#include <algorithm>
#include <numeric>
#include <sstream>

#include "factoreval/core/errors.h"
#include "factoreval/math/statistics.h"
#include "factoreval/utils/log.h"

namespace factoreval {

std::vector<int> assign_buckets(const std::vector<double>& factor_row, int k) {
    if (k < 2) {
        throw ConfigurationError("分组数必须 >= 2，当前为 " + std::to_string(k));
    }
    std::vector<std::size_t> valid;
    valid.reserve(factor_row.size());
    for (std::size_t c = 0; c < factor_row.size(); ++c) {
        if (!is_missing(factor_row[c])) valid.push_back(c);
    }
    const std::size_t n = valid.size();
    const std::size_t groups = static_cast<std::size_t>(k);
    if (n < groups) {
        return {};
    }

    // 降序；stable_sort 保证并列时沿用原列顺序
    std::stable_sort(valid.begin(), valid.end(),
                     [&](std::size_t a, std::size_t b) { return factor_row[a] > factor_row[b]; });

    std::vector<int> bucket(factor_row.size(), -1);
    const std::size_t per_group = n / groups;
    for (std::size_t pos = 0; pos < n; ++pos) {
        const std::size_t g = std::min(pos / per_group, groups - 1);
        bucket[valid[pos]] = static_cast<int>(g);
    }
    return bucket;
}

QuantileGroupingEngine::QuantileGroupingEngine(int group_num, int annualization_periods)
    : _group_num(group_num),
      _annualization_periods(annualization_periods) {
    if (_group_num < 2) {
        throw ConfigurationError("group_num 必须 >= 2，当前为 " + std::to_string(_group_num));
    }
    if (_annualization_periods < 1) {
        throw ConfigurationError("annualization_periods 必须 >= 1");
    }
}

GroupReturns QuantileGroupingEngine::compute(const AlignedPair& aligned) const {
    const Panel& factor = aligned.factor;
    const Panel& returns = aligned.returns;
    const std::size_t n_periods = factor.period_count();
    const std::size_t n_inst = factor.instrument_count();
    const std::size_t k = static_cast<std::size_t>(_group_num);

    GroupReturns out;
    out.periods = factor.periods();
    out.period_returns = PanelMatrix::Constant(static_cast<Eigen::Index>(n_periods),
                                               static_cast<Eigen::Index>(k),
                                               missing_value());

    std::vector<double> sums(k);
    std::vector<std::size_t> counts(k);
    for (std::size_t t = 0; t < n_periods; ++t) {
        const auto bucket = assign_buckets(factor.row(t), _group_num);
        if (bucket.empty()) {
            ++out.diagnostics.insufficient_data;
            continue;
        }
        std::fill(sums.begin(), sums.end(), 0.0);
        std::fill(counts.begin(), counts.end(), 0);
        for (std::size_t c = 0; c < n_inst; ++c) {
            if (bucket[c] < 0) continue;
            const double r = returns.at(t, c);
            // 收益缺口按 0 填充，成员仍计入分母
            sums[static_cast<std::size_t>(bucket[c])] += is_missing(r) ? 0.0 : r;
            ++counts[static_cast<std::size_t>(bucket[c])];
        }
        for (std::size_t g = 0; g < k; ++g) {
            out.period_returns(static_cast<Eigen::Index>(t), static_cast<Eigen::Index>(g)) =
                sums[g] / static_cast<double>(counts[g]);
        }
    }

    out.cumulative.resize(k);
    out.annualized.resize(k);
    for (std::size_t g = 0; g < k; ++g) {
        double level = 1.0;
        for (std::size_t t = 0; t < n_periods; ++t) {
            const double r = out.period_returns(static_cast<Eigen::Index>(t), static_cast<Eigen::Index>(g));
            if (!is_missing(r)) level *= (1.0 + r);
        }
        out.cumulative[g] = level - 1.0;
        out.annualized[g] = math::annualize(out.cumulative[g], n_periods,
                                            static_cast<double>(_annualization_periods));
    }

    std::ostringstream oss;
    for (std::size_t g = 0; g < k; ++g) {
        if (g > 0) oss << "  |  ";
        oss << "组" << (g + 1) << ": " << out.annualized[g];
    }
    LOG_INFO("分组收益计算完成 - {}组, 数据不足期数: {}", k, out.diagnostics.insufficient_data);
    LOG_DEBUG("分组年化收益: {}", oss.str());
    return out;
}

} // namespace factoreval

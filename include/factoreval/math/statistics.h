// 说明：均值/方差/相关均为单次遍历（Welford/Pébay）；NaN 视为缺失值。
// 与滑窗统计不同，这里的函数面向“一次性给出整段样本”的截面计算。
// include/factoreval/math/statistics.h
#pragma once
#include <vector>
#include <algorithm>
#include <numeric>
#include <type_traits>
#include <cmath>
#include <iterator>
#include <limits>
#include <utility>

#include "factoreval/utils/log.h"

namespace factoreval {
namespace math {

/**
 * @brief 截面统计模板类 - 支持任意数值类型和容器类型
 *
 * NaN 视为“缺失值”：在统计量计算中会被跳过。
 * 统计量在样本不足或退化时返回 NaN（而不是 0），调用方据此记为缺失。
 */
template<typename T>
class Statistics {
    static_assert(std::is_arithmetic_v<T>, "T must be an arithmetic type");

    template<typename U>
    static bool is_nan_value(const U& v) {
        using Decayed = std::decay_t<U>;
        if constexpr (std::is_floating_point_v<Decayed>) {
            return std::isnan(static_cast<double>(v));
        } else {
            return false;
        }
    }

    static double nan() { return std::numeric_limits<double>::quiet_NaN(); }

public:
    /// 均值；NaN 跳过，全部缺失返回 NaN
    template<typename Container>
    static double mean(const Container& data) {
        long double sum = 0.0L;
        std::size_t valid_count = 0;
        for (const auto& x : data) {
            if (is_nan_value(x)) continue;
            sum += static_cast<long double>(x);
            ++valid_count;
        }
        if (valid_count == 0) {
            return nan();
        }
        return static_cast<double>(sum / static_cast<long double>(valid_count));
    }

    /// 样本标准差（除以 n-1），单次遍历（Welford）；有效样本 < 2 返回 NaN
    template<typename Container>
    static double stddev(const Container& data) {
        long double mean = 0.0L;
        long double M2   = 0.0L;
        std::size_t n = 0;

        for (const auto& x : data) {
            if (is_nan_value(x)) continue;
            long double v = static_cast<long double>(x);
            ++n;
            long double dx = v - mean;
            mean += dx / static_cast<long double>(n);
            M2   += dx * (v - mean);
        }

        if (n < 2) {
            return nan();
        }
        long double var = M2 / static_cast<long double>(n - 1);
        return var > 0.0L ? std::sqrt(static_cast<double>(var)) : 0.0;
    }

    /**
     * @brief 百分位数（线性插值，与 numpy.percentile 默认一致）
     * @param percent 取值 [0, 100]
     * @return 无有效样本返回 NaN
     */
    template<typename Container>
    static double percentile(const Container& data, double percent) {
        std::vector<double> cleaned;
        cleaned.reserve(std::size(data));
        for (const auto& x : data) {
            if (!is_nan_value(x)) cleaned.push_back(static_cast<double>(x));
        }
        if (cleaned.empty()) {
            return nan();
        }
        std::sort(cleaned.begin(), cleaned.end());

        const double q = std::clamp(percent, 0.0, 100.0) / 100.0;
        const double position = q * (static_cast<double>(cleaned.size()) - 1.0);
        const std::size_t index = static_cast<std::size_t>(std::floor(position));
        const double fraction = position - static_cast<double>(index);

        if (index >= cleaned.size() - 1) {
            return cleaned.back();
        }
        const double lower = cleaned[index];
        const double upper = cleaned[index + 1];
        return lower + fraction * (upper - lower);
    }

    /**
     * @brief 平均秩（1 起），相同值取平均秩；NaN 的秩为 NaN
     */
    template<typename Container>
    static std::vector<double> average_ranks(const Container& data) {
        const std::size_t n = std::size(data);
        std::vector<double> ranks(n, nan());
        std::vector<std::pair<double, std::size_t>> indexed;
        indexed.reserve(n);
        std::size_t pos = 0;
        for (const auto& x : data) {
            if (!is_nan_value(x)) indexed.emplace_back(static_cast<double>(x), pos);
            ++pos;
        }
        std::sort(indexed.begin(), indexed.end(),
                  [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

        std::size_t i = 0;
        while (i < indexed.size()) {
            std::size_t j = i + 1;
            while (j < indexed.size() && indexed[j].first == indexed[i].first) {
                ++j;
            }
            const double avg_rank = 0.5 * (static_cast<double>(i + 1) + static_cast<double>(j));
            for (std::size_t k = i; k < j; ++k) {
                ranks[indexed[k].second] = avg_rank;
            }
            i = j;
        }
        return ranks;
    }

    /// Pearson 相关系数，单次遍历（Pébay），任一维 NaN 的 pair 跳过；
    /// 有效 pair < 2 或任一方差为 0 返回 NaN
    template<typename Container1, typename Container2>
    static double correlation(const Container1& x, const Container2& y) {
        if (std::size(x) != std::size(y)) {
            LOG_WARN("Statistics::correlation: size mismatch {} vs {}", std::size(x), std::size(y));
            return nan();
        }

        long double mx = 0.0L, my = 0.0L, C = 0.0L, M2x = 0.0L, M2y = 0.0L;
        std::size_t n = 0;

        auto x_it = std::begin(x);
        auto y_it = std::begin(y);
        for (; x_it != std::end(x) && y_it != std::end(y); ++x_it, ++y_it) {
            if (is_nan_value(*x_it) || is_nan_value(*y_it)) continue;
            long double xi = static_cast<long double>(*x_it);
            long double yi = static_cast<long double>(*y_it);
            ++n;
            long double dx = xi - mx; mx += dx / static_cast<long double>(n);
            long double dy = yi - my; my += dy / static_cast<long double>(n);
            C  += dx * (yi - my);
            M2x += dx * (xi - mx);
            M2y += dy * (yi - my);
        }

        if (n < 2 || M2x <= 0.0L || M2y <= 0.0L) {
            return nan();
        }
        const double r = static_cast<double>(C / std::sqrt(M2x * M2y));
        // 浮点误差可能让 |r| 略超 1
        return std::clamp(r, -1.0, 1.0);
    }

    /// Spearman 秩相关：联合有效的样本先取平均秩，再求 Pearson
    template<typename Container1, typename Container2>
    static double spearman(const Container1& x, const Container2& y) {
        if (std::size(x) != std::size(y)) {
            LOG_WARN("Statistics::spearman: size mismatch {} vs {}", std::size(x), std::size(y));
            return nan();
        }
        std::vector<double> xs;
        std::vector<double> ys;
        xs.reserve(std::size(x));
        ys.reserve(std::size(y));
        auto x_it = std::begin(x);
        auto y_it = std::begin(y);
        for (; x_it != std::end(x) && y_it != std::end(y); ++x_it, ++y_it) {
            if (is_nan_value(*x_it) || is_nan_value(*y_it)) continue;
            xs.push_back(static_cast<double>(*x_it));
            ys.push_back(static_cast<double>(*y_it));
        }
        if (xs.size() < 2) {
            return nan();
        }
        return correlation(average_ranks(xs), average_ranks(ys));
    }
};

/**
 * @brief 累计收益 → 年化收益：(1 + cumulative)^(base / n_periods) - 1
 *
 * n_periods == 0 或 1 + cumulative < 0 时返回 NaN。
 */
inline double annualize(double cumulative, std::size_t n_periods, double periods_per_year = 252.0) {
    if (n_periods == 0 || std::isnan(cumulative) || 1.0 + cumulative < 0.0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return std::pow(1.0 + cumulative, periods_per_year / static_cast<double>(n_periods)) - 1.0;
}

/**
 * @brief 逐期收益 → 净值序列（起点 1），缺失收益按 0 复利
 */
inline std::vector<double> compound_nav(const std::vector<double>& returns) {
    std::vector<double> nav;
    nav.reserve(returns.size());
    double level = 1.0;
    for (double r : returns) {
        if (!std::isnan(r)) level *= (1.0 + r);
        nav.push_back(level);
    }
    return nav;
}

/**
 * @brief 净值序列最大回撤（正数，0 表示无回撤）；以起点净值 1 作为初始高点
 */
inline double max_drawdown(const std::vector<double>& nav) {
    double peak = 1.0;
    double worst = 0.0;
    for (double v : nav) {
        if (std::isnan(v)) continue;
        peak = std::max(peak, v);
        if (peak > 0.0) worst = std::max(worst, 1.0 - v / peak);
    }
    return worst;
}

/**
 * @brief 年化夏普：mean(r - rf) / std(r) * sqrt(base)
 * @param annual_risk_free 年化无风险利率，按 base 期均摊
 * @return 有效样本 < 2 或标准差为 0 返回 NaN
 */
inline double sharpe_ratio(const std::vector<double>& returns,
                           double annual_risk_free = 0.0,
                           double periods_per_year = 252.0) {
    const double sd = Statistics<double>::stddev(returns);
    if (std::isnan(sd) || sd == 0.0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    const double excess_mean = Statistics<double>::mean(returns) - annual_risk_free / periods_per_year;
    return excess_mean / sd * std::sqrt(periods_per_year);
}

} // namespace math
} // namespace factoreval

#pragma once
/**
 * @file sliding_statistics.h
 * @brief 按“行数”滑动的窗口统计（均值 / 样本方差），窗口内允许缺失值。
 *
 * 与只累计有效值的滑窗不同：缺失值同样占用一个窗口位置，但不参与统计，
 * 这样窗口始终对应“最近 w 期”，与 rolling(window=w, min_periods=1) 的语义一致。
 */

#include <deque>
#include <cstddef>
#include <type_traits>
#include <limits>
#include <cmath>

namespace factoreval {
namespace math {

template<typename T>
class RollingWindowStats {
    static_assert(std::is_floating_point_v<T>, "T must be floating point");

public:
    using value_type = T;

    RollingWindowStats() = default;

    explicit RollingWindowStats(std::size_t window_size) {
        reset(window_size);
    }

    /// 重置窗口大小并清空状态
    void reset(std::size_t window_size) {
        max_size_ = window_size;
        window_.clear();
        n_valid_ = 0;
    }

    void clear() {
        reset(max_size_);
    }

    std::size_t window_size() const { return max_size_; }
    /// 窗口内占位个数（含缺失）
    std::size_t size() const { return window_.size(); }
    /// 窗口内有效样本数
    std::size_t valid_count() const { return n_valid_; }

    /// 追加一期；超过窗口时弹出最旧的一期。NaN/Inf 占位但不计入统计
    void push(T v) {
        if (max_size_ > 0 && window_.size() == max_size_) {
            if (std::isfinite(window_.front())) --n_valid_;
            window_.pop_front();
        }
        window_.push_back(v);
        if (std::isfinite(v)) ++n_valid_;
    }

    /// 窗口内有效样本的均值；无有效样本返回 NaN
    double mean() const {
        if (n_valid_ == 0) return std::numeric_limits<double>::quiet_NaN();
        return static_cast<double>(summarize().mean);
    }

    /// 窗口内有效样本的样本方差（除以 n-1）；有效样本 < 2 返回 NaN
    double variance_sample() const {
        if (n_valid_ < 2) return std::numeric_limits<double>::quiet_NaN();
        const Moments m = summarize();
        long double var = m.M2 / static_cast<long double>(n_valid_ - 1);
        if (var < 0) var = 0;
        return static_cast<double>(var);
    }

    double stddev_sample() const {
        const double var = variance_sample();
        return std::isnan(var) ? var : std::sqrt(var);
    }

private:
    struct Moments {
        long double mean{0};
        long double M2{0};
    };

    // 窗口很短（默认 5），每次查询按 Welford 重新扫一遍：
    // 常数序列的方差严格为 0，不会留下求和相减的舍入残差
    Moments summarize() const {
        Moments m;
        std::size_t n = 0;
        for (T v : window_) {
            if (!std::isfinite(v)) continue;
            ++n;
            const long double x = static_cast<long double>(v);
            const long double dx = x - m.mean;
            m.mean += dx / static_cast<long double>(n);
            m.M2 += dx * (x - m.mean);
        }
        return m;
    }

    std::size_t max_size_{0};
    std::size_t n_valid_{0};
    std::deque<T> window_;
};

} // namespace math
} // namespace factoreval

// include/factoreval/core/panel.h
#pragma once

#include <Eigen/Dense>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace factoreval {

using Period = int64_t;            ///< 期键：UTC 毫秒时间戳（日频为当日 15:00）
using InstrumentId = std::string;  ///< 标的代码，如 "000001"
using PanelMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// 缺失值统一用 quiet NaN 表示
inline double missing_value() { return std::numeric_limits<double>::quiet_NaN(); }
inline bool is_missing(double v) { return std::isnan(v); }

/**
 * @brief 长表的一行：(期, 标的, 值)
 */
struct LongRecord {
    Period period{};
    InstrumentId instrument;
    double value{};
};

/**
 * @brief 宽表面板：行 = 期（严格升序），列 = 标的（唯一），值可缺失。
 *
 * - 构造时校验形状 / 日期有序唯一 / 标的唯一，不合法抛 PanelError；
 * - 构造后不可修改，所有变换都返回新的 Panel；
 * - 数值以行优先的 Eigen 矩阵存储，按期取一行是连续内存。
 */
class Panel {
public:
    Panel() = default;
    Panel(std::vector<Period> periods,
          std::vector<InstrumentId> instruments,
          PanelMatrix values);

    /**
     * @brief 长表 → 宽表（pivot）
     *
     * 日期、标的分别升序排列；缺少的格子为缺失值；
     * 同一 (期, 标的) 出现两次抛 PanelError。
     */
    static Panel from_long(const std::vector<LongRecord>& records);

    /// 宽表 → 长表，按 (期, 列顺序) 输出；drop_missing=true 时跳过缺失格
    std::vector<LongRecord> to_long(bool drop_missing = true) const;

    std::size_t period_count() const { return periods_.size(); }
    std::size_t instrument_count() const { return instruments_.size(); }
    bool empty() const { return periods_.empty() || instruments_.empty(); }

    const std::vector<Period>& periods() const { return periods_; }
    const std::vector<InstrumentId>& instruments() const { return instruments_; }
    const PanelMatrix& values() const { return values_; }

    double at(std::size_t row, std::size_t col) const { return values_(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(col)); }

    /// 第 row 期的全部取值（按列顺序）
    std::vector<double> row(std::size_t row) const;

    std::optional<std::size_t> find_instrument(const InstrumentId& id) const;
    std::optional<std::size_t> find_period(Period period) const;

    /// 第 row 期非缺失值的个数
    std::size_t valid_count(std::size_t row) const;

    /// 取反（缺失保持缺失）
    Panel negated() const;

    /// 同标签、新数值；values 形状必须一致
    Panel with_values(PanelMatrix values) const;

    /// 按行 / 列下标抽取子表，下标顺序即结果顺序
    Panel select(const std::vector<std::size_t>& rows,
                 const std::vector<std::size_t>& cols) const;

    /// 日期与标的标签完全一致
    bool same_labels(const Panel& other) const;

    /**
     * @brief 标签一致且逐格相等（两边同时缺失视为相等）
     * @param tol 数值容差，默认 0 表示严格相等
     */
    bool equals(const Panel& other, double tol = 0.0) const;

private:
    std::vector<Period> periods_;
    std::vector<InstrumentId> instruments_;
    PanelMatrix values_;
};

/**
 * @brief 按期排列的一条标量序列（IC、组合收益、净值……），值可缺失
 */
struct TimeSeries {
    std::vector<Period> periods;
    std::vector<double> values;

    std::size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
    /// 非缺失值个数
    std::size_t valid_count() const;
    /// 最后一个值；空序列返回缺失
    double back() const { return values.empty() ? missing_value() : values.back(); }
};

/**
 * @brief 逐期“可吸收失败”的计数：数据不足、数值退化。
 *
 * 这些情况不抛异常，对应格子记为缺失 / 零权重，这里只负责让它们可观测。
 */
struct Diagnostics {
    std::size_t insufficient_data{0};     ///< 有效标的数低于最小宽度
    std::size_t computation_failures{0};  ///< 相关系数分母为 0 等数值退化

    void merge(const Diagnostics& other) {
        insufficient_data += other.insufficient_data;
        computation_failures += other.computation_failures;
    }
    std::size_t total() const { return insufficient_data + computation_failures; }
};

} // namespace factoreval

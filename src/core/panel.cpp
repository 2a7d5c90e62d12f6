#include "factoreval/core/panel.h"

#include <algorithm>
#include <map>
#include <unordered_set>
#include <utility>

#include "factoreval/core/errors.h"
#include "factoreval/utils/time_utils.h"

namespace factoreval {

Panel::Panel(std::vector<Period> periods,
             std::vector<InstrumentId> instruments,
             PanelMatrix values)
    : periods_(std::move(periods)),
      instruments_(std::move(instruments)),
      values_(std::move(values)) {
    if (static_cast<std::size_t>(values_.rows()) != periods_.size() ||
        static_cast<std::size_t>(values_.cols()) != instruments_.size()) {
        throw PanelError("Panel 形状不匹配: values " + std::to_string(values_.rows()) + "x" +
                         std::to_string(values_.cols()) + ", labels " +
                         std::to_string(periods_.size()) + "x" + std::to_string(instruments_.size()));
    }
    for (std::size_t i = 1; i < periods_.size(); ++i) {
        if (periods_[i] <= periods_[i - 1]) {
            throw PanelError("Panel 日期必须严格升序且唯一: " + format_date_ms(periods_[i]));
        }
    }
    std::unordered_set<InstrumentId> seen;
    seen.reserve(instruments_.size());
    for (const auto& id : instruments_) {
        if (!seen.insert(id).second) {
            throw PanelError("Panel 标的重复: " + id);
        }
    }
}

Panel Panel::from_long(const std::vector<LongRecord>& records) {
    std::map<Period, std::size_t> period_pos;
    std::map<InstrumentId, std::size_t> instrument_pos;
    for (const auto& rec : records) {
        period_pos.emplace(rec.period, 0);
        instrument_pos.emplace(rec.instrument, 0);
    }

    std::vector<Period> periods;
    periods.reserve(period_pos.size());
    for (auto& [p, idx] : period_pos) {
        idx = periods.size();
        periods.push_back(p);
    }
    std::vector<InstrumentId> instruments;
    instruments.reserve(instrument_pos.size());
    for (auto& [id, idx] : instrument_pos) {
        idx = instruments.size();
        instruments.push_back(id);
    }

    PanelMatrix values = PanelMatrix::Constant(static_cast<Eigen::Index>(periods.size()),
                                               static_cast<Eigen::Index>(instruments.size()),
                                               missing_value());
    // 单独记录“是否写过”，值本身可能就是 NaN
    std::vector<char> written(periods.size() * instruments.size(), 0);
    for (const auto& rec : records) {
        const std::size_t r = period_pos[rec.period];
        const std::size_t c = instrument_pos[rec.instrument];
        char& flag = written[r * instruments.size() + c];
        if (flag) {
            throw PanelError("长表存在重复记录: " + format_date_ms(rec.period) + " / " + rec.instrument);
        }
        flag = 1;
        values(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = rec.value;
    }
    return Panel(std::move(periods), std::move(instruments), std::move(values));
}

std::vector<LongRecord> Panel::to_long(bool drop_missing) const {
    std::vector<LongRecord> out;
    out.reserve(periods_.size() * instruments_.size());
    for (std::size_t r = 0; r < periods_.size(); ++r) {
        for (std::size_t c = 0; c < instruments_.size(); ++c) {
            const double v = at(r, c);
            if (drop_missing && is_missing(v)) continue;
            out.push_back(LongRecord{periods_[r], instruments_[c], v});
        }
    }
    return out;
}

std::vector<double> Panel::row(std::size_t row) const {
    const auto r = values_.row(static_cast<Eigen::Index>(row));
    return std::vector<double>(r.data(), r.data() + r.size());
}

std::optional<std::size_t> Panel::find_instrument(const InstrumentId& id) const {
    auto it = std::find(instruments_.begin(), instruments_.end(), id);
    if (it == instruments_.end()) return std::nullopt;
    return static_cast<std::size_t>(std::distance(instruments_.begin(), it));
}

std::optional<std::size_t> Panel::find_period(Period period) const {
    auto it = std::lower_bound(periods_.begin(), periods_.end(), period);
    if (it == periods_.end() || *it != period) return std::nullopt;
    return static_cast<std::size_t>(std::distance(periods_.begin(), it));
}

std::size_t Panel::valid_count(std::size_t row) const {
    std::size_t n = 0;
    for (Eigen::Index c = 0; c < values_.cols(); ++c) {
        if (!is_missing(values_(static_cast<Eigen::Index>(row), c))) ++n;
    }
    return n;
}

Panel Panel::negated() const {
    return with_values(-values_);
}

Panel Panel::with_values(PanelMatrix values) const {
    return Panel(periods_, instruments_, std::move(values));
}

Panel Panel::select(const std::vector<std::size_t>& rows,
                    const std::vector<std::size_t>& cols) const {
    std::vector<Period> periods;
    periods.reserve(rows.size());
    for (auto r : rows) periods.push_back(periods_.at(r));
    std::vector<InstrumentId> instruments;
    instruments.reserve(cols.size());
    for (auto c : cols) instruments.push_back(instruments_.at(c));

    PanelMatrix values(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(cols.size()));
    for (std::size_t i = 0; i < rows.size(); ++i) {
        for (std::size_t j = 0; j < cols.size(); ++j) {
            values(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = at(rows[i], cols[j]);
        }
    }
    return Panel(std::move(periods), std::move(instruments), std::move(values));
}

bool Panel::same_labels(const Panel& other) const {
    return periods_ == other.periods_ && instruments_ == other.instruments_;
}

bool Panel::equals(const Panel& other, double tol) const {
    if (!same_labels(other)) return false;
    for (Eigen::Index r = 0; r < values_.rows(); ++r) {
        for (Eigen::Index c = 0; c < values_.cols(); ++c) {
            const double a = values_(r, c);
            const double b = other.values_(r, c);
            if (is_missing(a) || is_missing(b)) {
                if (is_missing(a) != is_missing(b)) return false;
                continue;
            }
            if (a == b) continue;  // 含同号无穷
            if (!(std::abs(a - b) <= tol)) return false;
        }
    }
    return true;
}

std::size_t TimeSeries::valid_count() const {
    return static_cast<std::size_t>(std::count_if(values.begin(), values.end(),
                                                  [](double v) { return !is_missing(v); }));
}

} // namespace factoreval

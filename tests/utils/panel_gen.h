// tests/utils/panel_gen.h
#pragma once
#include <cstdio>
#include <limits>
#include <string>
#include <vector>

#include "factoreval/core/panel.h"
#include "factoreval/utils/time_utils.h"

/**
 * @file panel_gen.h
 * @brief 测试用面板构造：按行给出数值，日期从 2024-01-02 起逐日递增。
 */

namespace factoreval { namespace testutil {

inline const double kNaN = std::numeric_limits<double>::quiet_NaN();

/// 第 i 个交易日的期键
inline Period day(int i) {
    return make_time_ms(2024, 1, 2) + static_cast<int64_t>(i) * 24LL * 3600LL * 1000LL;
}

inline std::vector<Period> days(std::size_t n, int first = 0) {
    std::vector<Period> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) out.push_back(day(first + static_cast<int>(i)));
    return out;
}

/// "000001" 起的六位代码，可带交易所后缀
inline std::vector<InstrumentId> codes(std::size_t n, const std::string& suffix = "") {
    std::vector<InstrumentId> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%06zu", i + 1);
        out.push_back(std::string(buf) + suffix);
    }
    return out;
}

/**
 * @brief 由行数据构造面板；ids 为空时自动生成代码
 */
inline Panel make_panel(const std::vector<std::vector<double>>& rows,
                        std::vector<InstrumentId> ids = {},
                        int first_day = 0) {
    const std::size_t n_cols = rows.empty() ? ids.size() : rows.front().size();
    if (ids.empty()) ids = codes(n_cols);
    PanelMatrix values(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(n_cols));
    for (std::size_t r = 0; r < rows.size(); ++r) {
        for (std::size_t c = 0; c < n_cols; ++c) {
            values(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = rows[r][c];
        }
    }
    return Panel(days(rows.size(), first_day), std::move(ids), std::move(values));
}

}} // namespace factoreval::testutil

#include "factoreval/eval/panel_aligner.h"

#include <algorithm>
#include <unordered_map>
#include <vector>

#include "factoreval/core/errors.h"
#include "factoreval/utils/log.h"

namespace factoreval {

namespace {

// 去后缀代码 -> 列下标（同名保留第一列）
std::unordered_map<std::string, std::size_t> canonical_columns(const Panel& panel, const char* which) {
    std::unordered_map<std::string, std::size_t> out;
    out.reserve(panel.instrument_count());
    const auto& ids = panel.instruments();
    for (std::size_t c = 0; c < ids.size(); ++c) {
        auto code = canonical_instrument(ids[c]);
        auto [it, inserted] = out.emplace(code, c);
        if (!inserted) {
            LOG_WARN("align_panels: {} panel column '{}' collides with '{}' after suffix removal, keeping the first",
                     which, ids[c], ids[it->second]);
        }
    }
    return out;
}

} // namespace

std::string canonical_instrument(const std::string& id) {
    const auto dot = id.find('.');
    if (dot == std::string::npos) return id;
    return id.substr(0, dot);
}

AlignedPair align_panels(const Panel& factor, const Panel& returns) {
    const auto factor_cols = canonical_columns(factor, "factor");
    const auto return_cols = canonical_columns(returns, "returns");

    std::vector<std::string> common_codes;
    for (const auto& [code, _] : factor_cols) {
        if (return_cols.count(code)) common_codes.push_back(code);
    }
    std::sort(common_codes.begin(), common_codes.end());

    // 两边日期都严格升序，双指针求交集
    std::vector<std::size_t> factor_rows;
    std::vector<std::size_t> return_rows;
    const auto& fp = factor.periods();
    const auto& rp = returns.periods();
    std::size_t i = 0, j = 0;
    while (i < fp.size() && j < rp.size()) {
        if (fp[i] < rp[j]) {
            ++i;
        } else if (rp[j] < fp[i]) {
            ++j;
        } else {
            factor_rows.push_back(i++);
            return_rows.push_back(j++);
        }
    }

    if (common_codes.empty()) {
        throw AlignmentError("因子数据和收益率数据没有共同的股票");
    }
    if (factor_rows.empty()) {
        throw AlignmentError("因子数据和收益率数据没有共同的日期");
    }

    std::vector<std::size_t> factor_col_idx;
    std::vector<std::size_t> return_col_idx;
    factor_col_idx.reserve(common_codes.size());
    return_col_idx.reserve(common_codes.size());
    for (const auto& code : common_codes) {
        factor_col_idx.push_back(factor_cols.at(code));
        return_col_idx.push_back(return_cols.at(code));
    }

    Panel f = factor.select(factor_rows, factor_col_idx);
    Panel r = returns.select(return_rows, return_col_idx);

    // 列名统一为去后缀的代码
    AlignedPair out{
        Panel(f.periods(), common_codes, f.values()),
        Panel(r.periods(), common_codes, r.values())
    };
    LOG_INFO("数据对齐完成 - 日期: {}, 股票: {}", out.factor.period_count(), out.factor.instrument_count());
    return out;
}

} // namespace factoreval

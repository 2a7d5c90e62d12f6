#include "factoreval/tools/panel_csv_loader.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <utility>

#include "factoreval/config/config_utils.h"
#include "factoreval/core/errors.h"
#include "factoreval/utils/log.h"
#include "factoreval/utils/time_utils.h"

namespace factoreval::tools {

// ---------------------------------------------------------------------
// PanelCsvLoader：读取宽表 / 长表 CSV，转换为按日期升序的 Panel。
// ---------------------------------------------------------------------

namespace {

using config::to_lower_copy;
using config::trim_copy;

void strip_utf8_bom(std::string& s) {
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s.erase(0, 3);
    }
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_compressed(const std::string& path) {
    const auto lower = to_lower_copy(path);
    for (const char* ext : {".gz", ".xz", ".zip", ".bz2"}) {
        if (ends_with(lower, ext)) return true;
    }
    return false;
}

int find_column(const std::vector<std::string>& header, const std::string& name) {
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (to_lower_copy(header[i]) == name) return static_cast<int>(i);
    }
    return -1;
}

bool read_header(std::istream& in, std::vector<std::string>& header) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        strip_utf8_bom(line);
        if (trim_copy(line).empty()) continue;
        header = PanelCsvLoader::parse_csv_line(line);
        return true;
    }
    return false;
}

} // namespace

PanelCsvLoader::PanelCsvLoader(CsvLayout layout, std::string value_column)
    : _layout(layout),
      _value_column(std::move(value_column)) {}

Panel PanelCsvLoader::load(const std::string& path) const {
    if (is_compressed(path)) {
        throw DataLoadError("不支持压缩文件，请先解压: " + path);
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw DataLoadError("无法打开 CSV 文件: " + path);
    }
    return load(ifs, path);
}

Panel PanelCsvLoader::load(std::istream& in, const std::string& source_name) const {
    std::vector<std::string> header;
    if (!read_header(in, header)) {
        throw DataLoadError("CSV 文件为空: " + source_name);
    }

    CsvLayout layout = _layout;
    if (layout == CsvLayout::Auto) {
        const bool is_long = find_column(header, "day_date") >= 0 && find_column(header, "code") >= 0;
        layout = is_long ? CsvLayout::Long : CsvLayout::Wide;
    }
    Panel panel = layout == CsvLayout::Long
        ? load_long(in, header, source_name)
        : load_wide(in, header, source_name);

    LOG_INFO("数据加载完成 - {}: {} 期, {} 个标的 ({})", source_name, panel.period_count(),
             panel.instrument_count(), layout == CsvLayout::Long ? "长表" : "宽表");
    return panel;
}

Panel PanelCsvLoader::load_wide(std::istream& in, const std::vector<std::string>& header,
                                const std::string& source_name) const {
    // 表头为空的首列是导出时带出的行号
    const std::size_t first = (!header.empty() && header.front().empty()) ? 1 : 0;

    int date_col = -1;
    for (const char* name : {"day_date", "date", "trade_date"}) {
        date_col = find_column(header, name);
        if (date_col >= 0) break;
    }
    if (date_col < 0) {
        if (header.size() <= first) {
            throw DataLoadError("CSV 缺少日期列: " + source_name);
        }
        date_col = static_cast<int>(first);
    }

    std::vector<std::size_t> value_cols;
    std::vector<InstrumentId> instruments;
    for (std::size_t c = first; c < header.size(); ++c) {
        if (static_cast<int>(c) == date_col) continue;
        if (header[c].empty()) {
            throw DataLoadError("CSV 第 " + std::to_string(c + 1) + " 列缺少标的名称: " + source_name);
        }
        value_cols.push_back(c);
        instruments.push_back(header[c]);
    }
    if (instruments.empty()) {
        throw DataLoadError("CSV 没有标的列: " + source_name);
    }

    std::vector<std::pair<Period, std::vector<double>>> rows;
    std::string line;
    std::size_t line_no = 1;
    std::size_t skipped = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim_copy(line).empty()) continue;
        const auto cells = parse_csv_line(line);

        const auto ts = static_cast<std::size_t>(date_col) < cells.size()
            ? parse_date_to_ms(cells[static_cast<std::size_t>(date_col)])
            : std::nullopt;
        if (!ts) {
            ++skipped;
            LOG_DEBUG("PanelCsvLoader: {} line {} has no parsable date, skipped", source_name, line_no);
            continue;
        }
        std::vector<double> values(value_cols.size(), missing_value());
        for (std::size_t i = 0; i < value_cols.size(); ++i) {
            if (value_cols[i] >= cells.size()) continue;
            if (auto v = parse_cell(cells[value_cols[i]])) values[i] = *v;
        }
        rows.emplace_back(*ts, std::move(values));
    }
    if (skipped > 0) {
        LOG_WARN("PanelCsvLoader: {} 中有 {} 行日期无法解析，已跳过", source_name, skipped);
    }

    std::stable_sort(rows.begin(), rows.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

    std::vector<Period> periods;
    periods.reserve(rows.size());
    PanelMatrix values(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(instruments.size()));
    for (std::size_t r = 0; r < rows.size(); ++r) {
        if (!periods.empty() && periods.back() == rows[r].first) {
            throw PanelError("CSV 中日期重复: " + format_date_ms(rows[r].first) + " (" + source_name + ")");
        }
        periods.push_back(rows[r].first);
        for (std::size_t c = 0; c < instruments.size(); ++c) {
            values(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = rows[r].second[c];
        }
    }
    return Panel(std::move(periods), std::move(instruments), std::move(values));
}

Panel PanelCsvLoader::load_long(std::istream& in, const std::vector<std::string>& header,
                                const std::string& source_name) const {
    const int date_col = find_column(header, "day_date");
    const int code_col = find_column(header, "code");
    const int value_col = find_column(header, to_lower_copy(_value_column));
    if (date_col < 0 || code_col < 0) {
        throw DataLoadError("长表 CSV 需要 day_date 与 code 列: " + source_name);
    }
    if (value_col < 0) {
        throw DataLoadError("长表 CSV 缺少数值列 '" + _value_column + "': " + source_name);
    }
    const auto needed = static_cast<std::size_t>(std::max({date_col, code_col, value_col}));

    std::vector<LongRecord> records;
    std::string line;
    std::size_t skipped = 0;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim_copy(line).empty()) continue;
        const auto cells = parse_csv_line(line);
        if (cells.size() <= needed) {
            ++skipped;
            continue;
        }
        const auto ts = parse_date_to_ms(cells[static_cast<std::size_t>(date_col)]);
        const auto& code = cells[static_cast<std::size_t>(code_col)];
        if (!ts || code.empty()) {
            ++skipped;
            continue;
        }
        const auto v = parse_cell(cells[static_cast<std::size_t>(value_col)]);
        records.push_back(LongRecord{*ts, code, v ? *v : missing_value()});
    }
    if (skipped > 0) {
        LOG_WARN("PanelCsvLoader: {} 中有 {} 行缺少日期或代码，已跳过", source_name, skipped);
    }
    if (records.empty()) {
        throw DataLoadError("长表 CSV 没有有效记录: " + source_name);
    }
    return Panel::from_long(records);
}

// 支持双引号转义的简单 CSV 行
std::vector<std::string> PanelCsvLoader::parse_csv_line(const std::string& line) {
    std::vector<std::string> cells;
    std::string current;
    bool in_quotes = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        char ch = line[i];
        if (ch == '"') {
            if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
                current.push_back('"');
                ++i;
            } else {
                in_quotes = !in_quotes;
            }
        } else if (ch == ',' && !in_quotes) {
            cells.push_back(trim_copy(current));
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    cells.push_back(trim_copy(current));
    return cells;
}

std::optional<double> PanelCsvLoader::parse_cell(const std::string& token) {
    const auto text = trim_copy(token);
    if (text.empty()) return std::nullopt;
    const auto lower = to_lower_copy(text);
    if (lower == "nan" || lower == "null") return std::nullopt;

    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

} // namespace factoreval::tools

// include/factoreval/tools/panel_csv_loader.h
#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "factoreval/core/panel.h"

namespace factoreval::tools {

/// CSV 的表结构
enum class CsvLayout {
    Auto,   ///< 表头同时含 day_date 与 code 视为长表，否则宽表
    Wide,   ///< 日期列 + 每个标的一列
    Long    ///< day_date, code, <value_column>
};

/**
 * @brief 读取因子 / 收益率 CSV，统一转换为宽表 Panel。
 *
 * 宽表：日期列取 day_date / date / trade_date，找不到时取第一列；
 *       表头为空的首列（导出时带出的行号列）会被跳过。
 * 长表：按 (day_date, code, value_column) 透视，重复键抛 PanelError。
 * 空格、nan、NaN、null 及非有限数记为缺失；日期无法解析的行跳过并告警。
 * 压缩文件（.gz / .xz / .zip / .bz2）与无法打开的文件抛 DataLoadError。
 */
class PanelCsvLoader {
public:
    explicit PanelCsvLoader(CsvLayout layout = CsvLayout::Auto,
                            std::string value_column = "factor");

    Panel load(const std::string& path) const;
    Panel load(std::istream& in, const std::string& source_name = "<stream>") const;

    static std::vector<std::string> parse_csv_line(const std::string& line);
    /// 单元格 → 数值；缺失标记与非法文本返回 nullopt
    static std::optional<double> parse_cell(const std::string& token);

private:
    Panel load_wide(std::istream& in, const std::vector<std::string>& header,
                    const std::string& source_name) const;
    Panel load_long(std::istream& in, const std::vector<std::string>& header,
                    const std::string& source_name) const;

    CsvLayout _layout;
    std::string _value_column;
};

} // namespace factoreval::tools

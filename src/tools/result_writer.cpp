#include "factoreval/tools/result_writer.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "factoreval/core/errors.h"
#include "factoreval/tools/panel_csv_loader.h"
#include "factoreval/utils/log.h"
#include "factoreval/utils/time_utils.h"

namespace factoreval::tools {

namespace fs = std::filesystem;

namespace {

std::string num(double v) {
    return fmt::format("{}", v);
}

std::string csv_escape(const std::string& cell) {
    if (cell.find_first_of(",\"\n\r") == std::string::npos) return cell;
    std::string out = "\"";
    for (char ch : cell) {
        if (ch == '"') out.push_back('"');
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

void write_csv_row(std::ostream& os, const std::vector<std::string>& cells) {
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) os << ',';
        os << csv_escape(cells[i]);
    }
    os << '\n';
}

std::ofstream open_for_write(const fs::path& path, std::ios::openmode mode = std::ios::out | std::ios::trunc) {
    std::ofstream ofs(path, mode);
    if (!ofs.is_open()) {
        throw DataLoadError("无法写入文件: " + path.string());
    }
    return ofs;
}

void finish(std::ofstream& ofs, const fs::path& path) {
    ofs.flush();
    if (!ofs) {
        throw DataLoadError("写入文件失败: " + path.string());
    }
}

double series_at(const TimeSeries& ts, std::size_t i) {
    return i < ts.values.size() ? ts.values[i] : missing_value();
}

} // namespace

SummaryFields summary_metrics(const EvaluationResult& r) {
    const auto& ic = r.ic;
    const auto& ls = r.long_short;
    const auto& lo = r.long_only;
    const double excess = lo.benchmark ? lo.benchmark->annual_excess_return : missing_value();
    const double excess_total = lo.benchmark ? lo.benchmark->excess_total_return : missing_value();

    SummaryFields f{
        {"evaluation_time", r.evaluation_time},
        {"start_date", r.data_period.start_date},
        {"end_date", r.data_period.end_date},
        {"total_days", std::to_string(r.data_period.total_periods)},
        {"total_stocks", std::to_string(r.data_period.total_instruments)},
        {"factor_inverted", r.factor_inverted ? "true" : "false"},
        {"ICIR", num(ic.icir)},
        {"average_rank_IC", num(ic.rank_ic_mean)},
        {"rank_IC_std", num(ic.rank_ic_std)},
        {"IC", num(ic.ic_mean)},
        {"IC_std", num(ic.ic_std)},
        {"win_rate", num(ic.win_rate)},
        {"t_stat", num(ic.t_stat)},
        {"p_value", num(ic.p_value)},
        {"valid_periods", std::to_string(ic.valid_periods)},
        {"long_short_return", num(ls.annual_return)},
        {"long_short_total_return", num(ls.total_return)},
        {"long_short_turnover", num(ls.turnover)},
        {"long_short_sharpe", num(ls.sharpe)},
        {"long_short_max_drawdown", num(ls.max_drawdown)},
        {"long_return", num(lo.annual_return)},
        {"excess_return", num(excess)},
        {"excess_total_return", num(excess_total)},
        {"long_turnover", num(lo.turnover)},
        {"long_sharpe", num(lo.sharpe)},
        {"long_max_drawdown", num(lo.max_drawdown)},
        {"insufficient_data", std::to_string(r.diagnostics.insufficient_data)},
        {"computation_failures", std::to_string(r.diagnostics.computation_failures)},
    };
    for (std::size_t g = 0; g < r.groups.annualized.size(); ++g) {
        f.emplace_back("group_" + std::to_string(g + 1), num(r.groups.annualized[g]));
    }
    return f;
}

ResultWriter::ResultWriter(std::string results_dir, std::string session_id)
    : _results_dir(std::move(results_dir)),
      _session_id(session_id.empty() ? session_id_now() : std::move(session_id)) {}

std::string ResultWriter::csv_dir() const {
    return (fs::path(_results_dir) / "csv").string();
}

std::string ResultWriter::summary_path() const {
    return (fs::path(csv_dir()) / "backtest_results.csv").string();
}

void ResultWriter::ensure_dir(const std::string& dir) const {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw DataLoadError("无法创建目录 " + dir + ": " + ec.message());
    }
}

std::string ResultWriter::append_summary(const EvaluationResult& result, const ParameterMap& params) const {
    ensure_dir(csv_dir());

    SummaryFields fields{{"session_id", _session_id}, {"timestamp", now_string()}};
    for (const auto& [key, value] : params) {
        fields.emplace_back("param_" + key, value);
    }
    for (auto& kv : summary_metrics(result)) {
        fields.push_back(std::move(kv));
    }

    std::vector<std::string> columns;
    std::vector<std::string> cells;
    for (const auto& [key, value] : fields) {
        columns.push_back(key);
        cells.push_back(value);
    }

    const fs::path path(summary_path());
    std::vector<std::string> existing_header;
    if (fs::exists(path)) {
        std::ifstream ifs(path);
        std::string line;
        if (ifs.is_open() && std::getline(ifs, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            existing_header = PanelCsvLoader::parse_csv_line(line);
        }
    }

    if (existing_header.empty()) {
        auto ofs = open_for_write(path);
        write_csv_row(ofs, columns);
        write_csv_row(ofs, cells);
        finish(ofs, path);
    } else if (existing_header == columns) {
        auto ofs = open_for_write(path, std::ios::out | std::ios::app);
        write_csv_row(ofs, cells);
        finish(ofs, path);
    } else {
        // 列不一致：旧列在前、新列追加在后，整表重写
        auto rows = load_summaries();
        std::vector<std::string> merged = existing_header;
        for (const auto& c : columns) {
            if (std::find(merged.begin(), merged.end(), c) == merged.end()) merged.push_back(c);
        }
        SummaryRow current;
        for (const auto& [key, value] : fields) current[key] = value;
        rows.push_back(std::move(current));

        auto ofs = open_for_write(path);
        write_csv_row(ofs, merged);
        for (const auto& row : rows) {
            std::vector<std::string> out;
            out.reserve(merged.size());
            for (const auto& c : merged) {
                auto it = row.find(c);
                out.push_back(it == row.end() ? std::string() : it->second);
            }
            write_csv_row(ofs, out);
        }
        finish(ofs, path);
        LOG_INFO("汇总表列发生变化，已合并为 {} 列", merged.size());
    }

    LOG_INFO("回测结果已保存到: {}", path.string());
    return path.string();
}

std::string ResultWriter::write_series(const EvaluationResult& result, const std::string& tag) const {
    ensure_dir(csv_dir());
    const fs::path path = fs::path(csv_dir()) / (tag + "_series_" + _session_id + ".csv");
    auto ofs = open_for_write(path);

    const std::size_t k = static_cast<std::size_t>(result.groups.period_returns.cols());
    std::vector<std::string> header{"day_date", "rank_ic", "ic",
                                    "long_short_return", "long_short_nav",
                                    "long_return", "long_nav",
                                    "benchmark_nav", "excess_nav"};
    for (std::size_t g = 0; g < k; ++g) header.push_back("group_" + std::to_string(g + 1));
    write_csv_row(ofs, header);

    const auto& periods = result.ic.rank_ic.periods;
    const auto* bench = result.long_only.benchmark ? &*result.long_only.benchmark : nullptr;
    for (std::size_t t = 0; t < periods.size(); ++t) {
        std::vector<std::string> row{
            format_date_ms(periods[t]),
            num(series_at(result.ic.rank_ic, t)),
            num(series_at(result.ic.ic, t)),
            num(series_at(result.long_short.returns, t)),
            num(series_at(result.long_short.nav, t)),
            num(series_at(result.long_only.returns, t)),
            num(series_at(result.long_only.nav, t)),
            num(bench ? series_at(bench->benchmark_nav, t) : missing_value()),
            num(bench ? series_at(bench->excess_nav, t) : missing_value()),
        };
        for (std::size_t g = 0; g < k; ++g) {
            const bool has_row = t < static_cast<std::size_t>(result.groups.period_returns.rows());
            row.push_back(num(has_row
                ? result.groups.period_returns(static_cast<Eigen::Index>(t), static_cast<Eigen::Index>(g))
                : missing_value()));
        }
        write_csv_row(ofs, row);
    }
    finish(ofs, path);
    LOG_INFO("逐期序列已保存到: {}", path.string());
    return path.string();
}

std::string ResultWriter::write_panel(const Panel& panel, const std::string& file_name) const {
    ensure_dir(csv_dir());
    const fs::path path = fs::path(csv_dir()) / file_name;
    auto ofs = open_for_write(path);

    std::vector<std::string> header{"day_date"};
    header.insert(header.end(), panel.instruments().begin(), panel.instruments().end());
    write_csv_row(ofs, header);

    for (std::size_t t = 0; t < panel.period_count(); ++t) {
        std::vector<std::string> row{format_date_ms(panel.periods()[t])};
        row.reserve(panel.instrument_count() + 1);
        for (std::size_t c = 0; c < panel.instrument_count(); ++c) {
            const double v = panel.at(t, c);
            row.push_back(is_missing(v) ? std::string() : num(v));
        }
        write_csv_row(ofs, row);
    }
    finish(ofs, path);
    LOG_INFO("面板数据已保存到: {}", path.string());
    return path.string();
}

std::string ResultWriter::write_comparison(const std::vector<BatchEntry>& entries) const {
    ensure_dir(csv_dir());
    const fs::path path = fs::path(csv_dir()) / ("comparison_" + _session_id + ".csv");
    auto ofs = open_for_write(path);

    const std::vector<std::string> header{"combination", "ICIR", "average_rank_IC",
                                          "long_short_return", "excess_return", "long_short_turnover",
                                          "long_short_sharpe", "long_short_max_drawdown"};
    write_csv_row(ofs, header);
    for (const auto& e : entries) {
        std::vector<std::string> row{e.name};
        if (!e.ok()) {
            row.insert(row.end(), header.size() - 1, "ERROR");
        } else {
            const auto& r = *e.result;
            const double excess = r.long_only.benchmark ? r.long_only.benchmark->annual_excess_return
                                                        : missing_value();
            row.push_back(num(r.ic.icir));
            row.push_back(num(r.ic.rank_ic_mean));
            row.push_back(num(r.long_short.annual_return));
            row.push_back(num(excess));
            row.push_back(num(r.long_short.turnover));
            row.push_back(num(r.long_short.sharpe));
            row.push_back(num(r.long_short.max_drawdown));
        }
        write_csv_row(ofs, row);
    }
    finish(ofs, path);
    LOG_INFO("批量对比表已保存到: {}", path.string());
    return path.string();
}

std::string ResultWriter::write_parameters(const ParameterMap& params) const {
    ensure_dir(_results_dir);
    const fs::path path = fs::path(_results_dir) / ("parameters_" + _session_id + ".ini");
    auto ofs = open_for_write(path);

    ofs << "# session " << _session_id << ", written " << now_string() << '\n';
    // 不带节名的键写在最前面
    for (const auto& [key, value] : params) {
        if (key.find('.') == std::string::npos) ofs << key << " = " << value << '\n';
    }
    std::string section;
    for (const auto& [key, value] : params) {
        const auto dot = key.find('.');
        if (dot == std::string::npos) continue;
        const auto sec = key.substr(0, dot);
        if (sec != section) {
            section = sec;
            ofs << "\n[" << section << "]\n";
        }
        ofs << key.substr(dot + 1) << " = " << value << '\n';
    }
    finish(ofs, path);
    LOG_INFO("参数配置已保存到: {}", path.string());
    return path.string();
}

std::vector<SummaryRow> ResultWriter::load_summaries() const {
    std::vector<SummaryRow> rows;
    const fs::path path(summary_path());
    if (!fs::exists(path)) return rows;

    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw DataLoadError("无法读取汇总文件: " + path.string());
    }
    std::string line;
    std::vector<std::string> header;
    while (std::getline(ifs, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        auto cells = PanelCsvLoader::parse_csv_line(line);
        if (header.empty()) {
            header = std::move(cells);
            continue;
        }
        SummaryRow row;
        for (std::size_t i = 0; i < header.size(); ++i) {
            row[header[i]] = i < cells.size() ? cells[i] : std::string();
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

std::optional<SummaryRow> ResultWriter::best_result(const std::string& metric) const {
    std::optional<SummaryRow> best;
    double best_value = 0.0;
    for (auto& row : load_summaries()) {
        auto it = row.find(metric);
        if (it == row.end()) continue;
        const auto v = PanelCsvLoader::parse_cell(it->second);
        if (!v) continue;
        if (!best || *v > best_value) {
            best_value = *v;
            best = std::move(row);
        }
    }
    return best;
}

} // namespace factoreval::tools

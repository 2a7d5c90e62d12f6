// include/factoreval/tools/result_writer.h
#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "factoreval/core/panel.h"
#include "factoreval/eval/factor_evaluator.h"
#include "factoreval/tools/batch_runner.h"

namespace factoreval::tools {

using ParameterMap = std::map<std::string, std::string>;
/// 汇总表的一行：列名 -> 文本
using SummaryRow = std::map<std::string, std::string>;
/// 保持列顺序的字段列表
using SummaryFields = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief 结果落盘
 *
 * 目录结构：
 *   <results_dir>/csv/backtest_results.csv          每次评估追加一行
 *   <results_dir>/csv/<tag>_series_<session>.csv    逐期序列
 *   <results_dir>/csv/<file_name>                   导出的面板
 *   <results_dir>/csv/comparison_<session>.csv      批量回测对比表
 *   <results_dir>/parameters_<session>.ini          本次参数
 * 所有写入失败抛 DataLoadError。
 */
class ResultWriter {
public:
    /// session_id 为空时取当前时间 YYYYMMDD_HHMMSS
    explicit ResultWriter(std::string results_dir, std::string session_id = "");

    /**
     * @brief 追加一行汇总：session_id, timestamp, param_*, 标量指标, group_1..group_k
     *
     * 首次写入时生成表头；已有文件的列与本行不一致时合并列后整表重写。
     * @return 汇总文件路径
     */
    std::string append_summary(const EvaluationResult& result, const ParameterMap& params) const;

    /// 逐期序列：RankIC / IC / 各组合收益与净值 / 分组收益
    std::string write_series(const EvaluationResult& result, const std::string& tag) const;

    /// 宽表导出，首列 day_date
    std::string write_panel(const Panel& panel, const std::string& file_name) const;

    /**
     * @brief 批量回测对比表，每个组合一行
     *
     * 列：combination, ICIR, average_rank_IC, long_short_return, excess_return,
     *     long_short_turnover, long_short_sharpe, long_short_max_drawdown。
     * 失败的组合所有指标列写 ERROR。
     */
    std::string write_comparison(const std::vector<BatchEntry>& entries) const;

    /// 参数按 "section.key" 分节写成 INI
    std::string write_parameters(const ParameterMap& params) const;

    /// 读取历史汇总；文件不存在返回空
    std::vector<SummaryRow> load_summaries() const;

    /// 历史汇总中指定指标最大的一行（非数值与缺失跳过）
    std::optional<SummaryRow> best_result(const std::string& metric = "ICIR") const;

    const std::string& session_id() const { return _session_id; }
    std::string csv_dir() const;
    std::string summary_path() const;

private:
    void ensure_dir(const std::string& dir) const;

    std::string _results_dir;
    std::string _session_id;
};

/// 单个评估结果展开成汇总字段（不含 session / 参数列），顺序即表头顺序
SummaryFields summary_metrics(const EvaluationResult& result);

} // namespace factoreval::tools

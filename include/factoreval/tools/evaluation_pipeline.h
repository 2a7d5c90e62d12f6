// include/factoreval/tools/evaluation_pipeline.h
#pragma once

#include <string>
#include <vector>

#include "factoreval/config/evaluation_config.h"
#include "factoreval/eval/factor_evaluator.h"
#include "factoreval/tools/batch_runner.h"
#include "factoreval/tools/result_writer.h"

namespace factoreval::tools {

/// 输入文件：因子 CSV、收益 CSV，以及长表收益的值列名
struct PipelineInputs {
    std::string factor_file;
    std::string returns_file;
    std::string return_column = "return";
};

/// cfg 展开成参数表，附带 input.factor_file / input.returns_file
ParameterMap pipeline_parameters(const config::FrameworkConfig& cfg, const PipelineInputs& in);

/**
 * @brief 单次评估：加载 → 平滑 → 评估 → 落盘
 *
 * 落盘内容：汇总行、逐期序列（tag 为因子文件名主干）、参数 INI；
 * output.save_intermediate 打开时另存原始与平滑后的因子面板。
 * cfg 先校验，非法时抛 ConfigurationError。
 */
EvaluationResult run_single(const config::FrameworkConfig& cfg, const PipelineInputs& in,
                            const ResultWriter& writer);

/**
 * @brief 批量评估：面板只加载一次，逐组合平滑与评估
 *
 * variants 为空时使用 default_batch_variants(base)。
 * 落盘内容：对比表、每个成功组合一行汇总（参数带 batch.variant）、base 参数 INI。
 */
std::vector<BatchEntry> run_batch(const config::FrameworkConfig& base, const PipelineInputs& in,
                                  const ResultWriter& writer, std::vector<BatchVariant> variants = {});

} // namespace factoreval::tools

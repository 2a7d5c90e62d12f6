// include/factoreval/tools/batch_runner.h
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "factoreval/config/evaluation_config.h"
#include "factoreval/core/panel.h"
#include "factoreval/eval/factor_evaluator.h"

namespace factoreval::tools {

/// 一组命名的参数组合
struct BatchVariant {
    std::string name;
    config::FrameworkConfig config;
};

/// 单个组合的结果：成功时 result 有值，失败时 error 为错误信息
struct BatchEntry {
    std::string name;
    std::optional<EvaluationResult> result;
    std::string error;

    bool ok() const { return result.has_value(); }
};

/**
 * @brief 默认的五种组合，均为 10 组
 *
 *   无平滑 / 5日均值 / 10日均值 / 5日均值+Z-score(20) / EMA平滑(alpha=0.3)
 * 评估与输出参数沿用 base。
 */
std::vector<BatchVariant> default_batch_variants(const config::FrameworkConfig& base);

/**
 * @brief 同一份因子面板依次套用多组参数：平滑 → 评估
 *
 * 某个组合抛出的 EvaluationError 记录到对应 BatchEntry 并写日志，
 * 其余组合继续执行；其他异常照常向上抛。
 */
class BatchRunner {
public:
    explicit BatchRunner(std::vector<BatchVariant> variants);

    std::vector<BatchEntry> run(const Panel& factor, const Panel& returns) const;

    const std::vector<BatchVariant>& variants() const { return _variants; }

private:
    std::vector<BatchVariant> _variants;
};

/// 逐组合打印对比，并给出 ICIR 最高与超额收益最高的组合
void log_batch_summary(const std::vector<BatchEntry>& entries);

/// 成功组合中 metric 最大者；metric 取 "ICIR" 或 "excess_return"，无可比组合返回 nullptr
const BatchEntry* best_batch_entry(const std::vector<BatchEntry>& entries, const std::string& metric);

} // namespace factoreval::tools

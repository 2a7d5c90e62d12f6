#include "factoreval/tools/batch_runner.h"

#include <cmath>
#include <utility>

#include "factoreval/core/errors.h"
#include "factoreval/eval/factor_smoother.h"
#include "factoreval/utils/log.h"

namespace factoreval::tools {

namespace {

double excess_of(const EvaluationResult& r) {
    return r.long_only.benchmark ? r.long_only.benchmark->annual_excess_return : missing_value();
}

double metric_of(const EvaluationResult& r, const std::string& metric) {
    if (metric == "ICIR") return r.ic.icir;
    if (metric == "excess_return") return excess_of(r);
    throw ConfigurationError("不支持的对比指标: " + metric);
}

} // namespace

std::vector<BatchVariant> default_batch_variants(const config::FrameworkConfig& base) {
    auto make = [&base](std::string name, bool smooth, std::vector<config::SmoothingStep> steps) {
        BatchVariant v{std::move(name), base};
        v.config.evaluation.group_num = 10;
        v.config.smoothing.enable = smooth;
        v.config.smoothing.methods = std::move(steps);
        return v;
    };
    std::vector<BatchVariant> out;
    out.push_back(make("无平滑", false, base.smoothing.methods));
    out.push_back(make("5日均值", true, {{"rolling_mean", 5, 0.3}}));
    out.push_back(make("10日均值", true, {{"rolling_mean", 10, 0.3}}));
    out.push_back(make("5日均值+Z-score", true, {{"rolling_mean", 5, 0.3}, {"zscore", 20, 0.3}}));
    out.push_back(make("EMA平滑", true, {{"ema", 0, 0.3}}));
    return out;
}

BatchRunner::BatchRunner(std::vector<BatchVariant> variants)
    : _variants(std::move(variants)) {
    if (_variants.empty()) {
        throw ConfigurationError("批量回测至少需要一个参数组合");
    }
}

std::vector<BatchEntry> BatchRunner::run(const Panel& factor, const Panel& returns) const {
    const std::string rule(60, '=');
    LOG_INFO("{}", rule);
    LOG_INFO("开始批量回测，共 {} 种参数组合", _variants.size());
    LOG_INFO("{}", rule);

    std::vector<BatchEntry> entries;
    entries.reserve(_variants.size());
    for (std::size_t i = 0; i < _variants.size(); ++i) {
        const auto& v = _variants[i];
        LOG_INFO("[{}/{}] 测试组合: {}", i + 1, _variants.size(), v.name);
        BatchEntry entry{v.name, std::nullopt, {}};
        try {
            const FactorSmoother smoother(v.config.smoothing);
            const Panel smoothed = smoother.smooth(factor);
            const FactorEvaluator evaluator(v.config.evaluation);
            entry.result = evaluator.evaluate(smoothed, returns);
        } catch (const EvaluationError& e) {
            entry.error = e.what();
            LOG_ERROR("组合 {} 测试失败: {}", v.name, entry.error);
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

const BatchEntry* best_batch_entry(const std::vector<BatchEntry>& entries, const std::string& metric) {
    const BatchEntry* best = nullptr;
    double best_value = 0.0;
    for (const auto& e : entries) {
        if (!e.ok()) continue;
        const double v = metric_of(*e.result, metric);
        if (!std::isfinite(v)) continue;
        if (best == nullptr || v > best_value) {
            best = &e;
            best_value = v;
        }
    }
    return best;
}

void log_batch_summary(const std::vector<BatchEntry>& entries) {
    const std::string rule(60, '=');
    LOG_INFO("{}", rule);
    LOG_INFO("批量回测结果摘要");
    LOG_INFO("{}", rule);
    for (const auto& e : entries) {
        if (!e.ok()) {
            LOG_INFO("[{}] ERROR: {}", e.name, e.error);
            continue;
        }
        const auto& r = *e.result;
        LOG_INFO("[{}] ICIR: {:.4f} | RankIC: {:.4f} | 多空收益: {:.4f} | 超额收益: {:.4f}",
                 e.name, r.ic.icir, r.ic.rank_ic_mean, r.long_short.annual_return, excess_of(r));
    }
    if (const auto* best = best_batch_entry(entries, "ICIR")) {
        LOG_INFO("最佳ICIR组合: {} (ICIR: {:.4f})", best->name, best->result->ic.icir);
    }
    if (const auto* best = best_batch_entry(entries, "excess_return")) {
        LOG_INFO("最佳超额收益组合: {} (超额收益: {:.4f})", best->name, excess_of(*best->result));
    }
    LOG_INFO("{}", rule);
}

} // namespace factoreval::tools

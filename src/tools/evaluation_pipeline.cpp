#include "factoreval/tools/evaluation_pipeline.h"

#include <filesystem>
#include <utility>

#include "factoreval/eval/factor_smoother.h"
#include "factoreval/tools/panel_csv_loader.h"
#include "factoreval/utils/log.h"

namespace factoreval::tools {

namespace fs = std::filesystem;

namespace {

struct LoadedPanels {
    Panel factor;
    Panel returns;
};

LoadedPanels load_inputs(const PipelineInputs& in) {
    const PanelCsvLoader factor_loader(CsvLayout::Auto, "factor");
    const PanelCsvLoader returns_loader(CsvLayout::Auto, in.return_column);
    LoadedPanels p{factor_loader.load(in.factor_file), returns_loader.load(in.returns_file)};
    LOG_INFO("因子面板 {} 期 x {} 只, 收益面板 {} 期 x {} 只",
             p.factor.period_count(), p.factor.instrument_count(),
             p.returns.period_count(), p.returns.instrument_count());
    return p;
}

} // namespace

ParameterMap pipeline_parameters(const config::FrameworkConfig& cfg, const PipelineInputs& in) {
    ParameterMap params = config::to_entries(cfg);
    params["input.factor_file"] = in.factor_file;
    params["input.returns_file"] = in.returns_file;
    return params;
}

EvaluationResult run_single(const config::FrameworkConfig& cfg, const PipelineInputs& in,
                            const ResultWriter& writer) {
    cfg.validate();
    const LoadedPanels panels = load_inputs(in);

    const FactorSmoother smoother(cfg.smoothing);
    const Panel factor = smoother.smooth(panels.factor);

    const FactorEvaluator evaluator(cfg.evaluation);
    EvaluationResult result = evaluator.evaluate(factor, panels.returns);

    if (cfg.output.save_intermediate) {
        writer.write_panel(panels.factor, "factor_data_" + writer.session_id() + ".csv");
        if (cfg.smoothing.enable) {
            writer.write_panel(factor, "smoothed_factor_data_" + writer.session_id() + ".csv");
        }
    }
    const ParameterMap params = pipeline_parameters(cfg, in);
    writer.append_summary(result, params);
    writer.write_series(result, fs::path(in.factor_file).stem().string());
    writer.write_parameters(params);
    return result;
}

std::vector<BatchEntry> run_batch(const config::FrameworkConfig& base, const PipelineInputs& in,
                                  const ResultWriter& writer, std::vector<BatchVariant> variants) {
    if (variants.empty()) {
        variants = default_batch_variants(base);
    }
    const LoadedPanels panels = load_inputs(in);

    const BatchRunner runner(std::move(variants));
    std::vector<BatchEntry> entries = runner.run(panels.factor, panels.returns);

    writer.write_comparison(entries);
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (!entries[i].ok()) continue;
        ParameterMap params = pipeline_parameters(runner.variants()[i].config, in);
        params["batch.variant"] = entries[i].name;
        writer.append_summary(*entries[i].result, params);
    }
    writer.write_parameters(pipeline_parameters(base, in));

    log_batch_summary(entries);
    return entries;
}

} // namespace factoreval::tools

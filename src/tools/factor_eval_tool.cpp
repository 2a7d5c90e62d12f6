#include "factoreval/config/evaluation_config.h"
#include "factoreval/config/runtime_config.h"
#include "factoreval/core/errors.h"
#include "factoreval/eval/factor_evaluator.h"
#include "factoreval/tools/evaluation_pipeline.h"
#include "factoreval/tools/result_writer.h"
#include "factoreval/utils/log.h"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using namespace factoreval;

namespace {

std::optional<std::string> get_arg(int argc, char** argv, const std::string& key) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (argv[i] == key) return std::string(argv[i + 1]);
    }
    return std::nullopt;
}

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == key) return true;
    }
    return false;
}

int parse_int_arg(const std::string& key, const std::string& text) {
    std::size_t consumed = 0;
    int v = 0;
    try {
        v = std::stoi(text, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigurationError(key + " 需要整数参数: " + text);
    }
    if (consumed != text.size()) throw ConfigurationError(key + " 需要整数参数: " + text);
    return v;
}

double parse_double_arg(const std::string& key, const std::string& text) {
    std::size_t consumed = 0;
    double v = 0.0;
    try {
        v = std::stod(text, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigurationError(key + " 需要数值参数: " + text);
    }
    if (consumed != text.size()) throw ConfigurationError(key + " 需要数值参数: " + text);
    return v;
}

void print_usage() {
    std::cout
        << "Usage:\n"
        << "  factor_eval_tool --factor FILE.csv --returns FILE.csv \\\n"
        << "    [--config FILE.ini]        (default $FACTOREVAL_CFG, else built-in defaults) \\\n"
        << "    [--out_dir DIR]            (default output.results_dir) \\\n"
        << "    [--invert]                 (negate the factor before evaluation) \\\n"
        << "    [--no_smooth]              (skip smoothing) \\\n"
        << "    [--batch]                  (run the built-in smoothing variants, write a comparison table) \\\n"
        << "    [--groups N] [--long P] [--short P] \\\n"
        << "    [--return_column NAME]     (value column of a long-format returns CSV, default return) \\\n"
        << "    [--quiet]\n"
        << "  factor_eval_tool --help|-h\n";
}

void print_summary(const EvaluationResult& r) {
    auto show = [](const char* name, double v) {
        std::cout << "  " << std::left << std::setw(24) << name << std::fixed << std::setprecision(4) << v << "\n";
    };
    std::cout << "Period: " << r.data_period.start_date << " ~ " << r.data_period.end_date
              << " (" << r.data_period.total_periods << " periods, "
              << r.data_period.total_instruments << " instruments)\n";
    show("ICIR", r.ic.icir);
    show("average rank IC", r.ic.rank_ic_mean);
    show("rank IC win rate", r.ic.win_rate);
    show("rank IC p-value", r.ic.p_value);
    show("long/short annual", r.long_short.annual_return);
    show("long/short turnover", r.long_short.turnover);
    show("long/short sharpe", r.long_short.sharpe);
    if (r.long_only.benchmark) {
        show("excess annual", r.long_only.benchmark->annual_excess_return);
    }
    show("long turnover", r.long_only.turnover);
    for (std::size_t g = 0; g < r.groups.annualized.size(); ++g) {
        const std::string name = "group " + std::to_string(g + 1);
        show(name.c_str(), r.groups.annualized[g]);
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        if (argc < 2 || has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
            print_usage();
            return argc < 2 ? 1 : 0;
        }
        if (has_flag(argc, argv, "--quiet")) {
            factoreval::log::set_level(factoreval::log::LogLevel::WARN);
        }

        const auto factor_path = get_arg(argc, argv, "--factor");
        const auto returns_path = get_arg(argc, argv, "--returns");
        if (!factor_path || !returns_path) {
            std::cerr << "ERROR: --factor and --returns are required\n";
            print_usage();
            return 1;
        }

        // 配置：--config 优先，其次环境变量
        std::optional<std::string> cfg_path = get_arg(argc, argv, "--config");
        if (!cfg_path) {
            if (const char* env = std::getenv("FACTOREVAL_CFG")) {
                if (*env) cfg_path = std::string(env);
            }
        }
        config::FrameworkConfig cfg;
        if (cfg_path) {
            cfg = config::load_framework_config(config::IniConfig::from_file(*cfg_path));
            LOG_INFO("已加载配置: {}", *cfg_path);
        }

        if (auto v = get_arg(argc, argv, "--groups")) cfg.evaluation.group_num = parse_int_arg("--groups", *v);
        if (auto v = get_arg(argc, argv, "--long")) cfg.evaluation.long_percentile = parse_double_arg("--long", *v);
        if (auto v = get_arg(argc, argv, "--short")) cfg.evaluation.short_percentile = parse_double_arg("--short", *v);
        if (auto v = get_arg(argc, argv, "--out_dir")) cfg.output.results_dir = *v;
        if (has_flag(argc, argv, "--invert")) cfg.evaluation.invert_factor = true;
        if (has_flag(argc, argv, "--no_smooth")) cfg.smoothing.enable = false;
        cfg.validate();

        tools::PipelineInputs inputs;
        inputs.factor_file = *factor_path;
        inputs.returns_file = *returns_path;
        inputs.return_column = get_arg(argc, argv, "--return_column").value_or("return");

        const tools::ResultWriter writer(cfg.output.results_dir);
        if (has_flag(argc, argv, "--batch")) {
            const auto entries = tools::run_batch(cfg, inputs, writer);
            std::size_t failed = 0;
            for (const auto& e : entries) {
                if (!e.ok()) ++failed;
            }
            std::cout << "Batch: " << entries.size() << " variants, " << failed << " failed\n";
            if (const auto* best = tools::best_batch_entry(entries, "ICIR")) {
                std::cout << "Best ICIR: " << best->name << "\n";
            }
            std::cout << "Done. Outputs in: " << cfg.output.results_dir << "\n";
            return 0;
        }

        const EvaluationResult result = tools::run_single(cfg, inputs, writer);
        print_summary(result);
        std::cout << "Done. Outputs in: " << cfg.output.results_dir << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
}

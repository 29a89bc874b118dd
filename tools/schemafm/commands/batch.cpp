/**
 * schemafm CLI - batch command
 *
 * Validate every document under a directory with checkpointed batches.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <csignal>

namespace schemafm::cli::commands {

namespace {

struct BatchCommandOptions {
    std::string model;
    std::string input;
    std::string keys;
    std::string checkpoint;
    std::string summary = "summary.csv";
    std::string reports;
    std::size_t workers = 0;
    std::size_t batch_size = 0;
    long budget_ms = -1;
};

BatchRunner* g_runner = nullptr;

void handle_interrupt(int) {
    if (g_runner) g_runner->cancel();
}

int cmd_batch(const GlobalOptions& opts, const BatchCommandOptions& b_opts) {
    init_command(opts);

    RunConfig config;
    if (!load_config(opts, config)) {
        return 1;
    }

    auto model = load_model(b_opts.model);
    if (model.isErr()) {
        print_error(model.error().toString(), opts.json);
        return 1;
    }

    WarningCollector warnings(config.warnings);
    KeyMapper mapper;
    if (!load_key_mapper(model.value(), b_opts.keys, warnings, mapper, opts.json)) {
        return 1;
    }

    auto options = batch_options_from_config(config);
    if (b_opts.workers > 0) options.workers = b_opts.workers;
    if (b_opts.batch_size > 0) options.batch_size = b_opts.batch_size;
    if (b_opts.budget_ms >= 0) options.time_budget = std::chrono::milliseconds(b_opts.budget_ms);
    options.checkpoint_path = b_opts.checkpoint;
    options.summary_path = b_opts.summary;
    options.reports_path = b_opts.reports;

    if (!path_exists(b_opts.input)) {
        print_error("Input not found: " + b_opts.input, opts.json);
        return 1;
    }
    auto files = list_files(b_opts.input, {".yaml", ".yml", ".json"});
    if (files.empty()) {
        print_warning("No documents under " + b_opts.input);
    }

    BatchRunner runner(model.value(), mapper, options);
    g_runner = &runner;
    auto previous = std::signal(SIGINT, handle_interrupt);
    auto summary = runner.run(files, warnings);
    std::signal(SIGINT, previous);
    g_runner = nullptr;

    if (opts.json) {
        nlohmann::ordered_json j;
        j["ok"] = summary.failed == 0 && summary.batches_failed == 0 && !summary.cancelled;
        j["files"] = summary.files;
        j["documents"] = summary.documents;
        j["valid"] = summary.valid;
        j["invalid"] = summary.invalid;
        j["failed"] = summary.failed;
        j["batches"] = {{"total", summary.batches_total},
                        {"run", summary.batches_run},
                        {"resumed", summary.batches_resumed},
                        {"failed", summary.batches_failed}};
        j["cancelled"] = summary.cancelled;
        j["summary"] = options.summary_path;
        nlohmann::ordered_json counts = nlohmann::ordered_json::object();
        for (const auto& [key, count] : warnings.counts()) {
            counts[key] = count;
        }
        j["warning_counts"] = counts;
        output_json(j);
    } else {
        print_warning_summary(warnings, opts);
        std::cout << summary.documents << " documents in " << summary.files << " files: "
                  << summary.valid << " valid, " << summary.invalid << " invalid, "
                  << summary.failed << " failed" << std::endl;
        std::cout << "Batches: " << summary.batches_run << " run, " << summary.batches_resumed
                  << " resumed from checkpoint, " << summary.batches_failed << " failed, "
                  << summary.batches_total << " total" << std::endl;
        if (summary.cancelled) {
            std::cout << "Cancelled; rerun with the same --checkpoint to resume" << std::endl;
        }
    }

    if (summary.cancelled) return 130;
    return summary.failed == 0 && summary.batches_failed == 0 ? 0 : 1;
}

} // anonymous namespace

void setup_batch(CLI::App* app, GlobalOptions& opts) {
    static BatchCommandOptions b_opts;

    app->add_option("model", b_opts.model, "Model file")->required();
    app->add_option("input", b_opts.input, "Directory (or single file) of documents")->required();
    app->add_option("-k,--keys", b_opts.keys, "Key mapping table; derived from the model when omitted");
    app->add_option("--checkpoint", b_opts.checkpoint, "Completed batch ids; enables resume");
    app->add_option("--summary", b_opts.summary, "Summary CSV (filename,source,result,time)");
    app->add_option("--reports", b_opts.reports, "Validation reports, one JSON object per line");
    app->add_option("-j,--workers", b_opts.workers, "Worker threads (overrides config)");
    app->add_option("--batch-size", b_opts.batch_size, "Files per batch (overrides config)");
    app->add_option("--budget-ms", b_opts.budget_ms, "Per-document time budget, 0 disables (overrides config)");

    app->callback([&opts]() {
        std::exit(cmd_batch(opts, b_opts));
    });
}

} // namespace schemafm::cli::commands

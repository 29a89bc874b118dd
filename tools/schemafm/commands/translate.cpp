/**
 * schemafm CLI - translate command
 *
 * Turn configuration documents into feature selections.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace schemafm::cli::commands {

namespace {

struct TranslateOptions {
    std::string model;
    std::string document;
    std::string keys;
    std::string output;
};

int cmd_translate(const GlobalOptions& opts, const TranslateOptions& tr_opts) {
    init_command(opts);

    RunConfig config;
    if (!load_config(opts, config)) {
        return 1;
    }

    auto model = load_model(tr_opts.model);
    if (model.isErr()) {
        print_error(model.error().toString(), opts.json);
        return 1;
    }

    WarningCollector warnings(config.warnings);
    KeyMapper mapper;
    if (!load_key_mapper(model.value(), tr_opts.keys, warnings, mapper, opts.json)) {
        return 1;
    }

    auto batch = batch_options_from_config(config);
    auto documents = load_documents(tr_opts.document, batch.documents, warnings);
    if (documents.isErr()) {
        print_error(documents.error().toString(), opts.json);
        return 1;
    }

    ConfigurationTranslator translator(mapper, TranslatorOptions{batch.time_budget});
    auto selections = nlohmann::ordered_json::array();
    int exit_code = 0;

    for (const auto& doc : documents.value()) {
        auto selection = translator.translate(doc, warnings);
        if (selection.isErr()) {
            print_warning(selection.error().toString());
            exit_code = 1;
            continue;
        }
        selections.push_back(selection_to_json(selection.value()));
    }

    std::string text = (selections.size() == 1 ? selections[0] : selections).dump(2) + "\n";

    if (!tr_opts.output.empty()) {
        auto written = atomic_write_file(tr_opts.output, text);
        if (!written.ok) {
            print_error(tr_opts.output + ": " + written.error, opts.json);
            return 1;
        }
        if (opts.json) {
            nlohmann::ordered_json j;
            j["ok"] = exit_code == 0;
            j["output"] = tr_opts.output;
            j["documents"] = selections.size();
            j["warnings"] = warnings_to_json(warnings);
            output_json(j);
        } else {
            print_warning_summary(warnings, opts);
            std::cout << "Wrote " << selections.size() << " selections to " << tr_opts.output << std::endl;
        }
    } else {
        std::cout << text;
        print_warning_summary(warnings, opts);
    }

    return exit_code;
}

} // anonymous namespace

void setup_translate(CLI::App* app, GlobalOptions& opts) {
    static TranslateOptions tr_opts;

    app->add_option("model", tr_opts.model, "Model file")->required();
    app->add_option("document", tr_opts.document, "Configuration document (YAML or JSON)")->required();
    app->add_option("-k,--keys", tr_opts.keys, "Key mapping table; derived from the model when omitted");
    app->add_option("-o,--output", tr_opts.output, "Write the selection record(s) to a file");

    app->callback([&opts]() {
        std::exit(cmd_translate(opts, tr_opts));
    });
}

} // namespace schemafm::cli::commands

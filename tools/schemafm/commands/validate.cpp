/**
 * schemafm CLI - validate command
 *
 * Validate documents, or stored selection records, against a model.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace schemafm::cli::commands {

namespace {

struct ValidateOptions {
    std::string model;
    std::string input;
    std::string keys;
    bool selection = false;
};

void print_report(const ValidationReport& report) {
    std::cout << report.document_id << ": " << (report.valid ? "valid" : "invalid") << std::endl;
    for (const auto& v : report.violations) {
        std::cout << "  " << v << std::endl;
    }
}

int cmd_validate(const GlobalOptions& opts, const ValidateOptions& val_opts) {
    init_command(opts);

    RunConfig config;
    if (!load_config(opts, config)) {
        return 1;
    }

    auto model = load_model(val_opts.model);
    if (model.isErr()) {
        print_error(model.error().toString(), opts.json);
        return 1;
    }

    ModelValidator validator(model.value());
    WarningCollector warnings(config.warnings);
    std::vector<ValidationReport> reports;
    bool failed = false;

    if (val_opts.selection) {
        auto file = read_file(val_opts.input);
        if (!file.ok) {
            print_error(file.error, opts.json);
            return 1;
        }
        auto parsed = parse_selection(file.content);
        if (!parsed.ok) {
            print_error(val_opts.input + ": " + parsed.error, opts.json);
            return 1;
        }
        reports.push_back(validator.validate(parsed.selection));
    } else {
        KeyMapper mapper;
        if (!load_key_mapper(model.value(), val_opts.keys, warnings, mapper, opts.json)) {
            return 1;
        }

        auto batch = batch_options_from_config(config);
        auto documents = load_documents(val_opts.input, batch.documents, warnings);
        if (documents.isErr()) {
            print_error(documents.error().toString(), opts.json);
            return 1;
        }

        ConfigurationTranslator translator(mapper, TranslatorOptions{batch.time_budget});
        for (const auto& doc : documents.value()) {
            auto selection = translator.translate(doc, warnings);
            if (selection.isErr()) {
                print_warning(selection.error().toString());
                failed = true;
                continue;
            }
            reports.push_back(validator.validate(selection.value()));
        }
    }

    bool all_valid = !failed;
    for (const auto& r : reports) {
        if (!r.valid) all_valid = false;
    }

    if (opts.json) {
        nlohmann::ordered_json j;
        j["ok"] = all_valid;
        j["reports"] = nlohmann::ordered_json::array();
        for (const auto& r : reports) {
            j["reports"].push_back(report_to_json(r));
        }
        j["warnings"] = warnings_to_json(warnings);
        output_json(j);
    } else {
        for (const auto& r : reports) {
            print_report(r);
        }
        print_warning_summary(warnings, opts);
    }

    return all_valid ? 0 : 1;
}

} // anonymous namespace

void setup_validate(CLI::App* app, GlobalOptions& opts) {
    static ValidateOptions val_opts;

    app->add_option("model", val_opts.model, "Model file")->required();
    app->add_option("input", val_opts.input, "Configuration document, or selection record with --selection")
        ->required();
    app->add_option("-k,--keys", val_opts.keys, "Key mapping table; derived from the model when omitted");
    app->add_flag("--selection", val_opts.selection, "Input is a selection record from 'translate'");

    app->callback([&opts]() {
        std::exit(cmd_validate(opts, val_opts));
    });
}

} // namespace schemafm::cli::commands

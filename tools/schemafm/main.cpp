/**
 * schemafm CLI - Entry Point
 *
 * Schema to feature model converter and configuration checker.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace schemafm::cli::commands {
    void setup_generate(CLI::App* app, GlobalOptions& opts);
    void setup_keys(CLI::App* app, GlobalOptions& opts);
    void setup_translate(CLI::App* app, GlobalOptions& opts);
    void setup_validate(CLI::App* app, GlobalOptions& opts);
    void setup_batch(CLI::App* app, GlobalOptions& opts);
    void setup_diff(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace schemafm::cli;

    CLI::App app{"schemafm - schema to feature model converter"};
    app.set_version_flag("-V,--version", SCHEMAFM_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Run configuration (JSON)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging and individual warnings");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    auto* generate_cmd = app.add_subcommand("generate", "Build a feature model from a schema");
    commands::setup_generate(generate_cmd, opts);

    auto* keys_cmd = app.add_subcommand("keys", "Derive the key mapping table of a model");
    commands::setup_keys(keys_cmd, opts);

    auto* translate_cmd = app.add_subcommand("translate", "Translate documents into feature selections");
    commands::setup_translate(translate_cmd, opts);

    auto* validate_cmd = app.add_subcommand("validate", "Validate documents against a model");
    commands::setup_validate(validate_cmd, opts);

    auto* batch_cmd = app.add_subcommand("batch", "Validate a directory of documents");
    commands::setup_batch(batch_cmd, opts);

    auto* diff_cmd = app.add_subcommand("diff", "Compare two models");
    commands::setup_diff(diff_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Lint a model and its key mapping");
    commands::setup_check(check_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}

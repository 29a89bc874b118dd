/**
 * schemafm CLI - generate command
 *
 * Build a feature model from a schema document.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace schemafm::cli::commands {

namespace {

struct GenerateOptions {
    std::string schema;
    std::string output = "model.uvl";
    std::string keys;
    std::vector<std::string> roots;
    std::string namespace_name;
    bool sequential = false;
    bool no_dedup = false;
};

int cmd_generate(const GlobalOptions& opts, const GenerateOptions& gen_opts) {
    init_command(opts);

    RunConfig config;
    if (!load_config(opts, config)) {
        return 1;
    }

    // Command line overrides
    if (!gen_opts.roots.empty()) config.model.roots = gen_opts.roots;
    if (!gen_opts.namespace_name.empty()) config.model.namespace_name = gen_opts.namespace_name;
    if (gen_opts.sequential) config.model.parallel_synthesis = false;
    if (gen_opts.no_dedup) config.model.deduplicate = false;

    WarningCollector warnings(config.warnings);
    auto model = build_model_from_file(gen_opts.schema, pipeline_options_from_config(config), warnings);
    if (model.isErr()) {
        print_warning_summary(warnings, opts);
        print_error(model.error().toString(), opts.json);
        return 1;
    }

    auto saved = save_model(model.value(), gen_opts.output);
    if (saved.isErr()) {
        print_error(saved.error().toString(), opts.json);
        return 1;
    }

    std::size_t key_count = 0;
    if (!gen_opts.keys.empty()) {
        auto entries = derive_key_mapping(model.value());
        // Reports duplicated key paths as ambiguous_key_path
        auto mapper = KeyMapper::build(entries, warnings);
        key_count = mapper.size();
        auto keys_saved = save_key_mapping(entries, gen_opts.keys);
        if (keys_saved.isErr()) {
            print_error(keys_saved.error().toString(), opts.json);
            return 1;
        }
    }

    const auto& m = model.value();
    if (opts.json) {
        nlohmann::ordered_json j;
        j["ok"] = true;
        j["model"] = gen_opts.output;
        j["metadata"] = metadata_path_for(gen_opts.output);
        if (!gen_opts.keys.empty()) {
            j["keys"] = gen_opts.keys;
            j["key_count"] = key_count;
        }
        j["kinds"] = m.kinds().size();
        j["features"] = m.feature_count();
        j["constraints"] = m.constraints.size();
        j["aliases"] = m.aliases.size();
        j["warnings"] = warnings_to_json(warnings);
        output_json(j);
    } else {
        print_warning_summary(warnings, opts);
        std::cout << "Wrote " << gen_opts.output << ": " << m.kinds().size() << " kinds, "
                  << m.feature_count() << " features, " << m.constraints.size() << " constraints"
                  << std::endl;
        if (!gen_opts.keys.empty()) {
            std::cout << "Wrote " << gen_opts.keys << ": " << key_count << " key paths" << std::endl;
        }
    }

    return 0;
}

} // anonymous namespace

void setup_generate(CLI::App* app, GlobalOptions& opts) {
    static GenerateOptions gen_opts;

    app->add_option("schema", gen_opts.schema, "Schema definitions (JSON)")->required();
    app->add_option("-o,--output", gen_opts.output, "Model file to write");
    app->add_option("-k,--keys", gen_opts.keys, "Also write the derived key mapping table");
    app->add_option("--root", gen_opts.roots, "Definition to use as a kind (repeatable)");
    app->add_option("--namespace", gen_opts.namespace_name, "Model namespace / root feature name");
    app->add_flag("--sequential", gen_opts.sequential, "Synthesize kinds on the calling thread");
    app->add_flag("--no-dedup", gen_opts.no_dedup, "Keep repeated subtrees instead of aliasing them");

    app->callback([&opts]() {
        std::exit(cmd_generate(opts, gen_opts));
    });
}

} // namespace schemafm::cli::commands

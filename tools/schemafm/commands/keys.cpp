/**
 * schemafm CLI - keys command
 *
 * Derive the key mapping table of a model, or look up one key path.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace schemafm::cli::commands {

namespace {

struct KeysOptions {
    std::string model;
    std::string output;
    std::string lookup;
    std::string table;
};

int cmd_keys(const GlobalOptions& opts, const KeysOptions& keys_opts) {
    init_command(opts);

    auto model = load_model(keys_opts.model);
    if (model.isErr()) {
        print_error(model.error().toString(), opts.json);
        return 1;
    }

    WarningCollector warnings;
    std::vector<KeyMappingEntry> entries;
    if (keys_opts.table.empty()) {
        entries = derive_key_mapping(model.value());
    } else {
        auto loaded = load_key_mapping_file(keys_opts.table);
        if (loaded.isErr()) {
            print_error(loaded.error().toString(), opts.json);
            return 1;
        }
        entries = std::move(loaded.value());
    }
    auto mapper = KeyMapper::build(entries, warnings);

    if (!keys_opts.lookup.empty()) {
        auto hit = mapper.lookup(keys_opts.lookup);
        if (opts.json) {
            nlohmann::ordered_json j;
            j["key_path"] = keys_opts.lookup;
            switch (hit.status) {
                case LookupStatus::Hit:
                    j["status"] = "hit";
                    j["pattern"] = hit.entry->key_path;
                    j["feature_id"] = hit.entry->feature_id;
                    j["value_kind"] = value_kind_to_string(hit.entry->value_kind);
                    break;
                case LookupStatus::Ambiguous:
                    j["status"] = "ambiguous";
                    j["candidates"] = hit.candidates;
                    break;
                case LookupStatus::Miss:
                    j["status"] = "miss";
                    break;
            }
            output_json(j);
        } else if (hit.status == LookupStatus::Hit) {
            std::cout << hit.entry->feature_id << " (" << value_kind_to_string(hit.entry->value_kind)
                      << ", pattern " << hit.entry->key_path << ")" << std::endl;
        } else if (hit.status == LookupStatus::Ambiguous) {
            std::cout << "ambiguous:";
            for (const auto& c : hit.candidates) std::cout << " " << c;
            std::cout << std::endl;
        } else {
            std::cout << "unmapped" << std::endl;
        }
        return hit.status == LookupStatus::Hit ? 0 : 1;
    }

    if (keys_opts.output.empty()) {
        if (opts.json) {
            nlohmann::ordered_json j;
            j["entries"] = nlohmann::ordered_json::array();
            for (const auto& e : entries) {
                j["entries"].push_back({{"key_path", e.key_path},
                                        {"feature_id", e.feature_id},
                                        {"value_kind", value_kind_to_string(e.value_kind)}});
            }
            j["ambiguous"] = mapper.ambiguous_patterns();
            j["warnings"] = warnings_to_json(warnings);
            output_json(j);
        } else {
            std::cout << serialize_key_mapping(entries);
            print_warning_summary(warnings, opts);
        }
        return 0;
    }

    auto saved = save_key_mapping(entries, keys_opts.output);
    if (saved.isErr()) {
        print_error(saved.error().toString(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::ordered_json j;
        j["ok"] = true;
        j["keys"] = keys_opts.output;
        j["entries"] = entries.size();
        j["ambiguous"] = mapper.ambiguous_patterns();
        output_json(j);
    } else {
        print_warning_summary(warnings, opts);
        print_success("Wrote " + keys_opts.output + ": " + std::to_string(entries.size()) + " key paths",
                      opts.json);
    }
    return 0;
}

} // anonymous namespace

void setup_keys(CLI::App* app, GlobalOptions& opts) {
    static KeysOptions keys_opts;

    app->add_option("model", keys_opts.model, "Model file")->required();
    app->add_option("-o,--output", keys_opts.output, "Table to write (TSV); stdout when omitted");
    app->add_option("--table", keys_opts.table, "Use a curated table instead of deriving one");
    app->add_option("--lookup", keys_opts.lookup, "Resolve one concrete key path");

    app->callback([&opts]() {
        std::exit(cmd_keys(opts, keys_opts));
    });
}

} // namespace schemafm::cli::commands

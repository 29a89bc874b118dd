/**
 * schemafm CLI - check command
 *
 * Re-check a stored model's invariants and its key mapping.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace schemafm::cli::commands {

namespace {

struct CheckOptions {
    std::string model;
    std::string keys;
};

int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts) {
    init_command(opts);

    auto model = load_model(check_opts.model);
    if (model.isErr()) {
        print_error(model.error().toString(), opts.json);
        return 1;
    }

    auto lint = lint_model(model.value());

    WarningCollector warnings;
    KeyMapper mapper;
    if (!load_key_mapper(model.value(), check_opts.keys, warnings, mapper, opts.json)) {
        return 1;
    }

    // Curated tables may point at ids the model no longer has
    std::vector<std::string> dangling_keys;
    for (const auto& e : mapper.entries()) {
        if (!model.value().contains(e.feature_id)) {
            dangling_keys.push_back(e.key_path + " -> " + e.feature_id);
        }
    }

    bool ok = lint.ok && mapper.ambiguous_patterns().empty() && dangling_keys.empty();

    if (opts.json) {
        nlohmann::ordered_json j;
        j["ok"] = ok;
        j["features"] = model.value().feature_count();
        j["constraints"] = model.value().constraints.size();
        j["issues"] = lint.issues;
        j["ambiguous_keys"] = mapper.ambiguous_patterns();
        j["dangling_keys"] = dangling_keys;
        output_json(j);
    } else {
        for (const auto& issue : lint.issues) {
            std::cout << "model: " << issue << std::endl;
        }
        for (const auto& p : mapper.ambiguous_patterns()) {
            std::cout << "keys: ambiguous key path " << p << std::endl;
        }
        for (const auto& d : dangling_keys) {
            std::cout << "keys: unknown feature " << d << std::endl;
        }
        if (ok) {
            std::cout << check_opts.model << ": OK (" << model.value().feature_count() << " features, "
                      << model.value().constraints.size() << " constraints, "
                      << mapper.size() << " key paths)" << std::endl;
        }
    }

    return ok ? 0 : 1;
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;

    app->add_option("model", check_opts.model, "Model file")->required();
    app->add_option("-k,--keys", check_opts.keys, "Key mapping table to check instead of the derived one");

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace schemafm::cli::commands

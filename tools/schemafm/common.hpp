/**
 * schemafm CLI - Common utilities and types
 */

#pragma once

#include <schemafm/schemafm.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace schemafm::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route library logging to stderr so --json output on stdout stays clean.
 * -v enables debug, -q limits logging to errors.
 */
inline void setup_logging(const GlobalOptions& opts) {
    auto logger = spdlog::get("schemafm");
    if (!logger) {
        logger = spdlog::stderr_color_mt("schemafm");
        spdlog::set_default_logger(logger);
    }
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet || opts.json) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Message collector for accumulating CLI-level notes during a command.
 * In JSON mode, messages are collected and output at the end.
 * In text mode, messages are printed immediately to stderr.
 */
struct MessageCollector {
    std::vector<std::string> messages;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            messages.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { messages.clear(); }
    bool empty() const { return messages.empty(); }
};

inline MessageCollector& get_message_collector() {
    static MessageCollector collector;
    return collector;
}

inline void init_command(const GlobalOptions& opts) {
    setup_logging(opts);
    auto& collector = get_message_collector();
    collector.clear();
    collector.json_mode = opts.json;
    collector.quiet = opts.quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_message_collector();
        if (!collector.empty()) {
            j["messages"] = collector.messages;
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_message_collector().add(msg);
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::ordered_json& j) {
    auto& collector = get_message_collector();
    if (!collector.empty() && !j.contains("messages")) {
        nlohmann::ordered_json output = j;
        output["messages"] = collector.messages;
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Library warnings as JSON: [{"key", "action", "fields"}].
 */
inline nlohmann::ordered_json warnings_to_json(const WarningCollector& warnings) {
    auto arr = nlohmann::ordered_json::array();
    for (const auto& w : warnings.get_warnings()) {
        nlohmann::ordered_json entry;
        entry["key"] = w.key;
        entry["action"] = w.action;
        nlohmann::ordered_json fields = nlohmann::ordered_json::object();
        std::map<std::string, std::string> sorted(w.fields.begin(), w.fields.end());
        for (const auto& [k, v] : sorted) {
            fields[k] = v;
        }
        entry["fields"] = fields;
        arr.push_back(entry);
    }
    return arr;
}

/**
 * Per-key warning totals on stderr. Individual warnings only with -v.
 */
inline void print_warning_summary(const WarningCollector& warnings, const GlobalOptions& opts) {
    if (opts.json || opts.quiet) return;

    if (opts.verbose) {
        for (const auto& w : warnings.get_warnings()) {
            std::string detail;
            std::map<std::string, std::string> sorted(w.fields.begin(), w.fields.end());
            for (const auto& [k, v] : sorted) {
                detail += " " + k + "=" + v;
            }
            std::cerr << "  [" << w.action << "] " << w.key << detail << std::endl;
        }
    }

    auto counts = warnings.counts();
    if (counts.empty()) return;
    std::cerr << "Warnings:" << std::endl;
    for (const auto& [key, count] : counts) {
        std::cerr << "  " << key << ": " << count << std::endl;
    }
}

/**
 * Load the run configuration from --config, or the defaults.
 * Returns false (after printing the error) when the file is unusable.
 */
inline bool load_config(const GlobalOptions& opts, RunConfig& config) {
    if (opts.config.empty()) {
        config = get_default_config();
        return true;
    }

    auto result = load_run_config(opts.config);
    if (!result.ok) {
        print_error("Invalid configuration " + opts.config + ": " + result.error, opts.json);
        return false;
    }
    for (const auto& w : result.warnings) {
        print_warning(opts.config + ": " + w);
    }
    config = std::move(result.config);
    return true;
}

/**
 * Key mapping for a model: the curated table when given, else derived.
 */
inline bool load_key_mapper(const FeatureModel& model,
                            const std::string& keys_path,
                            WarningCollector& warnings,
                            KeyMapper& mapper,
                            bool json_mode) {
    std::vector<KeyMappingEntry> entries;
    if (keys_path.empty()) {
        entries = derive_key_mapping(model);
    } else {
        auto loaded = load_key_mapping_file(keys_path);
        if (loaded.isErr()) {
            print_error(loaded.error().toString(), json_mode);
            return false;
        }
        entries = std::move(loaded.value());
    }
    mapper = KeyMapper::build(std::move(entries), warnings);
    return true;
}

} // namespace schemafm::cli

/**
 * schemafm CLI - diff command
 *
 * Compare two models, for example two schema versions.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace schemafm::cli::commands {

namespace {

struct DiffOptions {
    std::string before;
    std::string after;
    std::string output;
};

int cmd_diff(const GlobalOptions& opts, const DiffOptions& diff_opts) {
    init_command(opts);

    auto before = load_model(diff_opts.before);
    if (before.isErr()) {
        print_error(before.error().toString(), opts.json);
        return 1;
    }
    auto after = load_model(diff_opts.after);
    if (after.isErr()) {
        print_error(after.error().toString(), opts.json);
        return 1;
    }

    auto diff = diff_models(before.value(), after.value());

    if (opts.json) {
        nlohmann::ordered_json j;
        j["before"] = diff_opts.before;
        j["after"] = diff_opts.after;
        j["identical"] = diff.empty();
        j["added_features"] = diff.added_features;
        j["removed_features"] = diff.removed_features;
        j["changed_features"] = diff.changed_features;
        j["added_constraints"] = diff.added_constraints;
        j["removed_constraints"] = diff.removed_constraints;
        output_json(j);
        return 0;
    }

    std::string markdown = render_diff_markdown(diff, get_filename(diff_opts.before),
                                                get_filename(diff_opts.after));
    if (diff_opts.output.empty()) {
        std::cout << markdown;
        return 0;
    }

    auto written = atomic_write_file(diff_opts.output, markdown);
    if (!written.ok) {
        print_error(diff_opts.output + ": " + written.error, opts.json);
        return 1;
    }
    print_success("Wrote " + diff_opts.output, opts.json);
    return 0;
}

} // anonymous namespace

void setup_diff(CLI::App* app, GlobalOptions& opts) {
    static DiffOptions diff_opts;

    app->add_option("before", diff_opts.before, "Older model file")->required();
    app->add_option("after", diff_opts.after, "Newer model file")->required();
    app->add_option("-o,--output", diff_opts.output, "Write the Markdown report to a file");

    app->callback([&opts]() {
        std::exit(cmd_diff(opts, diff_opts));
    });
}

} // namespace schemafm::cli::commands

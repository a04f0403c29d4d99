/**
 * cleanpath CLI - clean command
 *
 * Print the canonical form of each path.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>

namespace cleanpath::cli::commands {

namespace {

int cmd_clean(const GlobalOptions& opts, const PathInputOptions& input) {
    init_logging(opts);

    auto paths = collect_paths(input);
    if (!paths) {
        print_error("Failed to read paths from stdin", opts.json);
        return 1;
    }

    nlohmann::json results = nlohmann::json::array();
    for (const auto& path : *paths) {
        std::string cleaned = path;
        clean_path_in_place(cleaned);
        spdlog::debug("'{}' -> '{}'", path, cleaned);

        if (opts.json) {
            results.push_back({{"input", path}, {"clean", cleaned}});
        } else {
            std::cout << cleaned << '\n';
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["paths"] = results;
        output_json(j);
    } else {
        std::cout.flush();
    }
    return 0;
}

} // anonymous namespace

void setup_clean(CLI::App* app, GlobalOptions& opts) {
    static PathInputOptions clean_opts;

    app->add_option("paths", clean_opts.paths, "Paths to canonicalize");
    app->add_flag("--stdin", clean_opts.from_stdin, "Also read newline-separated paths from stdin");

    app->callback([&opts]() {
        std::exit(cmd_clean(opts, clean_opts));
    });
}

} // namespace cleanpath::cli::commands

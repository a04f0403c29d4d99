/**
 * cleanpath CLI - check command
 *
 * Report which paths are not canonical and where a router would redirect
 * them. Exits 1 if any path is not canonical.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>

namespace cleanpath::cli::commands {

namespace {

int cmd_check(const GlobalOptions& opts, const PathInputOptions& input) {
    init_logging(opts);

    auto paths = collect_paths(input);
    if (!paths) {
        print_error("Failed to read paths from stdin", opts.json);
        return 1;
    }

    bool all_clean = true;
    nlohmann::json results = nlohmann::json::array();
    for (const auto& path : *paths) {
        bool canonical = is_clean_path(path);
        std::string cleaned = canonical ? path : clean_path(path);
        if (!canonical) {
            all_clean = false;
            spdlog::info("Not canonical: '{}' (redirect to '{}')", path, cleaned);
        }

        if (opts.json) {
            results.push_back({{"input", path}, {"clean", cleaned}, {"canonical", canonical}});
        } else if (canonical) {
            if (!opts.quiet) {
                std::cout << "ok      " << path << '\n';
            }
        } else {
            std::cout << "unclean " << path << " -> " << cleaned << '\n';
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = all_clean;
        j["paths"] = results;
        output_json(j);
    } else {
        std::cout.flush();
    }
    return all_clean ? 0 : 1;
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static PathInputOptions check_opts;

    app->add_option("paths", check_opts.paths, "Paths to verify");
    app->add_flag("--stdin", check_opts.from_stdin, "Also read newline-separated paths from stdin");

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace cleanpath::cli::commands

/**
 * cleanpath CLI - Entry Point
 *
 * Canonicalize HTTP request paths the way the router sees them.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#include <iostream>

#ifndef CLEANPATH_VERSION
#define CLEANPATH_VERSION "unknown"
#endif

// Forward declarations for commands
namespace cleanpath::cli::commands {
    void setup_clean(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace cleanpath::cli;

    CLI::App app{"cleanpath - canonicalize HTTP request paths"};
    app.set_version_flag("-V,--version", CLEANPATH_VERSION);
    app.require_subcommand(0, 1);
    app.fallthrough();

    GlobalOptions opts;

    // Global options (--json first: it is applied before later options are validated)
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");
    app.add_option("--log-level", opts.log_level, "Log level (overrides -v/-q and CLEANPATH_LOG_LEVEL)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warning", "warn", "error", "err", "critical", "off"}));

    // Commands
    auto* clean_cmd = app.add_subcommand("clean", "Print the canonical form of each path");
    commands::setup_clean(clean_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Report paths that are not canonical");
    commands::setup_check(check_cmd, opts);

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp& e) {
        return app.exit(e);
    } catch (const CLI::CallForVersion& e) {
        return app.exit(e);
    } catch (const CLI::ParseError& e) {
        print_error(e.what(), opts.json);
        return 1;
    }

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}

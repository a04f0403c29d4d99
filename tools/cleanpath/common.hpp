/**
 * cleanpath CLI - Common utilities and types
 */

#pragma once

#include <cleanpath/clean_path.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <optional>
#include <string>
#include <vector>

namespace cleanpath::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
    std::string log_level;         // --log-level
};

/**
 * Options shared by the commands that take a list of paths.
 */
struct PathInputOptions {
    std::vector<std::string> paths;
    bool from_stdin = false;       // --stdin
};

std::string safe_getenv(const char* name);

/**
 * Resolve the log level.
 * Priority: --log-level > -v/-q > CLEANPATH_LOG_LEVEL env > warn
 */
spdlog::level::level_enum resolve_log_level(const GlobalOptions& opts);

/**
 * Install the stderr logger at the resolved level. Log lines never go to
 * stdout, which carries command results.
 */
void init_logging(const GlobalOptions& opts);

/**
 * Collect the paths to process: arguments first, then stdin lines when
 * --stdin is given or no arguments were passed. Returns nullopt when stdin
 * could not be read.
 */
std::optional<std::vector<std::string>> collect_paths(const PathInputOptions& input);

/**
 * Output utilities.
 */
void print_error(const std::string& msg, bool json_mode);
void output_json(const nlohmann::json& j);

} // namespace cleanpath::cli

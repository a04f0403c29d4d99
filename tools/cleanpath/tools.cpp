/**
 * cleanpath CLI - shared helpers
 */

#include "common.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <iostream>

namespace cleanpath::cli {

// Portable getenv that avoids MSVC warnings
std::string safe_getenv(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t sz = 0;
    if (_dupenv_s(&buf, &sz, name) == 0 && buf != nullptr) {
        std::string result(buf);
        free(buf);
        return result;
    }
    return "";
#else
    const char* val = std::getenv(name);
    return val ? val : "";
#endif
}

spdlog::level::level_enum resolve_log_level(const GlobalOptions& opts) {
    // 1. Explicit level
    if (!opts.log_level.empty()) {
        return spdlog::level::from_str(opts.log_level);
    }

    // 2. Verbosity flags
    if (opts.verbose) {
        return spdlog::level::debug;
    }
    if (opts.quiet) {
        return spdlog::level::err;
    }

    // 3. Environment variable
    std::string env_level = safe_getenv("CLEANPATH_LOG_LEVEL");
    if (!env_level.empty()) {
        // from_str maps unknown names to off
        auto level = spdlog::level::from_str(env_level);
        if (level != spdlog::level::off || env_level == "off") {
            return level;
        }
    }

    return spdlog::level::warn;
}

void init_logging(const GlobalOptions& opts) {
    auto logger = spdlog::get("cleanpath");
    if (!logger) {
        logger = spdlog::stderr_color_mt("cleanpath");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%l] %v");
    spdlog::set_level(resolve_log_level(opts));
}

std::optional<std::vector<std::string>> collect_paths(const PathInputOptions& input) {
    std::vector<std::string> paths = input.paths;
    if (!input.from_stdin && !paths.empty()) {
        return paths;
    }

    spdlog::debug("Reading paths from stdin");
    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        paths.push_back(line);
    }
    if (std::cin.bad()) {
        return std::nullopt;
    }
    spdlog::debug("Collected {} path(s)", paths.size());
    return paths;
}

void print_error(const std::string& msg, bool json_mode) {
    spdlog::debug("Command failed: {}", msg);
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        output_json(j);
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

void output_json(const nlohmann::json& j) {
    // Paths are raw bytes; invalid UTF-8 must not abort the dump.
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

} // namespace cleanpath::cli

/**
 * navstack CLI - Common utilities and types
 */

#pragma once

#include <navstack/navstack.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace navstack::cli {

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
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

inline std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

/**
 * Load the effective configuration and set up logging.
 * Logs go to stderr so stdout stays machine-readable.
 */
inline ConfigParseResult load_effective_config(const GlobalOptions& opts) {
    auto logger = spdlog::get("navstack");
    if (!logger) {
        logger = spdlog::stderr_color_mt("navstack");
    }
    spdlog::set_default_logger(logger);

    ConfigParseResult result;
    auto path = resolve_config_path(
        opts.config.empty() ? std::nullopt : std::make_optional(opts.config));
    if (path) {
        result = load_config(*path);
        if (!result.ok) {
            return result;
        }
    } else {
        result.ok = true;
    }

    auto level = result.config.log_level;
    if (opts.verbose) {
        level = spdlog::level::debug;
    } else if (opts.quiet) {
        level = spdlog::level::err;
    }
    spdlog::set_level(level);

    for (const auto& w : result.warnings) {
        spdlog::warn("{}: {}", result.config.source_path, w);
    }
    spdlog::debug("config: {}", path ? *path : std::string("<built-in>"));
    return result;
}

inline nlohmann::json warnings_to_json(const std::vector<WarningObject>& warnings) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& w : warnings) {
        nlohmann::json obj;
        obj["key"] = w.key;
        obj["action"] = w.action;
        obj["fields"] = w.fields;
        arr.push_back(std::move(obj));
    }
    return arr;
}

} // namespace navstack::cli

#pragma once

#include "navstack/export.hpp"
#include "navstack/types.hpp"

#include <spdlog/common.h>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace navstack {

// ============================================================================
// Configuration (navstack.json)
// ============================================================================
//
//   {
//     "log_level": "info",
//     "warnings": { "duplicate_record_key": "error", "pop_at_root": "ignore" }
//   }

struct Config {
    spdlog::level::level_enum log_level = spdlog::level::warn;

    // Warning key -> action; keys not listed resolve to "warn"
    std::unordered_map<std::string, WarningAction> warnings;

    // Source path for diagnostics, empty for built-in defaults
    std::string source_path;
};

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    Config config;
    std::vector<std::string> warnings;
};

/// Log level by spdlog name ("trace" ... "off", plus "warning"/"error"), case-insensitive
NAVSTACK_API std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s);

NAVSTACK_API ConfigParseResult parse_config(const std::string& json_str,
                                            const std::string& source_path = "");

/// Read and parse a config file
NAVSTACK_API ConfigParseResult load_config(const std::string& path);

/**
 * Resolve the config file path.
 * Priority: explicit path > NAVSTACK_CONFIG env > none (built-in defaults)
 */
NAVSTACK_API std::optional<std::string> resolve_config_path(const std::optional<std::string>& override_path);

} // namespace navstack

#include "navstack/config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace navstack {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

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

} // namespace

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "err" || lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config.source_path = source_path;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = "JSON parse error: " + std::string(e.what());
        return result;
    }

    if (!j.is_object()) {
        result.error = "config root must be an object";
        return result;
    }

    if (j.contains("log_level")) {
        if (!j["log_level"].is_string()) {
            result.error = "log_level must be a string";
            return result;
        }
        std::string name = j["log_level"].get<std::string>();
        auto level = parse_log_level(name);
        if (level) {
            result.config.log_level = *level;
        } else {
            result.warnings.push_back("unknown log_level: " + name);
        }
    }

    if (j.contains("warnings")) {
        const auto& warnings = j["warnings"];
        if (!warnings.is_object()) {
            result.error = "warnings must be an object";
            return result;
        }
        for (auto it = warnings.begin(); it != warnings.end(); ++it) {
            if (!parse_warning_key(it.key())) {
                result.warnings.push_back("unknown warning key: " + it.key());
                continue;
            }
            if (!it.value().is_string()) {
                result.warnings.push_back("warnings." + it.key() + " must be a string");
                continue;
            }
            std::string action_name = it.value().get<std::string>();
            auto action = parse_warning_action(action_name);
            if (!action) {
                result.warnings.push_back("invalid action for " + it.key() + ": " + action_name);
                continue;
            }
            result.config.warnings[to_lower(it.key())] = *action;
        }
    }

    result.ok = true;
    return result;
}

ConfigParseResult load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        ConfigParseResult result;
        result.error = "cannot read config: " + path;
        return result;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str(), path);
}

std::optional<std::string> resolve_config_path(const std::optional<std::string>& override_path) {
    if (override_path && !override_path->empty()) {
        return override_path;
    }

    std::string env_path = safe_getenv("NAVSTACK_CONFIG");
    if (!env_path.empty()) {
        return env_path;
    }

    return std::nullopt;
}

} // namespace navstack

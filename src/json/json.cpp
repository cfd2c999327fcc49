#include "navstack/json.hpp"

#include <optional>

namespace navstack {
namespace json {

namespace {

std::optional<NavEventType> parse_op(const std::string& op) {
    if (op == "go_to") return NavEventType::GoTo;
    if (op == "pop") return NavEventType::Pop;
    if (op == "pop_to") return NavEventType::PopTo;
    if (op == "reset_root") return NavEventType::ResetRoot;
    return std::nullopt;
}

} // namespace

// ============================================================================
// Screen
// ============================================================================

ParseResult<Screen> screen_from_json(const json& j) {
    ParseResult<Screen> result;

    if (!j.is_object()) {
        result.error = "screen must be an object";
        return result;
    }
    if (!j.contains("name") || !j["name"].is_string()) {
        result.error = "screen.name must be a string";
        return result;
    }

    result.value.name = j["name"].get<std::string>();
    if (result.value.name.empty()) {
        result.error = "screen.name must not be empty";
        return result;
    }

    if (j.contains("params")) {
        const auto& params = j["params"];
        if (!params.is_object()) {
            result.error = "screen.params must be an object";
            return result;
        }
        for (auto it = params.begin(); it != params.end(); ++it) {
            if (it.value().is_string()) {
                result.value.params[it.key()] = it.value().get<std::string>();
            } else {
                // Scalars are kept in their JSON spelling
                result.value.params[it.key()] = it.value().dump();
                result.warnings.push_back("screen.params." + it.key() + " is not a string");
            }
        }
    }

    result.ok = true;
    return result;
}

ParseResult<Screen> parse_screen(const std::string& json_str) {
    try {
        return screen_from_json(json::parse(json_str));
    } catch (const json::parse_error& e) {
        ParseResult<Screen> result;
        result.error = std::string("JSON parse error: ") + e.what();
        return result;
    }
}

json screen_to_json(const Screen& screen) {
    json j;
    j["name"] = screen.name;
    if (!screen.params.empty()) {
        j["params"] = screen.params;
    }
    return j;
}

// ============================================================================
// Navigation events
// ============================================================================

ParseResult<NavEvent<Screen>> nav_event_from_json(const json& j) {
    ParseResult<NavEvent<Screen>> result;

    if (!j.is_object()) {
        result.error = "event must be an object";
        return result;
    }
    if (!j.contains("op") || !j["op"].is_string()) {
        result.error = "event.op must be a string";
        return result;
    }

    std::string op = j["op"].get<std::string>();
    auto type = parse_op(op);
    if (!type) {
        result.error = "unknown op: " + op;
        return result;
    }
    result.value.type = *type;

    if (*type == NavEventType::Pop) {
        if (j.contains("screen")) {
            result.warnings.push_back("pop ignores screen");
        }
        result.ok = true;
        return result;
    }

    if (!j.contains("screen")) {
        result.error = op + " requires a screen";
        return result;
    }
    auto screen = screen_from_json(j["screen"]);
    if (!screen.ok) {
        result.error = screen.error;
        return result;
    }
    result.value.destination = std::move(screen.value);
    result.warnings = std::move(screen.warnings);
    result.ok = true;
    return result;
}

ParseResult<NavScript> parse_nav_script(const std::string& json_str, const std::string& source_path) {
    ParseResult<NavScript> result;
    const std::string where = source_path.empty() ? std::string("script") : source_path;

    json doc;
    try {
        doc = json::parse(json_str);
    } catch (const json::parse_error& e) {
        result.error = where + ": JSON parse error: " + e.what();
        return result;
    }

    const json* events = &doc;
    if (doc.is_object()) {
        if (!doc.contains("events")) {
            result.error = where + ": missing events array";
            return result;
        }
        events = &doc["events"];
    }
    if (!events->is_array()) {
        result.error = where + ": events must be an array";
        return result;
    }

    for (size_t i = 0; i < events->size(); ++i) {
        auto event = nav_event_from_json((*events)[i]);
        const std::string prefix = where + "[" + std::to_string(i) + "]: ";
        if (!event.ok) {
            result.error = prefix + event.error;
            return result;
        }
        for (const auto& w : event.warnings) {
            result.warnings.push_back(prefix + w);
        }
        result.value.push_back(std::move(event.value));
    }

    result.ok = true;
    return result;
}

json nav_event_to_json(const NavEvent<Screen>& event) {
    json j;
    j["op"] = nav_event_type_to_string(event.type);
    if (event.destination) {
        j["screen"] = screen_to_json(*event.destination);
    }
    return j;
}

// ============================================================================
// Stack dump
// ============================================================================

json stack_to_json(const ScreenBackStack& stack) {
    json j;
    j["version"] = stack.version();
    j["size"] = stack.size();

    json records = json::array();
    for (const auto& record : stack) {
        json r;
        r["key"] = record.key();
        r["screen"] = screen_to_json(record.destination());
        records.push_back(std::move(r));
    }
    j["records"] = std::move(records);
    return j;
}

} // namespace json
} // namespace navstack

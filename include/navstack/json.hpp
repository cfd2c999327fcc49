#pragma once

/**
 * @file json.hpp
 * @brief JSON forms of screens, navigation scripts and stack dumps.
 *
 * Stack dumps are for inspection only; nothing reads them back into a stack.
 *
 * Screen:
 *   { "name": "details", "params": { "id": "42" } }
 *
 * Navigation script (array, or an object with an "events" array):
 *   [ { "op": "go_to", "screen": { "name": "list" } },
 *     { "op": "pop" },
 *     { "op": "pop_to", "screen": { "name": "home" } },
 *     { "op": "reset_root", "screen": { "name": "home" } } ]
 */

#include "navstack/export.hpp"
#include "navstack/navigator.hpp"
#include "navstack/screen.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace navstack {
namespace json {

using json = nlohmann::json;

template <typename T>
struct ParseResult {
    bool ok = false;
    std::string error;
    T value;
    std::vector<std::string> warnings;
};

using NavScript = std::vector<NavEvent<Screen>>;

NAVSTACK_API ParseResult<Screen> screen_from_json(const json& j);
NAVSTACK_API ParseResult<Screen> parse_screen(const std::string& json_str);

NAVSTACK_API ParseResult<NavEvent<Screen>> nav_event_from_json(const json& j);

NAVSTACK_API ParseResult<NavScript> parse_nav_script(const std::string& json_str,
                                                     const std::string& source_path = "");

NAVSTACK_API json screen_to_json(const Screen& screen);
NAVSTACK_API json nav_event_to_json(const NavEvent<Screen>& event);

/// {"version": n, "size": n, "records": [{"key": ..., "screen": ...}, ...]}, top-first
NAVSTACK_API json stack_to_json(const ScreenBackStack& stack);

} // namespace json
} // namespace navstack

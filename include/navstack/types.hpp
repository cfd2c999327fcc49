#pragma once

#include "navstack/export.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace navstack {

// ============================================================================
// Warnings
// ============================================================================

enum class Warning {
    duplicate_record_key,    // Pushed record shares its key with a live record
    pop_at_root,             // Navigator refused to pop the root record
    pop_to_missing,          // Navigator pop_to target is not on the stack
};

// Convert warning enum to canonical lowercase snake_case string
inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::duplicate_record_key: return "duplicate_record_key";
        case Warning::pop_at_root: return "pop_at_root";
        case Warning::pop_to_missing: return "pop_to_missing";
        default: return "unknown";
    }
}

// Parse warning key string to enum (case-insensitive)
NAVSTACK_API std::optional<Warning> parse_warning_key(const std::string& key);

// ============================================================================
// Warning Action
// ============================================================================

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
        default: return "warn";
    }
}

NAVSTACK_API std::optional<WarningAction> parse_warning_action(const std::string& s);

// ============================================================================
// Warning Object
// ============================================================================

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn" | "error"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

} // namespace navstack

#pragma once

#include "navstack/export.hpp"
#include "navstack/types.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace navstack {

// ============================================================================
// Warning Collector
// ============================================================================

/**
 * Accumulates warnings emitted by stacks and navigators.
 *
 * Each warning key resolves to an action: overrides first, then the policy
 * map, then "warn". Ignored warnings are kept internally but never reported.
 * Warn and error level emits are also written to the spdlog default logger.
 */
class NAVSTACK_API WarningCollector {
public:
    WarningCollector() = default;

    explicit WarningCollector(const std::unordered_map<std::string, WarningAction>& policy)
        : policy_(policy) {}

    // Replace the policy map
    void set_policy(const std::unordered_map<std::string, WarningAction>& policy);

    void emit(Warning warning, const std::unordered_map<std::string, std::string>& fields);
    void emit(Warning warning);

    // Emit a warning by key string (for dynamic warning keys)
    void emit(const std::string& warning_key, std::unordered_map<std::string, std::string> fields = {});

    // Override takes precedence over the policy map
    void apply_override(const std::string& warning_key, WarningAction action);

    // All emitted warnings after policy application, ignored ones excluded
    std::vector<WarningObject> get_warnings() const;

    bool has_errors() const;
    bool has_effective_warnings() const;

    // Number of emits for a key, regardless of action
    std::size_t count(Warning warning) const;

    void clear();

private:
    struct CollectedWarning {
        std::string key;
        std::unordered_map<std::string, std::string> fields;
        WarningAction effective_action;
    };

    std::unordered_map<std::string, WarningAction> policy_;
    std::vector<CollectedWarning> warnings_;
    std::unordered_map<std::string, WarningAction> overrides_;

    WarningAction get_effective_action(const std::string& key) const;
};

// ============================================================================
// Field builders for specific warnings
// ============================================================================

namespace warnings {

inline std::unordered_map<std::string, std::string> duplicate_record_key(
    const std::string& key,
    std::size_t depth) {
    return {{"key", key}, {"depth", std::to_string(depth)}};
}

inline std::unordered_map<std::string, std::string> pop_at_root(
    const std::string& root_key) {
    return {{"root_key", root_key}};
}

inline std::unordered_map<std::string, std::string> pop_to_missing(
    std::size_t searched) {
    return {{"searched", std::to_string(searched)}};
}

} // namespace warnings

} // namespace navstack

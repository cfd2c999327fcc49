#include "navstack/warnings.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace navstack {

namespace {

std::string normalize_key(const std::string& key) {
    std::string lower_key = key;
    std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower_key;
}

std::string describe_fields(const std::unordered_map<std::string, std::string>& fields) {
    std::string out;
    for (const auto& [name, value] : fields) {
        if (!out.empty()) {
            out += ", ";
        }
        out += name + "=" + value;
    }
    return out;
}

} // namespace

// ============================================================================
// WarningCollector Implementation
// ============================================================================

void WarningCollector::set_policy(const std::unordered_map<std::string, WarningAction>& policy) {
    policy_.clear();
    for (const auto& [key, action] : policy) {
        policy_[normalize_key(key)] = action;
    }
}

void WarningCollector::emit(Warning warning, const std::unordered_map<std::string, std::string>& fields) {
    emit(warning_to_string(warning), fields);
}

void WarningCollector::emit(Warning warning) {
    emit(warning_to_string(warning), {});
}

void WarningCollector::emit(const std::string& warning_key,
                            std::unordered_map<std::string, std::string> fields) {
    WarningAction action = get_effective_action(warning_key);

    if (action == WarningAction::Error) {
        spdlog::error("{} ({})", warning_key, describe_fields(fields));
    } else if (action == WarningAction::Warn) {
        spdlog::warn("{} ({})", warning_key, describe_fields(fields));
    }

    // Ignored warnings are still collected but marked
    warnings_.push_back({normalize_key(warning_key), std::move(fields), action});
}

void WarningCollector::apply_override(const std::string& warning_key, WarningAction action) {
    overrides_[normalize_key(warning_key)] = action;
}

std::vector<WarningObject> WarningCollector::get_warnings() const {
    std::vector<WarningObject> result;

    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Ignore) {
            continue;
        }

        WarningObject obj;
        obj.key = w.key;
        obj.action = action_to_string(w.effective_action);
        obj.fields = w.fields;
        result.push_back(std::move(obj));
    }

    return result;
}

bool WarningCollector::has_errors() const {
    return std::any_of(warnings_.begin(), warnings_.end(), [](const CollectedWarning& w) {
        return w.effective_action == WarningAction::Error;
    });
}

bool WarningCollector::has_effective_warnings() const {
    return std::any_of(warnings_.begin(), warnings_.end(), [](const CollectedWarning& w) {
        return w.effective_action != WarningAction::Ignore;
    });
}

std::size_t WarningCollector::count(Warning warning) const {
    const std::string key = warning_to_string(warning);
    return static_cast<std::size_t>(std::count_if(
        warnings_.begin(), warnings_.end(),
        [&key](const CollectedWarning& w) { return w.key == key; }));
}

void WarningCollector::clear() {
    warnings_.clear();
}

WarningAction WarningCollector::get_effective_action(const std::string& key) const {
    std::string lower_key = normalize_key(key);

    auto override_it = overrides_.find(lower_key);
    if (override_it != overrides_.end()) {
        return override_it->second;
    }

    auto policy_it = policy_.find(lower_key);
    if (policy_it != policy_.end()) {
        return policy_it->second;
    }

    return WarningAction::Warn;
}

} // namespace navstack

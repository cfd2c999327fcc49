#pragma once

/**
 * @file navigator.hpp
 * @brief Translates navigation intents into BackStack operations.
 *
 * The navigator never pops the root record. Popping at the root hands control
 * to the root-pop callback instead, so the host can close the screen or exit.
 */

#include "navstack/back_stack.hpp"
#include "navstack/record.hpp"
#include "navstack/warnings.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>

namespace navstack {

enum class NavEventType {
    GoTo,
    Pop,
    PopTo,
    ResetRoot
};

inline const char* nav_event_type_to_string(NavEventType t) {
    switch (t) {
        case NavEventType::GoTo: return "go_to";
        case NavEventType::Pop: return "pop";
        case NavEventType::PopTo: return "pop_to";
        case NavEventType::ResetRoot: return "reset_root";
        default: return "unknown";
    }
}

/// A navigation intent; every type except Pop carries a destination
template <typename Destination>
struct NavEvent {
    NavEventType type = NavEventType::Pop;
    std::optional<Destination> destination;

    static NavEvent go_to(Destination d) { return {NavEventType::GoTo, std::move(d)}; }
    static NavEvent pop() { return {NavEventType::Pop, std::nullopt}; }
    static NavEvent pop_to(Destination d) { return {NavEventType::PopTo, std::move(d)}; }
    static NavEvent reset_root(Destination d) { return {NavEventType::ResetRoot, std::move(d)}; }
};

template <typename Destination>
class Navigator {
public:
    using Record = BasicRecord<Destination>;
    using Stack = BackStack<Record>;

    explicit Navigator(Stack& stack, WarningCollector* warnings = nullptr)
        : stack_(stack), warnings_(warnings) {}

    /// Called when pop() is requested while the stack is at its root
    void set_on_root_pop(std::function<void()> callback) { on_root_pop_ = std::move(callback); }

    void go_to(Destination destination) {
        const Record& record = stack_.push(std::move(destination));
        spdlog::debug("navigator go_to key={} depth={}", record.key(), stack_.size());
    }

    /// Pop unless at root; returns the destination that was left
    std::optional<Destination> pop() {
        if (stack_.size() <= 1) {
            if (const Record* root = stack_.top_record()) {
                if (warnings_) {
                    warnings_->emit(Warning::pop_at_root, warnings::pop_at_root(root->key()));
                }
                if (on_root_pop_) {
                    on_root_pop_();
                }
            }
            return std::nullopt;
        }

        std::optional<Record> popped = stack_.pop();
        spdlog::debug("navigator pop key={} depth={}", popped->key(), stack_.size());
        return popped->destination();
    }

    /**
     * @brief Unwind to the top-most record showing `target`.
     *
     * Leaves the stack untouched and returns false when no live record shows
     * the target, so a missing target never drains the history.
     */
    bool pop_to(const Destination& target) {
        bool found = false;
        for (const auto& record : stack_) {
            if (record.destination() == target) {
                found = true;
                break;
            }
        }
        if (!found) {
            if (warnings_) {
                warnings_->emit(Warning::pop_to_missing, warnings::pop_to_missing(stack_.size()));
            }
            return false;
        }

        std::size_t removed = stack_.pop_until(
            [&target](const Record& record) { return record.destination() == target; });
        spdlog::debug("navigator pop_to removed={} depth={}", removed, stack_.size());
        return true;
    }

    /// Clear the history and push `destination` as the new root
    std::size_t reset_root(Destination destination) {
        typename Stack::Batch batch(stack_);
        std::size_t removed = stack_.pop_until([](const Record&) { return false; });
        const Record& root = stack_.push(std::move(destination));
        spdlog::debug("navigator reset_root removed={} root={}", removed, root.key());
        return removed;
    }

    /// Destination currently on top, or nullptr
    const Destination* peek() const {
        const Record* top = stack_.top_record();
        return top ? &top->destination() : nullptr;
    }

    /// Dispatch an event; false when the event carries no destination but needs one
    bool on_nav_event(const NavEvent<Destination>& event) {
        if (event.type != NavEventType::Pop && !event.destination) {
            spdlog::warn("navigator ignored {} event without destination",
                         nav_event_type_to_string(event.type));
            return false;
        }

        switch (event.type) {
            case NavEventType::GoTo:
                go_to(*event.destination);
                return true;
            case NavEventType::Pop:
                pop();
                return true;
            case NavEventType::PopTo:
                pop_to(*event.destination);
                return true;
            case NavEventType::ResetRoot:
                reset_root(*event.destination);
                return true;
        }
        return false;
    }

    const Stack& stack() const { return stack_; }

private:
    Stack& stack_;
    WarningCollector* warnings_;
    std::function<void()> on_root_pop_;
};

} // namespace navstack

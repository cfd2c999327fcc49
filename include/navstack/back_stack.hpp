#pragma once

/**
 * @file back_stack.hpp
 * @brief Navigation history with stack discipline.
 *
 * A BackStack holds records bottom (root) to top. Iteration is top-first:
 * the first element is the current top, the last is the root.
 *
 * @example
 * ```cpp
 * navstack::BackStack<navstack::BasicRecord<std::string>> stack;
 * stack.push("home");
 * stack.push("list");
 * stack.push("details");
 * stack.pop();                                    // removes "details"
 * stack.pop_until([](const auto& r) { return r.destination() == "home"; });
 * // stack.size() == 1, navstack::is_at_root(stack)
 * ```
 *
 * No operation fails. Popping an empty stack yields an empty optional, and
 * pop_until with a predicate that never matches drains the stack and stops.
 *
 * Key uniqueness among live records is the caller's obligation and is not
 * enforced. set_key_audit() reports violations to a WarningCollector without
 * rejecting the push.
 */

#include "navstack/record.hpp"
#include "navstack/warnings.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace navstack {

// ============================================================================
// Generic unwind and queries
// ============================================================================

/**
 * @brief Pop records until the predicate matches the current top.
 *
 * Works with any stack exposing `top_record()` (pointer-like, null when
 * empty) and `pop()`. The predicate is evaluated on the current top before
 * each pop decision and is never called on a record that was already removed.
 *
 * @return Number of records removed
 */
template <typename Stack, typename Predicate>
std::size_t pop_until(Stack& stack, Predicate&& predicate) {
    std::size_t removed = 0;
    for (auto top = stack.top_record(); top != nullptr && !predicate(*top);
         top = stack.top_record()) {
        stack.pop();
        ++removed;
    }
    return removed;
}

/// True if the stack contains no records
template <typename Stack>
bool is_empty(const Stack& stack) {
    return stack.size() == 0;
}

/// True if the stack contains exactly one record
template <typename Stack>
bool is_at_root(const Stack& stack) {
    return stack.size() == 1;
}

// ============================================================================
// Change notifications
// ============================================================================

enum class ChangeKind {
    Push,
    Pop,
    Batch   // Several mutations coalesced by a BackStack::Batch scope
};

inline const char* change_kind_to_string(ChangeKind k) {
    switch (k) {
        case ChangeKind::Push: return "push";
        case ChangeKind::Pop: return "pop";
        case ChangeKind::Batch: return "batch";
        default: return "unknown";
    }
}

/// Published after the stack reached a consistent post-mutation state
struct StackChange {
    ChangeKind kind = ChangeKind::Push;
    std::uint64_t version = 0;
    std::size_t size = 0;
    std::size_t pushed = 0;
    std::size_t popped = 0;
};

// ============================================================================
// BackStack
// ============================================================================

template <typename R>
class BackStack {
    static_assert(is_record_v<R>,
                  "BackStack requires a record type exposing key() and destination()");

public:
    using record_type = R;
    using destination_type = typename record_traits<R>::destination_type;
    using const_iterator = typename std::vector<R>::const_reverse_iterator;
    using Listener = std::function<void(const BackStack&, const StackChange&)>;
    using Subscription = std::size_t;

    /**
     * @brief Coalesces mutations into a single notification.
     *
     * Batches nest; listeners hear one Batch change when the outermost scope
     * closes, and nothing if the scope changed nothing. Listeners run from the
     * destructor here and must not throw.
     */
    class Batch {
    public:
        explicit Batch(BackStack& stack) : stack_(stack) { ++stack_.batch_depth_; }
        ~Batch() { stack_.end_batch(); }

        Batch(const Batch&) = delete;
        Batch& operator=(const Batch&) = delete;

    private:
        BackStack& stack_;
    };

    BackStack() = default;

    // Listeners and the key audit are bound to this instance
    BackStack(const BackStack&) = delete;
    BackStack& operator=(const BackStack&) = delete;

    /// Number of records an iterator will see
    std::size_t size() const { return records_.size(); }

    /// Top-most record, or nullptr when empty
    const R* top_record() const {
        return records_.empty() ? nullptr : &records_.back();
    }

    /// Incremented once per push or pop
    std::uint64_t version() const { return version_; }

    const_iterator begin() const { return records_.crbegin(); }
    const_iterator end() const { return records_.crend(); }

    /// Push a record; it becomes the top of the stack
    const R& push(R record) {
        audit_key(record);
        records_.push_back(std::move(record));
        spdlog::trace("backstack push key={} size={}", records_.back().key(), records_.size());
        record_change(ChangeKind::Push, 1, 0);
        return records_.back();
    }

    /// Wrap a destination in a record with a freshly minted key and push it
    template <typename D,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<D>, R> &&
                                          std::is_constructible_v<R, std::string, D&&>>>
    const R& push(D&& destination) {
        return push(R(generate_record_key(), std::forward<D>(destination)));
    }

    /// Remove and return the top record, or nullopt when empty
    std::optional<R> pop() {
        if (records_.empty()) {
            return std::nullopt;
        }
        std::optional<R> popped(std::move(records_.back()));
        records_.pop_back();
        spdlog::trace("backstack pop key={} size={}", popped->key(), records_.size());
        record_change(ChangeKind::Pop, 0, 1);
        return popped;
    }

    /// navstack::pop_until wrapped in one Batch
    template <typename Predicate>
    std::size_t pop_until(Predicate&& predicate) {
        Batch batch(*this);
        std::size_t removed = navstack::pop_until(*this, std::forward<Predicate>(predicate));
        if (removed > 0) {
            spdlog::debug("backstack unwound {} record(s), size={}", removed, records_.size());
        }
        return removed;
    }

    Subscription subscribe(Listener listener) {
        Subscription id = next_subscription_++;
        listeners_.emplace_back(id, std::move(listener));
        return id;
    }

    bool unsubscribe(Subscription id) {
        for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
            if (it->first == id) {
                listeners_.erase(it);
                return true;
            }
        }
        return false;
    }

    /// Report pushes whose key is already live; nullptr disables the audit
    void set_key_audit(WarningCollector* collector) { audit_ = collector; }

private:
    std::vector<R> records_;  // root first
    std::uint64_t version_ = 0;
    std::vector<std::pair<Subscription, Listener>> listeners_;
    Subscription next_subscription_ = 1;
    WarningCollector* audit_ = nullptr;
    int batch_depth_ = 0;
    StackChange pending_;
    bool has_pending_ = false;

    void audit_key(const R& record) {
        if (audit_ == nullptr) {
            return;
        }
        const std::string key = record.key();
        for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
            if (key == std::string(it->key())) {
                auto depth = static_cast<std::size_t>(std::distance(records_.rbegin(), it));
                audit_->emit(Warning::duplicate_record_key, warnings::duplicate_record_key(key, depth));
                return;
            }
        }
    }

    void record_change(ChangeKind kind, std::size_t pushed, std::size_t popped) {
        ++version_;
        if (batch_depth_ > 0) {
            pending_.kind = ChangeKind::Batch;
            pending_.pushed += pushed;
            pending_.popped += popped;
            has_pending_ = true;
            return;
        }

        StackChange change;
        change.kind = kind;
        change.version = version_;
        change.size = records_.size();
        change.pushed = pushed;
        change.popped = popped;
        publish(change);
    }

    void end_batch() {
        if (--batch_depth_ > 0 || !has_pending_) {
            return;
        }
        StackChange change = pending_;
        change.version = version_;
        change.size = records_.size();
        pending_ = StackChange{};
        has_pending_ = false;
        publish(change);
    }

    void publish(const StackChange& change) {
        // Copy so a listener may unsubscribe itself
        auto listeners = listeners_;
        for (const auto& entry : listeners) {
            entry.second(*this, change);
        }
    }
};

// ============================================================================
// Read helpers
// ============================================================================

/// Destinations in top-first order
template <typename R>
std::vector<typename BackStack<R>::destination_type> destinations(const BackStack<R>& stack) {
    std::vector<typename BackStack<R>::destination_type> result;
    result.reserve(stack.size());
    for (const auto& record : stack) {
        result.push_back(record.destination());
    }
    return result;
}

/// Keys held by more than one live record, in top-first order of first sighting
template <typename R>
std::vector<std::string> find_duplicate_keys(const BackStack<R>& stack) {
    std::unordered_map<std::string, std::size_t> counts;
    for (const auto& record : stack) {
        ++counts[std::string(record.key())];
    }

    std::vector<std::string> duplicates;
    for (const auto& record : stack) {
        std::string key = record.key();
        auto it = counts.find(key);
        if (it != counts.end() && it->second > 1) {
            duplicates.push_back(key);
            counts.erase(it);
        }
    }
    return duplicates;
}

} // namespace navstack

#pragma once

/**
 * @file record.hpp
 * @brief Identity-bearing wrappers around destination descriptors.
 *
 * A record is anything exposing a stable `key()` and a `destination()`.
 * The key identifies the record even when another record wraps an equal
 * destination, so per-record presentation state can be associated with it.
 * A key MUST NOT change for the life of the record.
 *
 * @example
 * ```cpp
 * navstack::BasicRecord<std::string> explicit_key("home-1", "home");
 * navstack::BasicRecord<std::string> minted("details");   // key is a fresh UUID
 * ```
 */

#include "navstack/export.hpp"

#include <string>
#include <type_traits>
#include <utility>

namespace navstack {

/**
 * @brief Mint a record key.
 *
 * Returns a random version 4 UUID string. Keys minted by this function do not
 * collide at any realistic navigation scale.
 */
NAVSTACK_API std::string generate_record_key();

// ============================================================================
// Record capability
// ============================================================================

namespace detail {

template <typename R, typename = void>
struct has_record_members : std::false_type {};

template <typename R>
struct has_record_members<R, std::void_t<
    decltype(std::declval<const R&>().key()),
    decltype(std::declval<const R&>().destination())>>
    : std::is_convertible<decltype(std::declval<const R&>().key()), std::string> {};

} // namespace detail

/// True when R exposes `key()` (convertible to std::string) and `destination()`
template <typename R>
struct is_record : detail::has_record_members<R> {};

template <typename R>
inline constexpr bool is_record_v = is_record<R>::value;

/// Destination type carried by a record type
template <typename R>
struct record_traits {
    using destination_type =
        std::decay_t<decltype(std::declval<const R&>().destination())>;
};

// ============================================================================
// BasicRecord
// ============================================================================

/**
 * @brief Immutable record holding a key and a destination by value.
 */
template <typename Destination>
class BasicRecord {
public:
    using destination_type = Destination;

    /// Wrap a destination with a caller-supplied key. Uniqueness is the caller's job.
    BasicRecord(std::string key, Destination destination)
        : key_(std::move(key)), destination_(std::move(destination)) {}

    /// Wrap a destination with a freshly minted key
    explicit BasicRecord(Destination destination)
        : BasicRecord(generate_record_key(), std::move(destination)) {}

    const std::string& key() const { return key_; }
    const Destination& destination() const { return destination_; }

    friend bool operator==(const BasicRecord& a, const BasicRecord& b) {
        return a.key_ == b.key_ && a.destination_ == b.destination_;
    }
    friend bool operator!=(const BasicRecord& a, const BasicRecord& b) {
        return !(a == b);
    }

private:
    std::string key_;
    Destination destination_;
};

} // namespace navstack

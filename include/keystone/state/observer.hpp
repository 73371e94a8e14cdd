/// @file observer.hpp
/// @brief Path-pattern observers for keystone_state

#pragma once

#include "fwd.hpp"
#include "diff.hpp"
#include "path.hpp"
#include "value.hpp"

#include <compare>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace keystone_state {

// =============================================================================
// ObserverContext
// =============================================================================

/// @brief Extra information passed to every observer call
struct ObserverContext {
    /// Concrete path of the change (never a pattern)
    std::string path;
    /// Whole diff of the transaction being reported
    const Diff& diff;
};

/// @brief Observer callback: (new value, old value, context)
using ObserverCallback = std::function<void(const Value&, const Value&, const ObserverContext&)>;

/// @brief Removes one subscription; idempotent, safe after the registry is gone
using Unsubscribe = std::function<void()>;

// =============================================================================
// SubscriptionId
// =============================================================================

/// @brief Unique identifier for a subscription
struct SubscriptionId {
    std::uint64_t id = 0;

    constexpr SubscriptionId() = default;
    constexpr explicit SubscriptionId(std::uint64_t value) : id(value) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr auto operator<=>(const SubscriptionId&) const noexcept = default;
};

// =============================================================================
// ObserverRegistry
// =============================================================================

/// @brief Ordered list of (pattern, callback) subscriptions
///
/// Callbacks run synchronously in registration order. A callback may observe,
/// unsubscribe or trigger another notification: removed subscriptions never
/// fire again, and subscriptions added mid-notification start with the next
/// diff entry. Exceptions thrown by callbacks propagate to the caller of
/// notify().
class ObserverRegistry {
public:
    ObserverRegistry();

    // Non-copyable
    ObserverRegistry(const ObserverRegistry&) = delete;
    ObserverRegistry& operator=(const ObserverRegistry&) = delete;

    // Movable
    ObserverRegistry(ObserverRegistry&&) = default;
    ObserverRegistry& operator=(ObserverRegistry&&) = default;

    /// @brief Subscribe to an exact path or a "*" pattern
    [[nodiscard]] Unsubscribe observe(std::string_view pattern, ObserverCallback callback);

    /// @brief Deliver every entry of a diff to the matching subscriptions
    void notify(const Diff& diff) const;

    /// @brief Remove all subscriptions
    void clear();

    /// @brief Number of live subscriptions
    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

private:
    struct Subscription {
        SubscriptionId id;
        PathPattern pattern;
        ObserverCallback callback;
        bool active{true};
    };

    struct Subscriptions {
        std::uint64_t next_id{1};
        std::vector<std::shared_ptr<Subscription>> entries;

        void remove(SubscriptionId id);
    };

    std::shared_ptr<Subscriptions> m_subscriptions;
};

} // namespace keystone_state

/// @file observer.cpp
/// @brief Implementation of the observer registry

#include "keystone/state/observer.hpp"

#include <algorithm>

namespace keystone_state {

void ObserverRegistry::Subscriptions::remove(SubscriptionId id) {
    auto it = std::find_if(entries.begin(), entries.end(),
        [id](const auto& sub) { return sub->id == id; });
    if (it != entries.end()) {
        (*it)->active = false;
        entries.erase(it);
    }
}

ObserverRegistry::ObserverRegistry()
    : m_subscriptions(std::make_shared<Subscriptions>()) {}

Unsubscribe ObserverRegistry::observe(std::string_view pattern, ObserverCallback callback) {
    auto subscription = std::make_shared<Subscription>();
    subscription->id = SubscriptionId(m_subscriptions->next_id++);
    subscription->pattern = PathPattern(pattern);
    subscription->callback = std::move(callback);
    m_subscriptions->entries.push_back(subscription);

    std::weak_ptr<Subscriptions> registry = m_subscriptions;
    SubscriptionId id = subscription->id;
    return [registry, id]() {
        if (auto subscriptions = registry.lock()) {
            subscriptions->remove(id);
        }
    };
}

void ObserverRegistry::notify(const Diff& diff) const {
    // Keep the list alive even if a callback clears or replaces the registry
    auto subscriptions = m_subscriptions;
    if (!subscriptions) {
        return;
    }

    for (const auto& entry : diff.entries) {
        if (subscriptions->entries.empty()) {
            continue;
        }

        auto snapshot = subscriptions->entries;
        auto segments = split_path(entry.path);
        ObserverContext context{entry.path, diff};

        for (const auto& subscription : snapshot) {
            if (!subscription->active) continue;

            bool matched = subscription->pattern.is_exact()
                ? subscription->pattern.str() == entry.path
                : subscription->pattern.matches(segments);
            if (matched) {
                subscription->callback(entry.to, entry.from, context);
            }
        }
    }
}

void ObserverRegistry::clear() {
    if (!m_subscriptions) {
        return;
    }
    for (auto& subscription : m_subscriptions->entries) {
        subscription->active = false;
    }
    m_subscriptions->entries.clear();
}

std::size_t ObserverRegistry::size() const noexcept {
    return m_subscriptions ? m_subscriptions->entries.size() : 0;
}

} // namespace keystone_state

/// @file store.hpp
/// @brief GameStore: live state tree, history and observers

#pragma once

#include "fwd.hpp"
#include "config.hpp"
#include "diff.hpp"
#include "mutation.hpp"
#include "observer.hpp"
#include "query.hpp"
#include "transaction.hpp"
#include "value.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace keystone_state {

/// @brief A committed dispatch, kept for replay and debugging
struct TransactionRecord {
    std::chrono::system_clock::time_point timestamp;
    std::vector<Mutation> mutations;
    Diff diff;
};

// =============================================================================
// GameStore
// =============================================================================

/// @brief Owns one live state tree and coordinates every change to it
///
/// The tree is only ever replaced wholesale. A successful dispatch swaps the
/// tree, appends a TransactionRecord, refreshes the component index and then
/// notifies observers. Observers may dispatch again: the outer record is
/// already in the history, so the nested record follows it. Not thread-safe.
class GameStore {
public:
    explicit GameStore(Value initial_state, StoreConfig config = {});

    // Non-copyable
    GameStore(const GameStore&) = delete;
    GameStore& operator=(const GameStore&) = delete;

    // Movable
    GameStore(GameStore&&) = default;
    GameStore& operator=(GameStore&&) = default;

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] const Value& get_state() const noexcept { return m_state; }

    /// @brief Apply mutations atomically; failures are reported, never thrown
    TransactionResult dispatch(std::vector<Mutation> mutations);

    /// @brief Swap the tree without recording history or notifying observers
    void replace_state(Value state);

    [[nodiscard]] const std::vector<TransactionRecord>& get_history() const noexcept { return m_history; }

    [[nodiscard]] const StoreConfig& config() const noexcept { return m_config; }

    // =========================================================================
    // Observers
    // =========================================================================

    [[nodiscard]] Unsubscribe observe(std::string_view pattern, ObserverCallback callback);

    [[nodiscard]] std::size_t observer_count() const noexcept { return m_observers.size(); }

    // =========================================================================
    // Reads
    // =========================================================================

    [[nodiscard]] std::vector<Value> query(std::string_view path, const Filter& filter = {}) const;
    [[nodiscard]] Value get(std::string_view path) const;
    [[nodiscard]] bool has(std::string_view path, const Predicate& predicate = {}) const;

    // =========================================================================
    // Component Index
    // =========================================================================

    /// @brief Index a mapping of entity id -> entity mapping by the entities' keys
    void enable_component_index(std::string_view collection_path);

    [[nodiscard]] bool component_index_enabled() const noexcept { return m_indexed_collection.has_value(); }

    /// @brief Ids of entities carrying a component key (empty when unknown or disabled)
    [[nodiscard]] std::set<std::string> entities_with_component(std::string_view component) const;

private:
    void rebuild_component_index();
    [[nodiscard]] bool touches_component_index(const Diff& diff) const;

    Value m_state;
    StoreConfig m_config;
    ObserverRegistry m_observers;
    std::vector<TransactionRecord> m_history;

    std::optional<std::string> m_indexed_collection;
    std::map<std::string, std::set<std::string>, std::less<>> m_component_index;
};

/// @brief Create a store with default configuration
[[nodiscard]] GameStore create_store(Value initial_state);

/// @brief Create a store; enables the component index when configured
[[nodiscard]] GameStore create_store(Value initial_state, StoreConfig config);

} // namespace keystone_state

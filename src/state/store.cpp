/// @file store.cpp
/// @brief GameStore implementation

#include "keystone/state/store.hpp"

#include <keystone/core/log.hpp>

#include <algorithm>

namespace keystone_state {

namespace {

/// True when path lies strictly below prefix
bool is_path_prefix(const std::string& prefix, const std::string& path) {
    return path.size() > prefix.size() &&
           path.compare(0, prefix.size(), prefix) == 0 &&
           path[prefix.size()] == '.';
}

} // anonymous namespace

GameStore::GameStore(Value initial_state, StoreConfig config)
    : m_state(std::move(initial_state))
    , m_config(std::move(config)) {
    if (m_config.component_index) {
        enable_component_index(*m_config.component_index);
    }
}

// =============================================================================
// State
// =============================================================================

TransactionResult GameStore::dispatch(std::vector<Mutation> mutations) {
    TransactionResult result = transaction(m_state, mutations);

    if (!result.valid) {
        if (m_config.log_failures && result.error) {
            KEYSTONE_LOG_WARN(keystone_core::state_logger(), "[{}] Dispatch rejected: {}",
                m_config.name, keystone_core::build_error_chain(*result.error));
        }
        return result;
    }

    m_state = result.state;

    if (m_config.log_dispatches) {
        keystone_core::log_structured(spdlog::level::debug, "keystone_state", "Dispatch committed", {
            {"store", m_config.name},
            {"mutations", std::to_string(mutations.size())},
            {"changes", std::to_string(result.diff.size())},
            {"history", std::to_string(m_history.size() + 1)},
        });
    }

    m_history.push_back(TransactionRecord{
        std::chrono::system_clock::now(),
        std::move(mutations),
        result.diff,
    });

    if (m_indexed_collection && touches_component_index(result.diff)) {
        rebuild_component_index();
    }

    m_observers.notify(result.diff);

    return result;
}

void GameStore::replace_state(Value state) {
    KEYSTONE_LOG_TRACE(keystone_core::state_logger(), "[{}] State replaced", m_config.name);

    m_state = std::move(state);
    if (m_indexed_collection) {
        rebuild_component_index();
    }
}

// =============================================================================
// Observers
// =============================================================================

Unsubscribe GameStore::observe(std::string_view pattern, ObserverCallback callback) {
    return m_observers.observe(pattern, std::move(callback));
}

// =============================================================================
// Reads
// =============================================================================

std::vector<Value> GameStore::query(std::string_view path, const Filter& filter) const {
    return keystone_state::query(m_state, path, filter);
}

Value GameStore::get(std::string_view path) const {
    return keystone_state::get(m_state, path);
}

bool GameStore::has(std::string_view path, const Predicate& predicate) const {
    return keystone_state::has(m_state, path, predicate);
}

// =============================================================================
// Component Index
// =============================================================================

void GameStore::enable_component_index(std::string_view collection_path) {
    m_indexed_collection = std::string(collection_path);
    rebuild_component_index();
}

std::set<std::string> GameStore::entities_with_component(std::string_view component) const {
    auto it = m_component_index.find(component);
    if (it == m_component_index.end()) {
        return {};
    }
    return it->second;
}

void GameStore::rebuild_component_index() {
    KEYSTONE_LOG_SCOPE("GameStore::rebuild_component_index", "keystone_state");

    m_component_index.clear();
    if (!m_indexed_collection) {
        return;
    }

    Value collection = keystone_state::get(m_state, *m_indexed_collection);
    if (!collection.is_mapping()) {
        return;
    }

    for (const auto& [entity_id, entity] : collection.as_mapping()) {
        if (!entity.is_mapping()) continue;
        for (const auto& [component, value] : entity.as_mapping()) {
            m_component_index[component].insert(entity_id);
        }
    }

    KEYSTONE_LOG_TRACE(keystone_core::state_logger(), "[{}] Component index rebuilt for '{}': {} components",
        m_config.name, *m_indexed_collection, m_component_index.size());
}

bool GameStore::touches_component_index(const Diff& diff) const {
    const std::string& collection = *m_indexed_collection;
    return std::any_of(diff.entries.begin(), diff.entries.end(), [&collection](const DiffEntry& entry) {
        if (entry.path == collection || entry.path == "root") {
            return true;
        }
        // Inside the collection or replacing one of its ancestors
        return is_path_prefix(collection, entry.path) || is_path_prefix(entry.path, collection);
    });
}

// =============================================================================
// Factory
// =============================================================================

GameStore create_store(Value initial_state) {
    return GameStore(std::move(initial_state));
}

GameStore create_store(Value initial_state, StoreConfig config) {
    return GameStore(std::move(initial_state), std::move(config));
}

} // namespace keystone_state

/// @file config.hpp
/// @brief Store configuration for keystone_state

#pragma once

#include "fwd.hpp"

#include <keystone/core/error.hpp>
#include <keystone/core/log.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace keystone_state {

/// @brief Configuration of a GameStore and the logging it should run with
///
/// @code{.json}
/// {
///   "store": { "name": "dungeon", "log_dispatches": true, "component_index": "entities" },
///   "logging": { "level": "debug", "console": true, "file": false }
/// }
/// @endcode
struct StoreConfig {
    /// Name used in log lines
    std::string name = "game";
    /// Log every committed dispatch at debug level
    bool log_dispatches = false;
    /// Log failed dispatches at warn level
    bool log_failures = true;
    /// Collection to index by component at store creation
    std::optional<std::string> component_index;
    /// Settings for keystone_core::configure_logging(). Loggers are process-wide,
    /// so GameStore never applies them; call apply_logging() once at startup.
    keystone_core::LogConfig logging;

    /// Reconfigure every keystone logger from the logging section
    void apply_logging() const;

    /// Parse from a JSON document (all fields optional)
    [[nodiscard]] static keystone_core::Result<StoreConfig> from_json(const nlohmann::json& j);

    /// Parse from JSON text
    [[nodiscard]] static keystone_core::Result<StoreConfig> from_json_string(const std::string& json_str);

    /// Load from a JSON file
    [[nodiscard]] static keystone_core::Result<StoreConfig> load(const std::filesystem::path& path);
};

} // namespace keystone_state

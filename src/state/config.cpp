/// @file config.cpp
/// @brief StoreConfig JSON loading

#include "keystone/state/config.hpp"

#include <fstream>
#include <sstream>

namespace keystone_state {

namespace {

using keystone_core::Error;
using keystone_core::ErrorCode;

Error wrong_type(const std::string& field, const char* expected) {
    return Error(ErrorCode::ParseError, "Field '" + field + "' must be " + expected);
}

std::optional<Error> read_bool(const nlohmann::json& section, const std::string& prefix,
                               const char* key, bool& out) {
    if (!section.contains(key)) return std::nullopt;
    const auto& value = section[key];
    if (!value.is_boolean()) return wrong_type(prefix + "." + key, "a boolean");
    out = value.get<bool>();
    return std::nullopt;
}

std::optional<Error> read_string(const nlohmann::json& section, const std::string& prefix,
                                 const char* key, std::string& out) {
    if (!section.contains(key)) return std::nullopt;
    const auto& value = section[key];
    if (!value.is_string()) return wrong_type(prefix + "." + key, "a string");
    out = value.get<std::string>();
    return std::nullopt;
}

std::optional<Error> read_size(const nlohmann::json& section, const std::string& prefix,
                               const char* key, std::size_t& out) {
    if (!section.contains(key)) return std::nullopt;
    const auto& value = section[key];
    if (!value.is_number_unsigned()) return wrong_type(prefix + "." + key, "a non-negative integer");
    out = value.get<std::size_t>();
    return std::nullopt;
}

std::optional<Error> parse_store_section(const nlohmann::json& store, StoreConfig& config) {
    if (auto err = read_string(store, "store", "name", config.name)) return err;
    if (auto err = read_bool(store, "store", "log_dispatches", config.log_dispatches)) return err;
    if (auto err = read_bool(store, "store", "log_failures", config.log_failures)) return err;

    if (store.contains("component_index") && !store["component_index"].is_null()) {
        std::string collection;
        if (auto err = read_string(store, "store", "component_index", collection)) return err;
        config.component_index = std::move(collection);
    }
    return std::nullopt;
}

std::optional<Error> parse_logging_section(const nlohmann::json& logging, keystone_core::LogConfig& config) {
    if (logging.contains("level")) {
        std::string level_name;
        if (auto err = read_string(logging, "logging", "level", level_name)) return err;
        auto level = keystone_core::parse_log_level(level_name);
        if (!level) {
            return Error(ErrorCode::ValidationError, "Unknown log level: " + level_name);
        }
        config.level = *level;
    }

    if (auto err = read_bool(logging, "logging", "console", config.console_enabled)) return err;
    if (auto err = read_bool(logging, "logging", "file", config.file_enabled)) return err;
    if (auto err = read_string(logging, "logging", "directory", config.log_directory)) return err;
    if (auto err = read_size(logging, "logging", "max_file_size", config.max_file_size)) return err;
    if (auto err = read_size(logging, "logging", "max_files", config.max_files)) return err;

    if (config.file_enabled && config.log_directory.empty()) {
        return Error(ErrorCode::ValidationError,
            "Field 'logging.directory' is required when file logging is enabled");
    }
    return std::nullopt;
}

} // anonymous namespace

keystone_core::Result<StoreConfig> StoreConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return keystone_core::Err<StoreConfig>(
            Error(ErrorCode::ParseError, "Store configuration must be a JSON object"));
    }

    StoreConfig config;

    if (j.contains("store")) {
        const auto& store = j["store"];
        if (!store.is_object()) {
            return keystone_core::Err<StoreConfig>(wrong_type("store", "an object"));
        }
        if (auto err = parse_store_section(store, config)) {
            return keystone_core::Err<StoreConfig>(std::move(*err));
        }
    }

    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        if (!logging.is_object()) {
            return keystone_core::Err<StoreConfig>(wrong_type("logging", "an object"));
        }
        if (auto err = parse_logging_section(logging, config.logging)) {
            return keystone_core::Err<StoreConfig>(std::move(*err));
        }
    }

    return keystone_core::Ok(std::move(config));
}

void StoreConfig::apply_logging() const {
    keystone_core::configure_logging(logging);
}

keystone_core::Result<StoreConfig> StoreConfig::from_json_string(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return keystone_core::Err<StoreConfig>(
            Error(ErrorCode::ParseError, std::string("JSON parse error: ") + e.what()));
    }
    return from_json(j);
}

keystone_core::Result<StoreConfig> StoreConfig::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return keystone_core::Err<StoreConfig>(
            Error(ErrorCode::NotFound, "Store config file not found: " + path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return keystone_core::Err<StoreConfig>(
            Error(ErrorCode::IOError, "Failed to open store config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = from_json_string(buffer.str());
    if (!result) {
        return keystone_core::Err<StoreConfig>(
            Error(result.error()).with_context("file", path.string()));
    }
    return result;
}

} // namespace keystone_state

/// @file value.cpp
/// @brief Implementation of the state-tree value model

#include "keystone/state/value.hpp"

#include <algorithm>
#include <cmath>

namespace keystone_state {

const char* value_kind_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::Undefined: return "undefined";
        case ValueKind::Null: return "null";
        case ValueKind::Bool: return "boolean";
        case ValueKind::Number: return "number";
        case ValueKind::String: return "string";
        case ValueKind::Sequence: return "sequence";
        case ValueKind::Mapping: return "mapping";
        default: return "unknown";
    }
}

// =============================================================================
// JSON Conversion Helpers
// =============================================================================

namespace {

template<typename Json>
Value value_from_json(const Json& j) {
    switch (j.type()) {
        case Json::value_t::null:
            return Value(nullptr);
        case Json::value_t::boolean:
            return Value(j.template get<bool>());
        case Json::value_t::number_integer:
            return Value(j.template get<std::int64_t>());
        case Json::value_t::number_unsigned:
            return Value(j.template get<std::uint64_t>());
        case Json::value_t::number_float:
            return Value(j.template get<double>());
        case Json::value_t::string:
            return Value(j.template get<std::string>());
        case Json::value_t::array: {
            Sequence items;
            items.reserve(j.size());
            for (const auto& item : j) {
                items.push_back(value_from_json(item));
            }
            return Value(std::move(items));
        }
        case Json::value_t::object: {
            Mapping mapping;
            for (auto it = j.begin(); it != j.end(); ++it) {
                mapping.set(it.key(), value_from_json(it.value()));
            }
            return Value(std::move(mapping));
        }
        default:
            return Value();
    }
}

nlohmann::ordered_json number_to_json(double n) {
    constexpr double k_max_exact = 9007199254740992.0;  // 2^53
    if (std::isfinite(n) && std::floor(n) == n && std::fabs(n) <= k_max_exact) {
        return static_cast<std::int64_t>(n);
    }
    return n;
}

} // anonymous namespace

// =============================================================================
// Value
// =============================================================================

Value::Value(Sequence sequence)
    : m_data(std::make_shared<const Sequence>(std::move(sequence))) {}

Value::Value(Mapping mapping)
    : m_data(std::make_shared<const Mapping>(std::move(mapping))) {}

Value::Value(SequencePtr sequence)
    : m_data(sequence ? std::move(sequence) : std::make_shared<const Sequence>()) {}

Value::Value(MappingPtr mapping)
    : m_data(mapping ? std::move(mapping) : std::make_shared<const Mapping>()) {}

Value Value::array(std::initializer_list<Value> items) {
    return Value(Sequence(items));
}

Value Value::object(std::initializer_list<std::pair<std::string, Value>> entries) {
    Mapping mapping;
    for (const auto& [key, value] : entries) {
        mapping.set(key, value);
    }
    return Value(std::move(mapping));
}

Value Value::from_json(const nlohmann::json& j) {
    return value_from_json(j);
}

Value Value::from_json(const nlohmann::ordered_json& j) {
    return value_from_json(j);
}

nlohmann::ordered_json Value::to_json() const {
    switch (kind()) {
        case ValueKind::Undefined:
        case ValueKind::Null:
            return nullptr;
        case ValueKind::Bool:
            return std::get<bool>(m_data);
        case ValueKind::Number:
            return number_to_json(std::get<double>(m_data));
        case ValueKind::String:
            return std::get<std::string>(m_data);
        case ValueKind::Sequence: {
            auto arr = nlohmann::ordered_json::array();
            for (const auto& item : as_sequence()) {
                arr.push_back(item.to_json());
            }
            return arr;
        }
        case ValueKind::Mapping: {
            auto obj = nlohmann::ordered_json::object();
            for (const auto& [key, value] : as_mapping()) {
                obj[key] = value.to_json();
            }
            return obj;
        }
    }
    return nullptr;
}

std::string Value::to_string() const {
    if (is_undefined()) {
        return "undefined";
    }
    return to_json().dump();
}

void Value::kind_mismatch(ValueKind expected) const {
    throw ValueError(std::string("Expected ") + value_kind_name(expected) +
                     ", got " + value_kind_name(kind()));
}

bool Value::as_bool() const {
    if (!is_bool()) kind_mismatch(ValueKind::Bool);
    return std::get<bool>(m_data);
}

double Value::as_number() const {
    if (!is_number()) kind_mismatch(ValueKind::Number);
    return std::get<double>(m_data);
}

std::int64_t Value::as_int() const {
    return static_cast<std::int64_t>(as_number());
}

const std::string& Value::as_string() const {
    if (!is_string()) kind_mismatch(ValueKind::String);
    return std::get<std::string>(m_data);
}

const Sequence& Value::as_sequence() const {
    return *sequence_ptr();
}

const Mapping& Value::as_mapping() const {
    return *mapping_ptr();
}

const Value::SequencePtr& Value::sequence_ptr() const {
    if (!is_sequence()) kind_mismatch(ValueKind::Sequence);
    return std::get<SequencePtr>(m_data);
}

const Value::MappingPtr& Value::mapping_ptr() const {
    if (!is_mapping()) kind_mismatch(ValueKind::Mapping);
    return std::get<MappingPtr>(m_data);
}

Value Value::field(std::string_view key) const {
    if (!is_mapping()) return Value();
    const Value* child = as_mapping().find(key);
    return child ? *child : Value();
}

Value Value::item(std::size_t index) const {
    if (!is_sequence()) return Value();
    const auto& items = as_sequence();
    return index < items.size() ? items[index] : Value();
}

std::size_t Value::size() const noexcept {
    if (const auto* seq = std::get_if<SequencePtr>(&m_data)) {
        return (*seq)->size();
    }
    if (const auto* map = std::get_if<MappingPtr>(&m_data)) {
        return (*map)->size();
    }
    return 0;
}

bool Value::same(const Value& other) const noexcept {
    if (m_data.index() != other.m_data.index()) {
        return false;
    }
    switch (kind()) {
        case ValueKind::Undefined:
        case ValueKind::Null:
            return true;
        case ValueKind::Bool:
            return std::get<bool>(m_data) == std::get<bool>(other.m_data);
        case ValueKind::Number:
            return std::get<double>(m_data) == std::get<double>(other.m_data);
        case ValueKind::String:
            return std::get<std::string>(m_data) == std::get<std::string>(other.m_data);
        case ValueKind::Sequence:
            return std::get<SequencePtr>(m_data) == std::get<SequencePtr>(other.m_data);
        case ValueKind::Mapping:
            return std::get<MappingPtr>(m_data) == std::get<MappingPtr>(other.m_data);
    }
    return false;
}

bool Value::operator==(const Value& other) const {
    if (same(other)) {
        return true;
    }
    if (kind() != other.kind()) {
        return false;
    }
    if (is_sequence()) {
        return as_sequence() == other.as_sequence();
    }
    if (is_mapping()) {
        return as_mapping() == other.as_mapping();
    }
    return false;
}

// =============================================================================
// Mapping
// =============================================================================

Mapping::Mapping(std::initializer_list<Entry> entries) {
    for (const auto& [key, value] : entries) {
        set(key, value);
    }
}

const Value* Mapping::find(std::string_view key) const {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
        [key](const Entry& entry) { return entry.first == key; });
    return it != m_entries.end() ? &it->second : nullptr;
}

void Mapping::set(std::string key, Value value) {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
        [&key](const Entry& entry) { return entry.first == key; });
    if (it != m_entries.end()) {
        it->second = std::move(value);
        return;
    }
    m_entries.emplace_back(std::move(key), std::move(value));
}

bool Mapping::erase(std::string_view key) {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
        [key](const Entry& entry) { return entry.first == key; });
    if (it == m_entries.end()) {
        return false;
    }
    m_entries.erase(it);
    return true;
}

bool Mapping::operator==(const Mapping& other) const {
    if (size() != other.size()) {
        return false;
    }
    for (const auto& [key, value] : m_entries) {
        const Value* theirs = other.find(key);
        if (!theirs || !(value == *theirs)) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// Helpers
// =============================================================================

Value parse_value(std::string_view json_text) {
    return Value::from_json(nlohmann::ordered_json::parse(json_text));
}

} // namespace keystone_state

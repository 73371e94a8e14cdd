#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for keystone_core module

#include <cstdint>

namespace keystone_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct TransactionError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace keystone_core

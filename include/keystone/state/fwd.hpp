/// @file fwd.hpp
/// @brief Forward declarations for keystone_state module

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace keystone_state {

// =============================================================================
// Value Model
// =============================================================================

enum class ValueKind : std::uint8_t;
struct Undefined;
class Value;
class Mapping;

/// @brief Ordered sequence of values
using Sequence = std::vector<Value>;

// =============================================================================
// Paths
// =============================================================================

struct PathSegment;
class Path;
class PathPattern;

// =============================================================================
// Mutations & Transactions
// =============================================================================

enum class MutationType : std::uint8_t;
class Mutation;
struct DiffEntry;
struct Diff;
struct Effect;
struct TransactionResult;

// =============================================================================
// Queries
// =============================================================================

class Predicate;
class FieldMatcher;
class Filter;
struct Vec2;

// =============================================================================
// Observers & Store
// =============================================================================

struct ObserverContext;
class ObserverRegistry;
struct TransactionRecord;
struct StoreConfig;
class GameStore;

// =============================================================================
// Random
// =============================================================================

struct PrngState;
struct DiceSpec;
class Rng;

} // namespace keystone_state

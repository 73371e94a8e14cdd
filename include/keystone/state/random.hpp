/// @file random.hpp
/// @brief Deterministic, serializable random numbers (xoshiro128**)

#pragma once

#include "fwd.hpp"
#include "value.hpp"

#include <keystone/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace keystone_state {

// =============================================================================
// PrngState
// =============================================================================

/// @brief Four-word xoshiro128** state plus the seed it was created from
///
/// Plain data: it can be copied, compared and stored in the state tree
/// with to_value(). Every function below returns the advanced state instead
/// of modifying its argument.
struct PrngState {
    std::int32_t seed{0};
    std::uint32_t s0{0};
    std::uint32_t s1{0};
    std::uint32_t s2{0};
    std::uint32_t s3{0};

    bool operator==(const PrngState&) const = default;
};

/// @brief Seed through splitmix32
[[nodiscard]] PrngState seed_prng(std::int32_t seed);

/// @brief Uniform double in [0, 1)
[[nodiscard]] std::pair<double, PrngState> random_float(const PrngState& state);

/// @brief Uniform integer in [min, max] (inclusive)
[[nodiscard]] std::pair<std::int32_t, PrngState> random_int(const PrngState& state,
                                                           std::int32_t min, std::int32_t max);

/// @brief Pick one element
/// @throws std::invalid_argument for an empty vector
template<typename T>
[[nodiscard]] std::pair<T, PrngState> random_pick(const PrngState& state, const std::vector<T>& items) {
    if (items.empty()) {
        throw std::invalid_argument("random_pick requires at least one item");
    }
    auto [index, next] = random_int(state, 0, static_cast<std::int32_t>(items.size()) - 1);
    return {items[static_cast<std::size_t>(index)], next};
}

/// @brief Fisher-Yates shuffle of a copy
template<typename T>
[[nodiscard]] std::pair<std::vector<T>, PrngState> shuffle(const PrngState& state, std::vector<T> items) {
    PrngState current = state;
    for (std::size_t i = items.size(); i-- > 1;) {
        auto [j, next] = random_int(current, 0, static_cast<std::int32_t>(i));
        current = next;
        std::swap(items[i], items[static_cast<std::size_t>(j)]);
    }
    return {std::move(items), current};
}

// =============================================================================
// Dice
// =============================================================================

/// @brief Parsed "NdS+M" notation
struct DiceSpec {
    std::int32_t count{1};
    std::int32_t sides{6};
    std::int32_t modifier{0};

    bool operator==(const DiceSpec&) const = default;
};

/// @brief Parse "NdS", "NdS+M" or "NdS-M"
///
/// ParseError for malformed notation, ValidationError when the total could
/// leave the std::int32_t range.
[[nodiscard]] keystone_core::Result<DiceSpec> parse_dice(std::string_view notation);

/// @brief Sum of count rolls of 1..sides plus the modifier
/// @throws std::invalid_argument when the total could leave the std::int32_t range
[[nodiscard]] std::pair<std::int32_t, PrngState> roll_dice(const PrngState& state, const DiceSpec& spec);

// =============================================================================
// Serialization
// =============================================================================

/// @brief {"seed", "s0", "s1", "s2", "s3"} mapping
[[nodiscard]] Value to_value(const PrngState& state);

/// @brief Inverse of to_value(); ParseError on a malformed mapping
[[nodiscard]] keystone_core::Result<PrngState> prng_from_value(const Value& value);

// =============================================================================
// Rng
// =============================================================================

/// @brief Mutable wrapper that advances its own PrngState
///
/// Produces exactly the sequences of the pure functions above.
class Rng {
public:
    explicit Rng(std::int32_t seed) : m_state(seed_prng(seed)) {}
    explicit Rng(const PrngState& state) : m_state(state) {}

    std::int32_t next_int(std::int32_t min, std::int32_t max);
    double next_float();

    template<typename T>
    T pick(const std::vector<T>& items) {
        auto [item, next] = random_pick(m_state, items);
        m_state = next;
        return item;
    }

    template<typename T>
    std::vector<T> shuffle(std::vector<T> items) {
        auto [shuffled, next] = keystone_state::shuffle(m_state, std::move(items));
        m_state = next;
        return shuffled;
    }

    std::int32_t roll(const DiceSpec& spec);

    /// @brief Parse and roll; the state is untouched on a parse error
    keystone_core::Result<std::int32_t> roll(std::string_view notation);

    [[nodiscard]] const PrngState& snapshot() const noexcept { return m_state; }
    void restore(const PrngState& state) noexcept { m_state = state; }

    /// @brief Independent child seeded from this generator (advances it once)
    [[nodiscard]] Rng fork();

private:
    PrngState m_state;
};

} // namespace keystone_state

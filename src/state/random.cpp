/// @file random.cpp
/// @brief xoshiro128** generator and dice rolling

#include "keystone/state/random.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <regex>
#include <stdexcept>
#include <string>

namespace keystone_state {

// =============================================================================
// xoshiro128**
// =============================================================================

namespace {

constexpr double k_two_pow_32 = 4294967296.0;

constexpr std::uint32_t rotl(std::uint32_t x, int k) {
    return (x << k) | (x >> (32 - k));
}

struct SplitMix {
    std::uint32_t value;
    std::uint32_t state;
};

constexpr SplitMix splitmix32(std::uint32_t state) {
    state += 0x9e3779b9u;
    std::uint32_t z = state;
    z = (z ^ (z >> 16)) * 0x85ebca6bu;
    z = (z ^ (z >> 13)) * 0xc2b2ae35u;
    z = z ^ (z >> 16);
    return {z, state};
}

constexpr std::uint32_t output(const PrngState& state) {
    return rotl(state.s1 * 5u, 7) * 9u;
}

constexpr PrngState advance(const PrngState& state) {
    const std::uint32_t t = state.s1 << 9;

    std::uint32_t s2 = state.s2 ^ state.s0;
    std::uint32_t s3 = state.s3 ^ state.s1;
    const std::uint32_t s1 = state.s1 ^ s2;
    const std::uint32_t s0 = state.s0 ^ s3;

    s2 ^= t;
    s3 = rotl(s3, 11);

    return PrngState{state.seed, s0, s1, s2, s3};
}

/// Every possible total of spec fits in std::int32_t
bool dice_total_fits(const DiceSpec& spec) {
    const std::int64_t count = std::max<std::int32_t>(spec.count, 0);
    const std::int64_t lowest = count * std::min<std::int32_t>(spec.sides, 1) + spec.modifier;
    const std::int64_t highest = count * std::max<std::int32_t>(spec.sides, 1) + spec.modifier;
    return lowest >= std::numeric_limits<std::int32_t>::min() &&
           highest <= std::numeric_limits<std::int32_t>::max();
}

} // anonymous namespace

PrngState seed_prng(std::int32_t seed) {
    PrngState state;
    state.seed = seed;

    auto first = splitmix32(static_cast<std::uint32_t>(seed));
    auto second = splitmix32(first.state);
    auto third = splitmix32(second.state);
    auto fourth = splitmix32(third.state);

    state.s0 = first.value;
    state.s1 = second.value;
    state.s2 = third.value;
    state.s3 = fourth.value;
    return state;
}

std::pair<double, PrngState> random_float(const PrngState& state) {
    return {static_cast<double>(output(state)) / k_two_pow_32, advance(state)};
}

std::pair<std::int32_t, PrngState> random_int(const PrngState& state, std::int32_t min, std::int32_t max) {
    auto [f, next] = random_float(state);
    double range = static_cast<double>(max) - static_cast<double>(min) + 1.0;
    auto value = static_cast<std::int32_t>(static_cast<double>(min) + std::floor(f * range));
    return {value, next};
}

// =============================================================================
// Dice
// =============================================================================

keystone_core::Result<DiceSpec> parse_dice(std::string_view notation) {
    static const std::regex dice_regex(R"(^(\d+)d(\d+)([+-]\d+)?$)");

    std::string text(notation);
    std::smatch match;
    if (!std::regex_match(text, match, dice_regex)) {
        return keystone_core::Err<DiceSpec>(keystone_core::Error(keystone_core::ErrorCode::ParseError,
            "Invalid dice notation: \"" + text + "\". Expected format: NdS or NdS+M (e.g. \"2d6+3\")"));
    }

    try {
        DiceSpec spec;
        spec.count = std::stoi(match[1].str());
        spec.sides = std::stoi(match[2].str());
        spec.modifier = match[3].matched ? std::stoi(match[3].str()) : 0;
        if (!dice_total_fits(spec)) {
            return keystone_core::Err<DiceSpec>(keystone_core::Error(keystone_core::ErrorCode::ValidationError,
                "Dice total out of range: \"" + text + "\""));
        }
        return keystone_core::Ok(spec);
    } catch (const std::out_of_range&) {
        return keystone_core::Err<DiceSpec>(keystone_core::Error(keystone_core::ErrorCode::ParseError,
            "Dice notation out of range: \"" + text + "\""));
    }
}

std::pair<std::int32_t, PrngState> roll_dice(const PrngState& state, const DiceSpec& spec) {
    if (!dice_total_fits(spec)) {
        throw std::invalid_argument("roll_dice: total of " + std::to_string(spec.count) + "d" +
                                    std::to_string(spec.sides) + " with modifier " +
                                    std::to_string(spec.modifier) + " does not fit in 32 bits");
    }

    std::int64_t total = spec.modifier;
    PrngState current = state;

    for (std::int32_t i = 0; i < spec.count; ++i) {
        auto [roll, next] = random_int(current, 1, spec.sides);
        total += roll;
        current = next;
    }

    return {static_cast<std::int32_t>(total), current};
}

// =============================================================================
// Serialization
// =============================================================================

Value to_value(const PrngState& state) {
    return Value::object({
        {"seed", state.seed},
        {"s0", state.s0},
        {"s1", state.s1},
        {"s2", state.s2},
        {"s3", state.s3},
    });
}

namespace {

template<typename T>
bool read_word(const Value& mapping, const char* key, T& out) {
    Value field = mapping.field(key);
    if (!field.is_number()) return false;

    double number = field.as_number();
    if (std::floor(number) != number ||
        number < static_cast<double>(std::numeric_limits<T>::min()) ||
        number > static_cast<double>(std::numeric_limits<T>::max())) {
        return false;
    }
    out = static_cast<T>(number);
    return true;
}

} // anonymous namespace

keystone_core::Result<PrngState> prng_from_value(const Value& value) {
    if (!value.is_mapping()) {
        return keystone_core::Err<PrngState>(keystone_core::ErrorCode::ParseError,
            std::string("PRNG state must be a mapping, got ") + value_kind_name(value.kind()));
    }

    PrngState state;
    if (!read_word(value, "seed", state.seed) ||
        !read_word(value, "s0", state.s0) ||
        !read_word(value, "s1", state.s1) ||
        !read_word(value, "s2", state.s2) ||
        !read_word(value, "s3", state.s3)) {
        return keystone_core::Err<PrngState>(keystone_core::ErrorCode::ParseError,
            "PRNG state needs integer fields seed, s0, s1, s2 and s3: " + value.to_string());
    }
    return keystone_core::Ok(state);
}

// =============================================================================
// Rng
// =============================================================================

std::int32_t Rng::next_int(std::int32_t min, std::int32_t max) {
    auto [value, next] = random_int(m_state, min, max);
    m_state = next;
    return value;
}

double Rng::next_float() {
    auto [value, next] = random_float(m_state);
    m_state = next;
    return value;
}

std::int32_t Rng::roll(const DiceSpec& spec) {
    auto [total, next] = roll_dice(m_state, spec);
    m_state = next;
    return total;
}

keystone_core::Result<std::int32_t> Rng::roll(std::string_view notation) {
    auto spec = parse_dice(notation);
    if (!spec) {
        return keystone_core::Err<std::int32_t>(spec.error());
    }
    return keystone_core::Ok(roll(*spec));
}

Rng Rng::fork() {
    return Rng(next_int(0, std::numeric_limits<std::int32_t>::max()));
}

} // namespace keystone_state

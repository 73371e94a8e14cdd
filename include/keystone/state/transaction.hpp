/// @file transaction.hpp
/// @brief All-or-nothing application of mutation batches

#pragma once

#include "fwd.hpp"
#include "diff.hpp"
#include "mutation.hpp"
#include "value.hpp"

#include <keystone/core/error.hpp>

#include <optional>
#include <string>
#include <vector>

namespace keystone_state {

/// @brief Side effect requested by a transaction (reserved, always empty today)
struct Effect {
    std::string type;
    std::string source;
    Value data;
};

/// @brief Outcome of transaction()
///
/// On failure state is the original tree, diff and effects are empty and
/// error holds a TransactionFailed error.
struct TransactionResult {
    Value state;
    Diff diff;
    std::vector<Effect> effects;
    bool valid{false};
    std::optional<keystone_core::Error> error;

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }
};

/// @brief Fold mutations over state, or return the original state untouched
///
/// Pure: performs no I/O and no logging, so it can be used for what-if
/// evaluation. The error context carries "action", "reason",
/// "failed_mutation", "mutation_index" and "suggestion".
[[nodiscard]] TransactionResult transaction(const Value& state, const std::vector<Mutation>& mutations);

/// @brief Descriptions of every mutation joined with "; "
[[nodiscard]] std::string describe_mutations(const std::vector<Mutation>& mutations);

} // namespace keystone_state

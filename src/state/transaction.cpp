/// @file transaction.cpp
/// @brief Implementation of the transaction executor

#include "keystone/state/transaction.hpp"

#include <exception>

namespace keystone_state {

std::string describe_mutations(const std::vector<Mutation>& mutations) {
    std::string action;
    for (const auto& mutation : mutations) {
        if (!action.empty()) {
            action += "; ";
        }
        action += mutation.description();
    }
    return action;
}

namespace {

constexpr const char* k_failure_suggestion =
    "Check that all paths exist and values are of expected types";

/// Failed result carrying the untouched input state
TransactionResult rejected(const Value& state, const std::vector<Mutation>& mutations,
                           std::size_t index, const std::string& reason) {
    std::string action = describe_mutations(mutations);
    const std::string& failed = mutations[index].description();

    keystone_core::Error error(keystone_core::TransactionError::mutation_failed(action, failed, reason));
    error.with_context("action", action)
         .with_context("reason", reason)
         .with_context("failed_mutation", failed)
         .with_context("mutation_index", std::to_string(index))
         .with_context("suggestion", k_failure_suggestion);

    TransactionResult result;
    result.state = state;
    result.valid = false;
    result.error = std::move(error);
    return result;
}

} // anonymous namespace

TransactionResult transaction(const Value& state, const std::vector<Mutation>& mutations) {
    Value current = state;

    for (std::size_t i = 0; i < mutations.size(); ++i) {
        try {
            current = mutations[i].apply(current);
        } catch (const std::exception& e) {
            return rejected(state, mutations, i, e.what());
        } catch (...) {
            return rejected(state, mutations, i, "unknown exception");
        }
    }

    TransactionResult result;
    result.diff = compute_diff(state, current);
    result.state = std::move(current);
    result.valid = true;
    return result;
}

} // namespace keystone_state

/// @file error.cpp
/// @brief Error formatting and Result instantiations for keystone_core

#include <keystone/core/error.hpp>

#include <sstream>

namespace keystone_core {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::TransactionFailed: return "TransactionFailed";
    }
    return "Unknown";
}

TransactionError TransactionError::mutation_failed(
    std::string action, std::string failed_mutation, const std::string& reason) {
    TransactionError err;
    err.kind = Kind::MutationFailed;
    err.message = "Transaction failed: " + reason;
    err.action = std::move(action);
    err.reason = reason;
    err.failed_mutation = std::move(failed_mutation);
    return err;
}

// =============================================================================
// Formatting
// =============================================================================

namespace {

struct PayloadFormatter {
    std::ostringstream& out;

    void operator()(const std::string& message) const { out << message; }

    void operator()(const TransactionError& err) const {
        out << "[TransactionError] " << err.message;
        if (!err.failed_mutation.empty()) {
            out << " (mutation: " << err.failed_mutation << ")";
        }
    }
};

} // anonymous namespace

std::string build_error_chain(const Error& error) {
    std::ostringstream out;
    out << "[" << error_code_name(error.code()) << "] ";
    std::visit(PayloadFormatter{out}, error.payload());

    for (const auto& [key, value] : error.context()) {
        out << "\n  " << key << ": " << value;
    }
    return out.str();
}

// Result types used across keystone_state
template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<int, Error>;
template class Result<double, Error>;
template class Result<std::string, Error>;

} // namespace keystone_core

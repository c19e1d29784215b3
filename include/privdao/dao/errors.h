// PrivDAO - Governance Errors
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// Error codes and the Result value returned by every governance operation.

#ifndef PRIVDAO_DAO_ERRORS_H
#define PRIVDAO_DAO_ERRORS_H

#include <string>

namespace privdao {
namespace dao {

// ============================================================================
// Error Taxonomy
// ============================================================================

/// Coarse error classes that callers branch on
enum class ErrorKind {
    None,
    Validation,       ///< Malformed input
    State,            ///< Not valid in the current lifecycle state
    Authorization,    ///< Caller lacks the required role
    CryptoMismatch,   ///< Recomputed commitment differs from the stored one
    Duplicate,        ///< Second commit, reused delegation, double reveal
    Window,           ///< Outside the valid time window
    Arithmetic,       ///< Checked arithmetic would overflow
    Storage,          ///< Durable store failure or corrupt record
};

const char* ErrorKindToString(ErrorKind kind);

/// Fine-grained error codes
enum class DaoError {
    OK = 0,

    // Validation
    NAME_TOO_LONG,
    INVALID_QUORUM,
    REVEAL_WINDOW_TOO_SHORT,
    INVALID_EXECUTION_DELAY,
    INVALID_THRESHOLD,
    TITLE_TOO_LONG,
    DESCRIPTION_TOO_LONG,
    VOTING_DURATION_TOO_SHORT,
    INVALID_TREASURY_ACTION,
    TOKEN_MINT_REQUIRED,
    TREASURY_RECIPIENT_MISMATCH,
    GOVERNING_MINT_MISMATCH,
    WRONG_PROPOSAL,
    SELF_DELEGATION,
    INSUFFICIENT_FUNDS,
    INVALID_AMOUNT,

    // State
    VOTING_NOT_OPEN,
    REVEAL_TOO_EARLY,
    NOT_COMMITTED,
    ALREADY_FINALIZED,
    PROPOSAL_NOT_CANCELLABLE,
    PROPOSAL_NOT_PASSED,
    ALREADY_EXECUTED,
    EXECUTION_TIMELOCK_ACTIVE,
    DAO_NOT_FOUND,
    PROPOSAL_NOT_FOUND,
    DELEGATION_NOT_FOUND,
    TREASURY_TRANSFER_FAILED,

    // Authorization
    NOT_AUTHORITY,
    NOT_AUTHORIZED_TO_REVEAL,
    NOT_DELEGATEE,
    INSUFFICIENT_WEIGHT,

    // CryptoMismatch
    COMMITMENT_MISMATCH,

    // Duplicate
    ALREADY_COMMITTED,
    ALREADY_REVEALED,
    DELEGATION_ALREADY_USED,
    ALREADY_DELEGATED,
    DAO_ALREADY_EXISTS,

    // Window
    VOTING_CLOSED,
    REVEAL_CLOSED,
    REVEAL_STILL_OPEN,
    VETO_WINDOW_EXPIRED,
    VETO_AFTER_EXECUTION,

    // Arithmetic
    OVERFLOW,

    // Storage
    STORAGE_FAILURE,
    CORRUPT_RECORD,
};

const char* DaoErrorToString(DaoError error);

/// Map a fine-grained code to its taxonomy class
ErrorKind GetErrorKind(DaoError error);

// ============================================================================
// Result
// ============================================================================

/**
 * Outcome of a governance operation. A failed Result aborts the whole
 * request; nothing it staged is committed.
 */
class Result {
public:
    Result() : error_(DaoError::OK) {}

    static Result Ok() { return Result(); }

    static Result Error(DaoError error, const std::string& message = "") {
        return Result(error, message);
    }

    bool ok() const { return error_ == DaoError::OK; }

    DaoError error() const { return error_; }

    ErrorKind kind() const { return GetErrorKind(error_); }

    const std::string& message() const { return message_; }

    /// "CODE: message"
    std::string ToString() const;

private:
    Result(DaoError error, const std::string& message)
        : error_(error), message_(message) {}

    DaoError error_;
    std::string message_;
};

} // namespace dao
} // namespace privdao

#endif // PRIVDAO_DAO_ERRORS_H

// PrivDAO - Governance Errors
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/dao/errors.h"

namespace privdao {
namespace dao {

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:           return "None";
        case ErrorKind::Validation:     return "ValidationError";
        case ErrorKind::State:          return "StateError";
        case ErrorKind::Authorization:  return "AuthorizationError";
        case ErrorKind::CryptoMismatch: return "CryptoMismatchError";
        case ErrorKind::Duplicate:      return "DuplicateError";
        case ErrorKind::Window:         return "WindowError";
        case ErrorKind::Arithmetic:     return "ArithmeticError";
        case ErrorKind::Storage:        return "StorageError";
    }
    return "Unknown";
}

const char* DaoErrorToString(DaoError error) {
    switch (error) {
        case DaoError::OK:                          return "OK";
        case DaoError::NAME_TOO_LONG:               return "NAME_TOO_LONG";
        case DaoError::INVALID_QUORUM:              return "INVALID_QUORUM";
        case DaoError::REVEAL_WINDOW_TOO_SHORT:     return "REVEAL_WINDOW_TOO_SHORT";
        case DaoError::INVALID_EXECUTION_DELAY:     return "INVALID_EXECUTION_DELAY";
        case DaoError::INVALID_THRESHOLD:           return "INVALID_THRESHOLD";
        case DaoError::TITLE_TOO_LONG:              return "TITLE_TOO_LONG";
        case DaoError::DESCRIPTION_TOO_LONG:        return "DESCRIPTION_TOO_LONG";
        case DaoError::VOTING_DURATION_TOO_SHORT:   return "VOTING_DURATION_TOO_SHORT";
        case DaoError::INVALID_TREASURY_ACTION:     return "INVALID_TREASURY_ACTION";
        case DaoError::TOKEN_MINT_REQUIRED:         return "TOKEN_MINT_REQUIRED";
        case DaoError::TREASURY_RECIPIENT_MISMATCH: return "TREASURY_RECIPIENT_MISMATCH";
        case DaoError::GOVERNING_MINT_MISMATCH:     return "GOVERNING_MINT_MISMATCH";
        case DaoError::WRONG_PROPOSAL:              return "WRONG_PROPOSAL";
        case DaoError::SELF_DELEGATION:             return "SELF_DELEGATION";
        case DaoError::INSUFFICIENT_FUNDS:          return "INSUFFICIENT_FUNDS";
        case DaoError::INVALID_AMOUNT:              return "INVALID_AMOUNT";
        case DaoError::VOTING_NOT_OPEN:             return "VOTING_NOT_OPEN";
        case DaoError::REVEAL_TOO_EARLY:            return "REVEAL_TOO_EARLY";
        case DaoError::NOT_COMMITTED:               return "NOT_COMMITTED";
        case DaoError::ALREADY_FINALIZED:           return "ALREADY_FINALIZED";
        case DaoError::PROPOSAL_NOT_CANCELLABLE:    return "PROPOSAL_NOT_CANCELLABLE";
        case DaoError::PROPOSAL_NOT_PASSED:         return "PROPOSAL_NOT_PASSED";
        case DaoError::ALREADY_EXECUTED:            return "ALREADY_EXECUTED";
        case DaoError::EXECUTION_TIMELOCK_ACTIVE:   return "EXECUTION_TIMELOCK_ACTIVE";
        case DaoError::DAO_NOT_FOUND:               return "DAO_NOT_FOUND";
        case DaoError::PROPOSAL_NOT_FOUND:          return "PROPOSAL_NOT_FOUND";
        case DaoError::DELEGATION_NOT_FOUND:        return "DELEGATION_NOT_FOUND";
        case DaoError::TREASURY_TRANSFER_FAILED:    return "TREASURY_TRANSFER_FAILED";
        case DaoError::NOT_AUTHORITY:               return "NOT_AUTHORITY";
        case DaoError::NOT_AUTHORIZED_TO_REVEAL:    return "NOT_AUTHORIZED_TO_REVEAL";
        case DaoError::NOT_DELEGATEE:               return "NOT_DELEGATEE";
        case DaoError::INSUFFICIENT_WEIGHT:         return "INSUFFICIENT_WEIGHT";
        case DaoError::COMMITMENT_MISMATCH:         return "COMMITMENT_MISMATCH";
        case DaoError::ALREADY_COMMITTED:           return "ALREADY_COMMITTED";
        case DaoError::ALREADY_REVEALED:            return "ALREADY_REVEALED";
        case DaoError::DELEGATION_ALREADY_USED:     return "DELEGATION_ALREADY_USED";
        case DaoError::ALREADY_DELEGATED:           return "ALREADY_DELEGATED";
        case DaoError::DAO_ALREADY_EXISTS:          return "DAO_ALREADY_EXISTS";
        case DaoError::VOTING_CLOSED:               return "VOTING_CLOSED";
        case DaoError::REVEAL_CLOSED:               return "REVEAL_CLOSED";
        case DaoError::REVEAL_STILL_OPEN:           return "REVEAL_STILL_OPEN";
        case DaoError::VETO_WINDOW_EXPIRED:         return "VETO_WINDOW_EXPIRED";
        case DaoError::VETO_AFTER_EXECUTION:        return "VETO_AFTER_EXECUTION";
        case DaoError::OVERFLOW:                    return "OVERFLOW";
        case DaoError::STORAGE_FAILURE:             return "STORAGE_FAILURE";
        case DaoError::CORRUPT_RECORD:              return "CORRUPT_RECORD";
    }
    return "UNKNOWN";
}

ErrorKind GetErrorKind(DaoError error) {
    switch (error) {
        case DaoError::OK:
            return ErrorKind::None;

        case DaoError::NAME_TOO_LONG:
        case DaoError::INVALID_QUORUM:
        case DaoError::REVEAL_WINDOW_TOO_SHORT:
        case DaoError::INVALID_EXECUTION_DELAY:
        case DaoError::INVALID_THRESHOLD:
        case DaoError::TITLE_TOO_LONG:
        case DaoError::DESCRIPTION_TOO_LONG:
        case DaoError::VOTING_DURATION_TOO_SHORT:
        case DaoError::INVALID_TREASURY_ACTION:
        case DaoError::TOKEN_MINT_REQUIRED:
        case DaoError::TREASURY_RECIPIENT_MISMATCH:
        case DaoError::GOVERNING_MINT_MISMATCH:
        case DaoError::WRONG_PROPOSAL:
        case DaoError::SELF_DELEGATION:
        case DaoError::INSUFFICIENT_FUNDS:
        case DaoError::INVALID_AMOUNT:
            return ErrorKind::Validation;

        case DaoError::VOTING_NOT_OPEN:
        case DaoError::REVEAL_TOO_EARLY:
        case DaoError::NOT_COMMITTED:
        case DaoError::ALREADY_FINALIZED:
        case DaoError::PROPOSAL_NOT_CANCELLABLE:
        case DaoError::PROPOSAL_NOT_PASSED:
        case DaoError::ALREADY_EXECUTED:
        case DaoError::EXECUTION_TIMELOCK_ACTIVE:
        case DaoError::DAO_NOT_FOUND:
        case DaoError::PROPOSAL_NOT_FOUND:
        case DaoError::DELEGATION_NOT_FOUND:
        case DaoError::TREASURY_TRANSFER_FAILED:
            return ErrorKind::State;

        case DaoError::NOT_AUTHORITY:
        case DaoError::NOT_AUTHORIZED_TO_REVEAL:
        case DaoError::NOT_DELEGATEE:
        case DaoError::INSUFFICIENT_WEIGHT:
            return ErrorKind::Authorization;

        case DaoError::COMMITMENT_MISMATCH:
            return ErrorKind::CryptoMismatch;

        case DaoError::ALREADY_COMMITTED:
        case DaoError::ALREADY_REVEALED:
        case DaoError::DELEGATION_ALREADY_USED:
        case DaoError::ALREADY_DELEGATED:
        case DaoError::DAO_ALREADY_EXISTS:
            return ErrorKind::Duplicate;

        case DaoError::VOTING_CLOSED:
        case DaoError::REVEAL_CLOSED:
        case DaoError::REVEAL_STILL_OPEN:
        case DaoError::VETO_WINDOW_EXPIRED:
        case DaoError::VETO_AFTER_EXECUTION:
            return ErrorKind::Window;

        case DaoError::OVERFLOW:
            return ErrorKind::Arithmetic;

        case DaoError::STORAGE_FAILURE:
        case DaoError::CORRUPT_RECORD:
            return ErrorKind::Storage;
    }
    return ErrorKind::None;
}

std::string Result::ToString() const {
    if (ok()) return "OK";
    std::string result = DaoErrorToString(error_);
    if (!message_.empty()) {
        result += ": " + message_;
    }
    return result;
}

} // namespace dao
} // namespace privdao

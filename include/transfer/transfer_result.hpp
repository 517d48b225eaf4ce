#pragma once

#include <string>
#include <utility>

enum class TransferErrorCode {
    None,
    AlreadyExists,
    SizeMismatch,
    ChecksumMismatch,
    Cancelled,
    IOFailure
};

std::string toString(TransferErrorCode code);

// Outcome of a copy operation. AlreadyExists is not a failure: the item
// was skipped without moving data.
struct TransferResult {
    TransferErrorCode code{TransferErrorCode::None};
    std::string message;

    bool isFailure() const {
        return code != TransferErrorCode::None && code != TransferErrorCode::AlreadyExists;
    }
    bool isCancelled() const { return code == TransferErrorCode::Cancelled; }

    static TransferResult success() { return {}; }
    static TransferResult alreadyExists(std::string message) {
        return {TransferErrorCode::AlreadyExists, std::move(message)};
    }
    static TransferResult failure(TransferErrorCode code, std::string message) {
        return {code, std::move(message)};
    }
    static TransferResult cancelled() {
        return {TransferErrorCode::Cancelled, "Transfer cancelled"};
    }
};

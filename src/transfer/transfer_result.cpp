#include "transfer/transfer_result.hpp"

std::string toString(TransferErrorCode code) {
    switch (code) {
        case TransferErrorCode::None:             return "none";
        case TransferErrorCode::AlreadyExists:    return "already_exists";
        case TransferErrorCode::SizeMismatch:     return "size_mismatch";
        case TransferErrorCode::ChecksumMismatch: return "checksum_mismatch";
        case TransferErrorCode::Cancelled:        return "cancelled";
        case TransferErrorCode::IOFailure:        return "io_failure";
        default:                                  return "unknown";
    }
}

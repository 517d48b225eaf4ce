#pragma once

#include "transfer/conflict_policy.hpp"
#include <chrono>
#include <cstddef>

struct TransferConfig {
    size_t chunkSize = 1024 * 1024;          // Bytes per read/write during a file copy
    bool verifyChecksum = false;             // Compare SHA-256 of source and destination
    size_t checksumBlockSize = 64 * 1024;    // Read size used while hashing
    size_t workerCount = 1;                  // Number of queue workers
    std::chrono::milliseconds stopTimeout{5000};
    ConflictPolicy conflictPolicy = ConflictPolicy::Skip;
    bool preserveTimestamps = true;          // Directory copies carry file mtimes
};

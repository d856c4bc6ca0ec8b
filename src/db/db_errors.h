// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#ifndef POOLNODE_DB_DB_ERRORS_H
#define POOLNODE_DB_DB_ERRORS_H

#include <leveldb/status.h>
#include <string>

/**
 * LevelDB error classification
 *
 * Every module that opens a LevelDB store reports failures through these
 * helpers so the operator sees the same advice for the same problem.
 */

enum class DBErrorType {
    OK,                    // No error
    CORRUPTION,            // LevelDB detected damaged files
    IO_ERROR,              // Disk full, permission denied, lock held by another process
    NOT_FOUND,             // Key not found (normal for some reads)
    INVALID_ARGUMENT,      // e.g. opening a missing DB without create_if_missing
    NOT_SUPPORTED,
    UNKNOWN
};

DBErrorType ClassifyDBError(const leveldb::Status& status);

/**
 * Recoverable errors are ones the caller may treat as a normal outcome
 * (OK, NOT_FOUND). Everything else aborts the operation.
 */
bool IsRecoverableError(DBErrorType error_type);

/**
 * Human-readable message with recovery advice
 */
std::string GetDBErrorMessage(const leveldb::Status& status);

#endif // POOLNODE_DB_DB_ERRORS_H

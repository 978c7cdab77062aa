// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_DB_DB_ERRORS_H
#define PROVCHAIN_DB_DB_ERRORS_H

#include <leveldb/status.h>
#include <string>

/**
 * LevelDB status classification for the graph database.
 */

enum class DBErrorType {
    OK,                    // No error
    CORRUPTION,            // Data corruption detected (LevelDB or record checksum)
    IO_ERROR,              // I/O error (disk full, permission denied, etc.)
    NOT_FOUND,             // Key not found (normal for lookups)
    INVALID_ARGUMENT,      // Invalid argument passed to DB operation
    NOT_SUPPORTED,         // Operation not supported
    UNKNOWN                // Unknown error type
};

/**
 * Classify LevelDB status into error type
 */
DBErrorType ClassifyDBError(const leveldb::Status& status);

/**
 * Whether a failed read leaves the store usable. NOT_FOUND is an ordinary
 * miss; corruption and I/O failures are not recoverable and get logged.
 */
bool IsRecoverableError(DBErrorType error_type);

/**
 * Human-readable error message with recovery hint
 */
std::string GetDBErrorMessage(const leveldb::Status& status, DBErrorType error_type);

#endif // PROVCHAIN_DB_DB_ERRORS_H

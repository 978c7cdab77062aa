// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_UTIL_TIME_H
#define PROVCHAIN_UTIL_TIME_H

#include <cstdint>
#include <ctime>
#include <string>

inline int64_t GetTime() {
    return static_cast<int64_t>(time(nullptr));
}

/**
 * Format a unix timestamp as ISO-8601 UTC ("2025-01-01T00:00:00Z").
 */
std::string FormatISO8601DateTime(int64_t nTime);

/**
 * Parse the format produced by FormatISO8601DateTime. Returns false on
 * malformed input.
 */
bool ParseISO8601DateTime(const std::string& str, int64_t& nTime);

#endif // PROVCHAIN_UTIL_TIME_H

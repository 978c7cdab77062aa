// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

/**
 * Operator-facing error messages for store, config and integrity failures.
 * FormatForUser renders a multi-line report with recovery steps;
 * FormatForLog renders the same message on one line.
 */

#ifndef PROVCHAIN_UTIL_ERROR_FORMAT_H
#define PROVCHAIN_UTIL_ERROR_FORMAT_H

#include <string>
#include <vector>

enum class ErrorSeverity {
    ERROR,     // Operation failed, node state intact
    CRITICAL   // Stored data no longer verifies
};

struct ErrorMessage {
    ErrorSeverity severity;
    std::string title;
    std::string description;
    std::string cause;
    std::vector<std::string> recovery_steps;
    std::string error_code;

    ErrorMessage(ErrorSeverity sev, const std::string& t, const std::string& desc)
        : severity(sev), title(t), description(desc) {}
};

class CErrorFormatter {
public:
    static std::string FormatForUser(const ErrorMessage& error);
    static std::string FormatForLog(const ErrorMessage& error);

    /** Error code DB_<operation> */
    static ErrorMessage DatabaseError(const std::string& operation, const std::string& details);

    /** Error code CONFIG_<option> */
    static ErrorMessage ConfigError(const std::string& option, const std::string& details);

    /** Error code INTEGRITY_<object>, severity CRITICAL */
    static ErrorMessage IntegrityError(const std::string& object, const std::string& details);
};

#endif // PROVCHAIN_UTIL_ERROR_FORMAT_H

// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <util/error_format.h>
#include <sstream>

namespace {

const char* SeverityName(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "";
}

} // namespace

// Plain text: the result is handed back through error out-parameters
std::string CErrorFormatter::FormatForUser(const ErrorMessage& error) {
    std::ostringstream oss;
    oss << error.title << "\n";
    oss << "  " << error.description << "\n";

    if (!error.cause.empty()) {
        oss << "  Cause: " << error.cause << "\n";
    }

    if (!error.recovery_steps.empty()) {
        oss << "  To resolve:\n";
        for (size_t i = 0; i < error.recovery_steps.size(); ++i) {
            oss << "    " << (i + 1) << ". " << error.recovery_steps[i] << "\n";
        }
    }

    if (!error.error_code.empty()) {
        oss << "  Error code: " << error.error_code << "\n";
    }
    return oss.str();
}

std::string CErrorFormatter::FormatForLog(const ErrorMessage& error) {
    std::ostringstream oss;

    oss << "[" << SeverityName(error.severity) << "] " << error.title;
    if (!error.error_code.empty()) {
        oss << " (code: " << error.error_code << ")";
    }
    oss << ": " << error.description;

    if (!error.cause.empty()) {
        oss << " Cause: " << error.cause;
    }

    return oss.str();
}

ErrorMessage CErrorFormatter::DatabaseError(const std::string& operation, const std::string& details) {
    ErrorMessage error(ErrorSeverity::ERROR,
                      "Graph Store Operation Failed",
                      "Failed to " + operation + ": " + details);
    error.cause = "Database I/O error or corruption";
    error.recovery_steps = {
        "Check disk space and permissions on the data directory",
        "Verify the graph database files are not corrupted",
        "Restore the data directory from a backup if the problem persists"
    };
    error.error_code = "DB_" + operation;
    return error;
}

ErrorMessage CErrorFormatter::ConfigError(const std::string& option, const std::string& details) {
    ErrorMessage error(ErrorSeverity::ERROR,
                      "Configuration Error",
                      "Invalid configuration for '" + option + "': " + details);
    error.cause = "Invalid or malformed configuration value";
    error.recovery_steps = {
        "Check provchain.conf for syntax errors",
        "Verify the value is in the correct format",
        "Unset any PROVCHAIN_* environment override for this option"
    };
    error.error_code = "CONFIG_" + option;
    return error;
}

ErrorMessage CErrorFormatter::IntegrityError(const std::string& object, const std::string& details) {
    ErrorMessage error(ErrorSeverity::CRITICAL,
                      "Chain Integrity Failure",
                      "Integrity check failed for " + object + ": " + details);
    error.cause = "Stored graph or block record no longer matches its recorded hash";
    error.recovery_steps = {
        "Stop accepting new blocks on this node",
        "Compare the affected named graph against a trusted replica",
        "Run the external chain recovery procedure"
    };
    error.error_code = "INTEGRITY_" + object;
    return error;
}

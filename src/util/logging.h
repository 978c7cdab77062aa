// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_UTIL_LOGGING_H
#define PROVCHAIN_UTIL_LOGGING_H

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <memory>
#include <cstdint>

/**
 * Ledger logging
 *
 * Every line carries a UTC timestamp, a level and a category:
 *   2025-01-01 00:00:00 [WARN] [CANON] RDFC-1.0 budget exhausted after 100001 steps
 *
 * Output goes to the console (errors to stderr) and optionally to a
 * size-rotated log file. Category mask and level are process-wide.
 */

enum class LogCategory : uint32_t {
    NONE = 0,
    CANON = (1 << 0),         // Classification, canonicalization, cache
    CHAIN = (1 << 1),         // Genesis, append, reload
    STORE = (1 << 2),         // Graph store and LevelDB
    VALIDATION = (1 << 3),    // Chain verification
    CONFIG = (1 << 4),        // Configuration loading
    ALL = 0xFFFFFFFF
};

/** LVL_ prefix keeps clear of the Windows ERROR macro */
enum class LogLevel {
    LVL_ERROR = 0,
    LVL_WARN = 1,
    LVL_INFO = 2,
    LVL_DEBUG = 3
};

/** Parse error|warn|warning|info|debug, case-insensitive. */
bool ParseLogLevel(const std::string& name, LogLevel& level);

/** Parse canon|chain|store|validation|config|all, case-insensitive. */
bool ParseLogCategory(const std::string& name, LogCategory& category);

const char* LogLevelName(LogLevel level);
const char* LogCategoryName(LogCategory category);

class CLoggingConfig {
public:
    static CLoggingConfig& GetInstance();

    void EnableCategory(LogCategory category);
    void SetCategoryMask(uint32_t mask);
    bool IsCategoryEnabled(LogCategory category) const;

    void SetLogLevel(LogLevel level);
    LogLevel GetLogLevel() const;

    /** "1" selects debug.log inside the data directory; empty disables file output. */
    void SetLogFile(const std::string& path);
    std::string GetLogFile() const;

    void SetConsoleLogging(bool enable);
    bool IsConsoleLoggingEnabled() const { return m_consoleLogging; }

    /** Rotate once the file reaches max_bytes, keeping at most max_files old copies. */
    void SetRotation(size_t max_bytes, size_t max_files);
    size_t GetMaxLogSize() const;
    size_t GetMaxLogFiles() const;

private:
    CLoggingConfig() = default;

    std::atomic<uint32_t> m_categoryMask{static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<LogLevel> m_logLevel{LogLevel::LVL_INFO};
    std::atomic<bool> m_consoleLogging{true};

    mutable std::mutex m_configMutex;
    std::string m_logFile;
    size_t m_maxLogSize{10 * 1024 * 1024};
    size_t m_maxLogFiles{5};
};

class CLogger {
public:
    static CLogger& GetInstance();

    /**
     * Open the configured log file. Returns false when a file is configured
     * but cannot be opened. Calling again while open is a no-op.
     */
    bool Initialize(const std::string& datadir);

    /** Flush and close the log file. Console logging continues. */
    void Shutdown();

    void Log(LogCategory category, LogLevel level, const std::string& message);
    void LogPrintFormat(LogCategory category, LogLevel level, const char* format, ...);

private:
    CLogger() = default;
    ~CLogger();

    std::string FormatLine(LogCategory category, LogLevel level, const std::string& message) const;
    void AppendToFile(const std::string& line);
    void Rotate();

    std::mutex m_logMutex;
    std::unique_ptr<std::ofstream> m_logFile;
    std::string m_logPath;
    size_t m_currentLogSize{0};
};

#define LogPrintf(category, level, format, ...) \
    CLogger::GetInstance().LogPrintFormat(LogCategory::category, LogLevel::LVL_##level, format, ##__VA_ARGS__)

#define LogPrintCanon(level, format, ...) LogPrintf(CANON, level, format, ##__VA_ARGS__)
#define LogPrintChain(level, format, ...) LogPrintf(CHAIN, level, format, ##__VA_ARGS__)
#define LogPrintStore(level, format, ...) LogPrintf(STORE, level, format, ##__VA_ARGS__)
#define LogPrintValidation(level, format, ...) LogPrintf(VALIDATION, level, format, ##__VA_ARGS__)
#define LogPrintConfig(level, format, ...) LogPrintf(CONFIG, level, format, ##__VA_ARGS__)

#endif // PROVCHAIN_UTIL_LOGGING_H

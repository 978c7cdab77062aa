// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <util/logging.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

} // namespace

bool ParseLogLevel(const std::string& name, LogLevel& level) {
    const std::string lower = ToLower(name);
    if (lower == "error") {
        level = LogLevel::LVL_ERROR;
    } else if (lower == "warn" || lower == "warning") {
        level = LogLevel::LVL_WARN;
    } else if (lower == "info") {
        level = LogLevel::LVL_INFO;
    } else if (lower == "debug") {
        level = LogLevel::LVL_DEBUG;
    } else {
        return false;
    }
    return true;
}

bool ParseLogCategory(const std::string& name, LogCategory& category) {
    const std::string lower = ToLower(name);
    if (lower == "canon") {
        category = LogCategory::CANON;
    } else if (lower == "chain") {
        category = LogCategory::CHAIN;
    } else if (lower == "store") {
        category = LogCategory::STORE;
    } else if (lower == "validation") {
        category = LogCategory::VALIDATION;
    } else if (lower == "config") {
        category = LogCategory::CONFIG;
    } else if (lower == "all") {
        category = LogCategory::ALL;
    } else {
        return false;
    }
    return true;
}

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::LVL_ERROR: return "ERROR";
        case LogLevel::LVL_WARN: return "WARN";
        case LogLevel::LVL_INFO: return "INFO";
        case LogLevel::LVL_DEBUG: return "DEBUG";
    }
    return "";
}

const char* LogCategoryName(LogCategory category) {
    switch (category) {
        case LogCategory::CANON: return "CANON";
        case LogCategory::CHAIN: return "CHAIN";
        case LogCategory::STORE: return "STORE";
        case LogCategory::VALIDATION: return "VALIDATION";
        case LogCategory::CONFIG: return "CONFIG";
        default: return "";
    }
}

// ---------------------------------------------------------------------------
// CLoggingConfig
// ---------------------------------------------------------------------------

CLoggingConfig& CLoggingConfig::GetInstance() {
    static CLoggingConfig instance;
    return instance;
}

void CLoggingConfig::EnableCategory(LogCategory category) {
    m_categoryMask.fetch_or(static_cast<uint32_t>(category));
}

void CLoggingConfig::SetCategoryMask(uint32_t mask) {
    m_categoryMask.store(mask);
}

bool CLoggingConfig::IsCategoryEnabled(LogCategory category) const {
    return (m_categoryMask.load() & static_cast<uint32_t>(category)) != 0;
}

void CLoggingConfig::SetLogLevel(LogLevel level) {
    m_logLevel.store(level);
}

LogLevel CLoggingConfig::GetLogLevel() const {
    return m_logLevel.load();
}

void CLoggingConfig::SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_configMutex);
    m_logFile = path;
}

std::string CLoggingConfig::GetLogFile() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return m_logFile;
}

void CLoggingConfig::SetConsoleLogging(bool enable) {
    m_consoleLogging.store(enable);
}

void CLoggingConfig::SetRotation(size_t max_bytes, size_t max_files) {
    std::lock_guard<std::mutex> lock(m_configMutex);
    m_maxLogSize = max_bytes;
    m_maxLogFiles = std::max<size_t>(max_files, 1);
}

size_t CLoggingConfig::GetMaxLogSize() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return m_maxLogSize;
}

size_t CLoggingConfig::GetMaxLogFiles() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return m_maxLogFiles;
}

// ---------------------------------------------------------------------------
// CLogger
// ---------------------------------------------------------------------------

CLogger& CLogger::GetInstance() {
    static CLogger instance;
    return instance;
}

CLogger::~CLogger() {
    Shutdown();
}

bool CLogger::Initialize(const std::string& datadir) {
    std::lock_guard<std::mutex> lock(m_logMutex);

    if (m_logFile) {
        return true;
    }

    std::string path = CLoggingConfig::GetInstance().GetLogFile();
    if (path.empty()) {
        return true;
    }
    if (path == "1") {
        path = (datadir.empty() ? std::string(".") : datadir) + "/debug.log";
    }

    auto file = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file->is_open()) {
        std::cerr << "[Logger] Cannot open log file " << path << std::endl;
        return false;
    }

    file->seekp(0, std::ios::end);
    m_currentLogSize = static_cast<size_t>(file->tellp());
    m_logFile = std::move(file);
    m_logPath = path;
    return true;
}

void CLogger::Shutdown() {
    std::lock_guard<std::mutex> lock(m_logMutex);
    if (m_logFile) {
        m_logFile->flush();
        m_logFile.reset();
    }
    m_logPath.clear();
    m_currentLogSize = 0;
}

void CLogger::Log(LogCategory category, LogLevel level, const std::string& message) {
    const CLoggingConfig& config = CLoggingConfig::GetInstance();
    if (level > config.GetLogLevel() || !config.IsCategoryEnabled(category)) {
        return;
    }

    const std::string line = FormatLine(category, level, message);

    std::lock_guard<std::mutex> lock(m_logMutex);
    if (config.IsConsoleLoggingEnabled()) {
        std::ostream& out = (level == LogLevel::LVL_ERROR) ? std::cerr : std::cout;
        out << line << '\n';
    }
    if (m_logFile) {
        AppendToFile(line);
    }
}

void CLogger::LogPrintFormat(LogCategory category, LogLevel level, const char* format, ...) {
    char buffer[4096];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(category, level, std::string(buffer));
}

std::string CLogger::FormatLine(LogCategory category, LogLevel level, const std::string& message) const {
    std::time_t now = std::time(nullptr);
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S") << " [" << LogLevelName(level) << "]";

    const char* category_name = LogCategoryName(category);
    if (category_name[0] != '\0') {
        oss << " [" << category_name << "]";
    }
    oss << " " << message;
    return oss.str();
}

// Caller holds m_logMutex
void CLogger::AppendToFile(const std::string& line) {
    if (m_currentLogSize >= CLoggingConfig::GetInstance().GetMaxLogSize()) {
        Rotate();
        if (!m_logFile) {
            return;
        }
    }

    *m_logFile << line << '\n';
    m_logFile->flush();
    m_currentLogSize += line.size() + 1;
}

// debug.log -> debug.log.1 -> ... -> debug.log.N, oldest dropped
void CLogger::Rotate() {
    m_logFile->close();

    const size_t max_files = CLoggingConfig::GetInstance().GetMaxLogFiles();
    const std::string oldest = m_logPath + "." + std::to_string(max_files);
    std::remove(oldest.c_str());

    for (size_t i = max_files; i > 1; --i) {
        const std::string from = m_logPath + "." + std::to_string(i - 1);
        const std::string to = m_logPath + "." + std::to_string(i);
        if (std::rename(from.c_str(), to.c_str()) != 0 && errno != ENOENT) {
            std::cerr << "[Logger] Cannot rotate " << from << ": " << std::strerror(errno) << std::endl;
        }
    }

    const std::string first = m_logPath + ".1";
    if (std::rename(m_logPath.c_str(), first.c_str()) != 0) {
        std::cerr << "[Logger] Cannot rotate " << m_logPath << ": " << std::strerror(errno) << std::endl;
    }

    m_logFile = std::make_unique<std::ofstream>(m_logPath, std::ios::trunc);
    m_currentLogSize = 0;
    if (!m_logFile->is_open()) {
        std::cerr << "[Logger] Cannot reopen log file " << m_logPath << std::endl;
        m_logFile.reset();
    }
}

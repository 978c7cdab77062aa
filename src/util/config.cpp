// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <util/config.h>
#include <util/logging.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <sys/stat.h>

std::string CConfigParser::Trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string CConfigParser::NormalizeKey(const std::string& key) {
    std::string lower = Trim(key);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::optional<std::string> CConfigParser::GetEnv(const std::string& key) {
    std::string name = "PROVCHAIN_" + key;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

bool CConfigParser::LoadConfigFile(const std::string& file_path) {
    m_config_file_path = file_path;
    m_settings.clear();
    m_loaded = false;

    struct stat file_stat;
    if (stat(file_path.c_str(), &file_stat) != 0) {
        LogPrintConfig(DEBUG, "No config file at %s, using defaults", file_path.c_str());
        m_loaded = true;
        return true;
    }
    if (S_ISDIR(file_stat.st_mode)) {
        LogPrintConfig(ERROR, "Config path %s is a directory", file_path.c_str());
        return false;
    }
    if (file_stat.st_mode & (S_IWGRP | S_IWOTH)) {
        LogPrintConfig(WARN, "Config file %s is writable by group or others (mode %o)",
                       file_path.c_str(), static_cast<unsigned>(file_stat.st_mode & 0777));
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        LogPrintConfig(ERROR, "Cannot read config file %s", file_path.c_str());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!LoadConfigString(buffer.str())) {
        return false;
    }

    LogPrintConfig(INFO, "Loaded %zu settings from %s", m_settings.size(), file_path.c_str());
    return true;
}

bool CConfigParser::LoadConfigString(const std::string& contents) {
    m_settings.clear();
    m_loaded = false;

    std::istringstream stream(contents);
    std::string raw;
    int line_number = 0;
    while (std::getline(stream, raw)) {
        ++line_number;

        std::string line = raw.substr(0, raw.find_first_of("#;"));
        line = Trim(line);
        if (line.empty() || (line.front() == '[' && line.back() == ']')) {
            continue;
        }

        size_t eq = line.find('=');
        std::string key = (eq == std::string::npos) ? std::string() : NormalizeKey(line.substr(0, eq));
        if (key.empty()) {
            LogPrintConfig(ERROR, "Config line %d: expected key=value, got '%s'", line_number, line.c_str());
            m_settings.clear();
            return false;
        }

        std::string value = Trim(line.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        LogPrintConfig(DEBUG, "Config: %s = %s", key.c_str(), value.c_str());
        m_settings[key].push_back(value);
    }

    m_loaded = true;
    return true;
}

std::optional<std::string> CConfigParser::Find(const std::string& key) const {
    const std::string normalized = NormalizeKey(key);

    std::optional<std::string> env_value = GetEnv(normalized);
    if (env_value) {
        LogPrintConfig(DEBUG, "Config: %s = %s (environment)", normalized.c_str(), env_value->c_str());
        return env_value;
    }

    auto it = m_settings.find(normalized);
    if (it == m_settings.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

std::string CConfigParser::GetString(const std::string& key, const std::string& default_value) const {
    std::optional<std::string> value = Find(key);
    return value ? *value : default_value;
}

int64_t CConfigParser::GetInt64(const std::string& key, int64_t default_value) const {
    std::optional<std::string> value = Find(key);
    if (!value || value->empty()) {
        return default_value;
    }

    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(value->c_str(), &end, 10);
    if (errno != 0 || end == value->c_str() || *end != '\0') {
        LogPrintConfig(WARN, "Config: %s=%s is not an integer, using %lld",
                       key.c_str(), value->c_str(), static_cast<long long>(default_value));
        return default_value;
    }
    return static_cast<int64_t>(parsed);
}

bool CConfigParser::GetBool(const std::string& key, bool default_value) const {
    std::optional<std::string> value = Find(key);
    if (!value || value->empty()) {
        return default_value;
    }

    std::string lower = NormalizeKey(*value);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        return false;
    }

    LogPrintConfig(WARN, "Config: %s=%s is not a boolean, using %s",
                   key.c_str(), value->c_str(), default_value ? "true" : "false");
    return default_value;
}

std::vector<std::string> CConfigParser::GetList(const std::string& key) const {
    const std::string normalized = NormalizeKey(key);

    std::vector<std::string> raw_values;
    std::optional<std::string> env_value = GetEnv(normalized);
    if (env_value) {
        raw_values.push_back(*env_value);
    } else {
        auto it = m_settings.find(normalized);
        if (it != m_settings.end()) {
            raw_values = it->second;
        }
    }

    std::vector<std::string> result;
    for (const std::string& raw : raw_values) {
        std::stringstream ss(raw);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = Trim(item);
            if (!item.empty()) {
                result.push_back(item);
            }
        }
    }
    return result;
}

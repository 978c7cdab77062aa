// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_UTIL_CONFIG_H
#define PROVCHAIN_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * provchain.conf reader
 *
 * Syntax:
 *   # comment        ; comment
 *   [section]        (ignored, keys are global)
 *   key = value      (keys case-insensitive, "quoted values" unwrapped)
 *
 * Lookup order is environment (PROVCHAIN_<KEY>), then the file, then the
 * caller's default. Repeated keys keep every value; scalar getters return
 * the last one.
 */
class CConfigParser {
public:
    CConfigParser() = default;

    /**
     * Load settings from a file. A missing file is not an error and leaves
     * the parser empty. Returns false for a directory or a malformed line.
     */
    bool LoadConfigFile(const std::string& file_path);

    /** Same as LoadConfigFile for an in-memory buffer. */
    bool LoadConfigString(const std::string& contents);

    std::string GetString(const std::string& key, const std::string& default_value = "") const;

    /** Non-numeric values log a warning and yield default_value. */
    int64_t GetInt64(const std::string& key, int64_t default_value = 0) const;

    /** Accepts 1/0, true/false, yes/no, on/off. */
    bool GetBool(const std::string& key, bool default_value = false) const;

    /**
     * All values of a key in file order, each split on commas:
     * "peer=a,b" followed by "peer=c" yields {a, b, c}.
     */
    std::vector<std::string> GetList(const std::string& key) const;

    bool IsLoaded() const { return m_loaded; }
    const std::string& GetConfigFilePath() const { return m_config_file_path; }

private:
    static std::string Trim(const std::string& str);
    static std::string NormalizeKey(const std::string& key);
    static std::optional<std::string> GetEnv(const std::string& key);

    /** Lookup without defaults: environment first, then last file value. */
    std::optional<std::string> Find(const std::string& key) const;

    std::map<std::string, std::vector<std::string>> m_settings;
    std::string m_config_file_path;
    bool m_loaded{false};
};

#endif // PROVCHAIN_UTIL_CONFIG_H

// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_UTIL_CONFIG_H
#define PROXIMA_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

/** Where a setting's value came from, highest priority first */
enum class ConfigSource {
    OVERRIDE,       // command line
    ENVIRONMENT,    // PROXIMA_<KEY>
    FILE,           // proxima.conf
    DEFAULT,
};

const char* ConfigSourceName(ConfigSource source);

/**
 * CConfigParser - proxima.conf plus environment and command-line overrides
 *
 * File syntax: key=value lines, '#' or ';' comments, [section] headers
 * (ignored), optional double quotes around a value. Keys are case
 * insensitive. A key may repeat; scalar getters take the last occurrence
 * and GetList() takes them all.
 */
class CConfigParser {
public:
    CConfigParser() = default;

    /**
     * Load proxima.conf. A missing file is not an error.
     * @return false only if the file exists but cannot be read
     */
    bool LoadConfigFile(const std::string& file_path);

    /** Same syntax as the file, for tests and embedded defaults */
    void LoadFromString(const std::string& contents);

    /** Command-line value; beats environment and file */
    void SetOverride(const std::string& key, const std::string& value);

    std::string GetString(const std::string& key, const std::string& default_value = "") const;
    /** Falls back to the default, with a warning, when the value does not parse */
    int64_t GetInt64(const std::string& key, int64_t default_value = 0) const;
    double GetDouble(const std::string& key, double default_value = 0.0) const;
    /** 1/0, true/false, yes/no, on/off */
    bool GetBool(const std::string& key, bool default_value = false) const;
    /** Every value of a repeated key, each split on commas */
    std::vector<std::string> GetList(const std::string& key) const;

    bool IsSet(const std::string& key) const;
    ConfigSource GetSource(const std::string& key) const;

    /** Distinct keys present in the file, lower case */
    std::vector<std::string> GetFileKeys() const;

    bool IsLoaded() const { return m_loaded; }
    const std::string& GetConfigFilePath() const { return m_path; }

private:
    /** Raw values for key from the highest-priority source that has any */
    ConfigSource Lookup(const std::string& key, std::vector<std::string>& values) const;

    std::multimap<std::string, std::string> m_file;
    std::map<std::string, std::string> m_overrides;
    std::string m_path;
    bool m_loaded{false};
};

/** proxima.conf inside datadir (the default data directory if empty) */
std::string GetConfigFilePath(const std::string& datadir = "");

/** ~/.proxima */
std::string GetDefaultDataDir();

#endif // PROXIMA_UTIL_CONFIG_H

// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <util/config.h>

#include <util/logging.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

std::string Trim(const std::string& str) {
    const char* space = " \t\r\n";
    size_t first = str.find_first_not_of(space);
    if (first == std::string::npos) {
        return "";
    }
    return str.substr(first, str.find_last_not_of(space) - first + 1);
}

std::string Lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string EnvName(const std::string& key) {
    std::string name = "PROXIMA_" + key;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return name;
}

/** key=value with comments and quotes stripped; false for blank, comment or section lines */
bool SplitSetting(const std::string& line, std::string& key, std::string& value) {
    std::string text = Trim(line.substr(0, line.find_first_of("#;")));
    if (text.empty() || text.front() == '[') {
        return false;
    }
    size_t eq = text.find('=');
    if (eq == std::string::npos) {
        return false;
    }
    key = Lower(Trim(text.substr(0, eq)));
    value = Trim(text.substr(eq + 1));
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    return !key.empty();
}

} // namespace

const char* ConfigSourceName(ConfigSource source) {
    switch (source) {
    case ConfigSource::OVERRIDE: return "command line";
    case ConfigSource::ENVIRONMENT: return "environment";
    case ConfigSource::FILE: return "config file";
    case ConfigSource::DEFAULT: return "default";
    }
    return "default";
}

bool CConfigParser::LoadConfigFile(const std::string& file_path) {
    m_path = file_path;
    m_file.clear();
    m_loaded = false;

    std::ifstream file(file_path);
    if (!file.is_open()) {
        LogPrintf(ENGINE, DEBUG, "No config file at %s, using defaults", file_path.c_str());
        m_loaded = true;
        return true;
    }

    struct stat st;
    if (stat(file_path.c_str(), &st) == 0 && (st.st_mode & (S_IRWXG | S_IRWXO)) != 0) {
        LogPrintf(ENGINE, WARN, "Config file %s is accessible by other users (mode %o); consider chmod 600",
                  file_path.c_str(), static_cast<unsigned>(st.st_mode & 0777));
    }

    std::stringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        LogPrintf(ENGINE, ERROR, "Failed to read config file %s", file_path.c_str());
        return false;
    }
    LoadFromString(contents.str());
    LogPrintf(ENGINE, INFO, "Loaded %zu settings from %s", m_file.size(), file_path.c_str());
    return true;
}

void CConfigParser::LoadFromString(const std::string& contents) {
    std::istringstream stream(contents);
    std::string line;
    while (std::getline(stream, line)) {
        std::string key, value;
        if (SplitSetting(line, key, value)) {
            m_file.emplace(key, value);
        }
    }
    m_loaded = true;
}

void CConfigParser::SetOverride(const std::string& key, const std::string& value) {
    m_overrides[Lower(key)] = value;
}

ConfigSource CConfigParser::Lookup(const std::string& key, std::vector<std::string>& values) const {
    values.clear();
    const std::string lower = Lower(key);

    auto ov = m_overrides.find(lower);
    if (ov != m_overrides.end()) {
        values.push_back(ov->second);
        return ConfigSource::OVERRIDE;
    }
    if (const char* env = std::getenv(EnvName(lower).c_str())) {
        values.push_back(env);
        return ConfigSource::ENVIRONMENT;
    }
    auto range = m_file.equal_range(lower);
    for (auto it = range.first; it != range.second; ++it) {
        values.push_back(it->second);
    }
    return values.empty() ? ConfigSource::DEFAULT : ConfigSource::FILE;
}

std::string CConfigParser::GetString(const std::string& key, const std::string& default_value) const {
    std::vector<std::string> values;
    if (Lookup(key, values) == ConfigSource::DEFAULT) {
        return default_value;
    }
    return values.back();
}

int64_t CConfigParser::GetInt64(const std::string& key, int64_t default_value) const {
    std::string value = GetString(key);
    if (value.empty()) {
        return default_value;
    }
    try {
        size_t used = 0;
        int64_t result = std::stoll(value, &used);
        if (used == value.size()) {
            return result;
        }
    } catch (const std::exception&) {
    }
    LogPrintf(ENGINE, WARN, "%s=%s is not an integer, using %lld", key.c_str(), value.c_str(),
              static_cast<long long>(default_value));
    return default_value;
}

double CConfigParser::GetDouble(const std::string& key, double default_value) const {
    std::string value = GetString(key);
    if (value.empty()) {
        return default_value;
    }
    try {
        size_t used = 0;
        double result = std::stod(value, &used);
        if (used == value.size()) {
            return result;
        }
    } catch (const std::exception&) {
    }
    LogPrintf(ENGINE, WARN, "%s=%s is not a number, using %g", key.c_str(), value.c_str(), default_value);
    return default_value;
}

bool CConfigParser::GetBool(const std::string& key, bool default_value) const {
    std::string value = Lower(GetString(key));
    if (value.empty()) {
        return default_value;
    }
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    LogPrintf(ENGINE, WARN, "%s=%s is not a boolean, using %s", key.c_str(), value.c_str(),
              default_value ? "true" : "false");
    return default_value;
}

std::vector<std::string> CConfigParser::GetList(const std::string& key) const {
    std::vector<std::string> values;
    Lookup(key, values);

    std::vector<std::string> result;
    for (const std::string& entry : values) {
        std::stringstream parts(entry);
        std::string item;
        while (std::getline(parts, item, ',')) {
            item = Trim(item);
            if (!item.empty()) {
                result.push_back(item);
            }
        }
    }
    return result;
}

bool CConfigParser::IsSet(const std::string& key) const {
    return !GetString(key).empty();
}

ConfigSource CConfigParser::GetSource(const std::string& key) const {
    std::vector<std::string> values;
    return Lookup(key, values);
}

std::vector<std::string> CConfigParser::GetFileKeys() const {
    std::set<std::string> keys;
    for (const auto& entry : m_file) {
        keys.insert(entry.first);
    }
    return std::vector<std::string>(keys.begin(), keys.end());
}

std::string GetDefaultDataDir() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        struct passwd* pwd = getpwuid(getuid());
        home = pwd != nullptr ? pwd->pw_dir : nullptr;
    }
    return home != nullptr ? std::string(home) + "/.proxima" : ".proxima";
}

std::string GetConfigFilePath(const std::string& datadir) {
    return (datadir.empty() ? GetDefaultDataDir() : datadir) + "/proxima.conf";
}

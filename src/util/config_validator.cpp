// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <util/config_validator.h>

#include <util/config.h>
#include <util/logging.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace {

enum class Kind { INT, DOUBLE, BOOL, PORT, TEXT };

struct Rule {
    const char* key;
    Kind kind;
    double min;
    double max;
};

constexpr int64_t DAY = 24 * 3600;

const Rule RULES[] = {
    {"maxconnections", Kind::INT, 1, 64},
    {"cooldown", Kind::INT, 0, 7 * DAY},
    {"silencewindow", Kind::INT, 1, DAY},
    {"fingerprintttl", Kind::INT, 1, DAY},
    {"advertiserefresh", Kind::INT, 1, DAY},
    {"scantick", Kind::INT, 10, 60000},
    {"steptimeout", Kind::INT, 100, 120000},
    {"maxduration", Kind::INT, 1, 3600},
    {"maxexchangemessages", Kind::INT, 2, 256},
    {"connectinterval", Kind::INT, 1, 3600},
    {"noiserotation", Kind::INT, 60, 7 * DAY},
    {"compatfloor", Kind::DOUBLE, 0.0, 1.0},
    {"learningbandmin", Kind::DOUBLE, 0.0, 1.0},
    {"learningbandmax", Kind::DOUBLE, 0.0, 1.0},
    {"insightburst", Kind::DOUBLE, 1.0, 1000.0},
    {"insightrefill", Kind::DOUBLE, 0.0, 100000.0},
    {"lanport", Kind::PORT, 1, 65535},
    {"printtoconsole", Kind::BOOL, 0, 0},
    // checked separately or free-form
    {"datadir", Kind::TEXT, 0, 0},
    {"privacylevel", Kind::TEXT, 0, 0},
    {"transports", Kind::TEXT, 0, 0},
    {"profile", Kind::TEXT, 0, 0},
    {"logfile", Kind::TEXT, 0, 0},
    {"debug", Kind::TEXT, 0, 0},
    {"conf", Kind::TEXT, 0, 0},
};

const char* const KNOWN_TRANSPORTS[] = {"lan", "loopback", "ble", "mdns"};

std::string Lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool ParseWhole(const std::string& value, int64_t& out) {
    try {
        size_t used = 0;
        out = std::stoll(value, &used);
        return used == value.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseWhole(const std::string& value, double& out) {
    try {
        size_t used = 0;
        out = std::stod(value, &used);
        return used == value.size();
    } catch (const std::exception&) {
        return false;
    }
}

ConfigValidationResult Accept(const std::string& field) {
    ConfigValidationResult result;
    result.field_name = field;
    return result;
}

ConfigValidationResult Reject(const std::string& field, const std::string& error, const std::string& suggestion) {
    ConfigValidationResult result(field, error);
    result.suggestions.push_back(suggestion);
    return result;
}

} // namespace

ConfigValidationResult CConfigValidator::ValidatePort(const std::string& value, const std::string& field_name) {
    int64_t port = 0;
    if (!ParseWhole(value, port)) {
        return Reject(field_name, "Invalid port number format", "Port must be a number between 1 and 65535");
    }
    if (port < 1 || port > 65535) {
        ConfigValidationResult result = Reject(field_name, "Port must be between 1 and 65535",
                                               "Use a valid port number (1-65535)");
        result.suggestions.push_back("Default LAN port: 47800");
        return result;
    }
    return Accept(field_name);
}

ConfigValidationResult CConfigValidator::ValidateDataDir(const std::string& path) {
    if (path.empty()) {
        return Accept("datadir");
    }
    if (path.find_first_of("<>\"|?*") != std::string::npos) {
        return Reject("datadir", "Path contains forbidden characters", "Remove < > \" | ? * from the path");
    }
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    std::error_code ec;
    if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Reject("datadir", "Cannot create data directory: " + ec.message(),
                          "Check permissions on " + parent.string());
        }
    }
    return Accept("datadir");
}

ConfigValidationResult CConfigValidator::ValidateIntRange(const std::string& value, const std::string& field_name,
                                                          int64_t min, int64_t max) {
    int64_t parsed = 0;
    if (!ParseWhole(value, parsed)) {
        return Reject(field_name, "Invalid number format for " + field_name, "Use a whole number");
    }
    if (parsed < min || parsed > max) {
        return Reject(field_name,
                      field_name + " must be between " + std::to_string(min) + " and " + std::to_string(max),
                      "Remove the setting to use the default");
    }
    return Accept(field_name);
}

ConfigValidationResult CConfigValidator::ValidateDoubleRange(const std::string& value, const std::string& field_name,
                                                             double min, double max) {
    double parsed = 0.0;
    if (!ParseWhole(value, parsed)) {
        return Reject(field_name, "Invalid number format for " + field_name, "Use a decimal number such as 0.5");
    }
    // NaN fails both comparisons
    if (!(parsed >= min && parsed <= max)) {
        return Reject(field_name,
                      field_name + " must be between " + std::to_string(min) + " and " + std::to_string(max),
                      "Remove the setting to use the default");
    }
    return Accept(field_name);
}

ConfigValidationResult CConfigValidator::ValidateBool(const std::string& value, const std::string& field_name) {
    static const char* const SPELLINGS[] = {"0", "1", "true", "false", "yes", "no", "on", "off"};
    std::string lower = Lower(value);
    for (const char* spelling : SPELLINGS) {
        if (lower == spelling) {
            return Accept(field_name);
        }
    }
    return Reject(field_name, "Invalid boolean value", "Use: 0/1, true/false, yes/no, or on/off");
}

ConfigValidationResult CConfigValidator::ValidatePrivacyLevel(const std::string& value) {
    std::string lower = Lower(value);
    if (lower == "standard" || lower == "high" || lower == "maximum") {
        return Accept("privacylevel");
    }
    return Reject("privacylevel", "Unknown privacy level '" + value + "'", "Use: standard, high, or maximum");
}

ConfigValidationResult CConfigValidator::ValidateTransport(const std::string& name) {
    if (name.empty()) {
        return Reject("transports", "Transport name cannot be empty", "Example: transports=lan,loopback");
    }
    std::string lower = Lower(name);
    for (const char* known : KNOWN_TRANSPORTS) {
        if (lower == known) {
            return Accept("transports");
        }
    }
    return Reject("transports", "Unknown transport '" + name + "'", "Known transports: lan, loopback, ble, mdns");
}

bool CConfigValidator::IsKnownKey(const std::string& key) {
    std::string lower = Lower(key);
    for (const Rule& rule : RULES) {
        if (lower == rule.key) {
            return true;
        }
    }
    return false;
}

std::vector<ConfigValidationResult> CConfigValidator::ValidateAll(const CConfigParser& config) {
    std::vector<ConfigValidationResult> results;

    for (const Rule& rule : RULES) {
        std::string value = config.GetString(rule.key, "");
        if (value.empty()) {
            continue;
        }
        switch (rule.kind) {
        case Kind::INT:
            results.push_back(ValidateIntRange(value, rule.key, static_cast<int64_t>(rule.min),
                                               static_cast<int64_t>(rule.max)));
            break;
        case Kind::DOUBLE:
            results.push_back(ValidateDoubleRange(value, rule.key, rule.min, rule.max));
            break;
        case Kind::PORT:
            results.push_back(ValidatePort(value, rule.key));
            break;
        case Kind::BOOL:
            results.push_back(ValidateBool(value, rule.key));
            break;
        case Kind::TEXT:
            break;
        }
    }

    if (config.GetDouble("learningbandmin", 0.3) > config.GetDouble("learningbandmax", 0.7)) {
        results.push_back(Reject("learningbandmin", "learningbandmin must not exceed learningbandmax",
                                 "Defaults: learningbandmin=0.3, learningbandmax=0.7"));
    }

    std::string datadir = config.GetString("datadir", "");
    if (!datadir.empty()) {
        results.push_back(ValidateDataDir(datadir));
    }
    std::string level = config.GetString("privacylevel", "");
    if (!level.empty()) {
        results.push_back(ValidatePrivacyLevel(level));
    }
    for (const std::string& name : config.GetList("transports")) {
        results.push_back(ValidateTransport(name));
    }

    for (const std::string& key : config.GetFileKeys()) {
        if (!IsKnownKey(key)) {
            LogPrintf(ENGINE, WARN, "Ignoring unknown setting '%s' in %s", key.c_str(),
                      config.GetConfigFilePath().empty() ? "config" : config.GetConfigFilePath().c_str());
        }
    }
    return results;
}

// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_UTIL_CONFIG_VALIDATOR_H
#define PROXIMA_UTIL_CONFIG_VALIDATOR_H

#include <cstdint>
#include <string>
#include <vector>

class CConfigParser;

/** Outcome of checking one setting; suggestions are shown to the operator */
struct ConfigValidationResult {
    bool valid{true};
    std::string error_message;
    std::string field_name;
    std::vector<std::string> suggestions;

    ConfigValidationResult() = default;
    ConfigValidationResult(const std::string& field, const std::string& error)
        : valid(false), error_message(error), field_name(field) {}
};

/**
 * Checks proxima.conf, environment and command-line values before
 * CEngineConfig applies any of them.
 */
class CConfigValidator {
public:
    static ConfigValidationResult ValidatePort(const std::string& value, const std::string& field_name);
    static ConfigValidationResult ValidateDataDir(const std::string& path);
    /** Inclusive range; trailing characters are rejected */
    static ConfigValidationResult ValidateIntRange(const std::string& value, const std::string& field_name,
                                                   int64_t min, int64_t max);
    static ConfigValidationResult ValidateDoubleRange(const std::string& value, const std::string& field_name,
                                                      double min, double max);
    static ConfigValidationResult ValidateBool(const std::string& value, const std::string& field_name);
    /** standard, high or maximum */
    static ConfigValidationResult ValidatePrivacyLevel(const std::string& value);
    /** One entry of the transports list */
    static ConfigValidationResult ValidateTransport(const std::string& name);

    /** True for every key the daemon reads */
    static bool IsKnownKey(const std::string& key);

    /**
     * One result per setting that is present. Unknown keys in the file are
     * logged as warnings and do not produce results.
     */
    static std::vector<ConfigValidationResult> ValidateAll(const CConfigParser& config);
};

#endif // PROXIMA_UTIL_CONFIG_VALIDATOR_H

// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <util/error_format.h>

#include <sstream>

namespace {

struct FailureInfo {
    StartupFailure kind;
    ErrorSeverity severity;
    const char* code;
    const char* title;
    std::vector<std::string> steps;
};

const FailureInfo& Lookup(StartupFailure kind) {
    static const FailureInfo TABLE[] = {
        {StartupFailure::CONFIG, ErrorSeverity::ERROR, "CONFIG", "Configuration error",
         {"Check proxima.conf and any PROXIMA_* environment variables",
          "Run with --help to see command-line options"}},
        {StartupFailure::DATADIR_LOCKED, ErrorSeverity::ERROR, "LOCKED", "Data directory in use",
         {"Stop the other proximad, or start this one with a different --datadir"}},
        {StartupFailure::STORAGE, ErrorSeverity::ERROR, "STORAGE", "Storage unavailable",
         {"Check disk space and permissions on the data directory",
          "Move the 'engine' directory aside to start with empty history"}},
        {StartupFailure::TRANSPORT, ErrorSeverity::WARNING, "TRANSPORT", "Transport unavailable",
         {"Check the 'transports' setting", "Check that a firewall allows the LAN port",
          "Discovery continues on the remaining transports"}},
        {StartupFailure::PROFILE, ErrorSeverity::WARNING, "PROFILE", "No usable profile",
         {"Pass --profile=<path> pointing at a profile JSON document",
          "The document needs user_id and all eight core dimensions in [0,1]"}},
    };
    for (const FailureInfo& info : TABLE) {
        if (info.kind == kind) {
            return info;
        }
    }
    return TABLE[0];
}

} // namespace

ErrorMessage CErrorFormatter::Make(StartupFailure kind, const std::string& subject, const std::string& details) {
    const FailureInfo& info = Lookup(kind);
    ErrorMessage error;
    error.severity = info.severity;
    error.title = info.title;
    error.description = subject.empty() ? details : subject + ": " + details;
    error.recovery_steps = info.steps;
    error.error_code = subject.empty() ? info.code : std::string(info.code) + "/" + subject;
    return error;
}

std::string CErrorFormatter::FormatForUser(const ErrorMessage& error, bool color) {
    std::ostringstream oss;
    const char* start = "";
    const char* reset = "";
    if (color) {
        start = error.severity == ErrorSeverity::ERROR ? "\033[0;31m" : "\033[0;33m";
        reset = "\033[0m";
    }

    oss << start << error.title << reset << "\n";
    oss << "  " << error.description << "\n";
    if (!error.recovery_steps.empty()) {
        oss << "\n  To resolve:\n";
        for (size_t i = 0; i < error.recovery_steps.size(); i++) {
            oss << "    " << (i + 1) << ". " << error.recovery_steps[i] << "\n";
        }
    }
    if (!error.error_code.empty()) {
        oss << "\n  Error code: " << error.error_code << "\n";
    }
    return oss.str();
}

std::string CErrorFormatter::FormatForLog(const ErrorMessage& error) {
    std::ostringstream oss;
    oss << (error.severity == ErrorSeverity::ERROR ? "[ERROR] " : "[WARNING] ") << error.title;
    if (!error.error_code.empty()) {
        oss << " (" << error.error_code << ")";
    }
    oss << ": " << error.description;
    return oss.str();
}

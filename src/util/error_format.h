// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_UTIL_ERROR_FORMAT_H
#define PROXIMA_UTIL_ERROR_FORMAT_H

#include <string>
#include <vector>

enum class ErrorSeverity {
    WARNING,   // engine keeps running with reduced function
    ERROR,     // startup aborted
};

/** What went wrong while bringing the daemon up */
enum class StartupFailure {
    CONFIG,            // invalid option or unreadable proxima.conf
    DATADIR_LOCKED,    // another proximad owns the data directory
    STORAGE,           // engine database or profile store unusable
    TRANSPORT,         // a configured medium is unavailable
    PROFILE,           // no valid profile, nothing will be advertised
};

/**
 * Structured error with recovery guidance, printed to the terminal at
 * startup or folded into one log line.
 */
struct ErrorMessage {
    ErrorSeverity severity{ErrorSeverity::ERROR};
    std::string title;
    std::string description;
    std::vector<std::string> recovery_steps;
    std::string error_code;
};

class CErrorFormatter {
public:
    /**
     * Build the message for a startup failure.
     * @param subject  option name, transport name, path or operation
     */
    static ErrorMessage Make(StartupFailure kind, const std::string& subject, const std::string& details);

    /** Multi-line terminal form; ANSI colour only when color is set */
    static std::string FormatForUser(const ErrorMessage& error, bool color = false);

    /** Single line for debug.log */
    static std::string FormatForLog(const ErrorMessage& error);
};

#endif // PROXIMA_UTIL_ERROR_FORMAT_H

// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_UTIL_LOGGING_H
#define PROXIMA_UTIL_LOGGING_H

#include <atomic>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * Category/level logging, one process-wide CLogger.
 *
 * Lines look like
 *   2025-06-01T10:15:02.381Z [INFO] [CONNECT] Connection 4 completed
 * and go to the console, to debug.log in the data directory (rotated by
 * size), and to an optional capture sink used by the tests.
 */

enum class LogCategory : uint32_t {
    NONE = 0,
    DISCOVERY = (1 << 0),     // scanning, sightings, candidate aging
    CONNECT = (1 << 1),       // connection lifecycle, cooldowns
    PROTOCOL = (1 << 2),      // exchange messages, framing
    PRIVACY = (1 << 3),       // fingerprint derivation
    TRANSPORT = (1 << 4),     // adapters and channels
    STORAGE = (1 << 5),       // persistence and profile store
    ENGINE = (1 << 6),        // startup/shutdown, connect loop
    ALL = 0xFFFFFFFF
};

// LVL_ prefix keeps clear of the ERROR macro some platform headers define
enum class LogLevel {
    LVL_ERROR = 0,
    LVL_WARN = 1,
    LVL_INFO = 2,
    LVL_DEBUG = 3
};

/** Parse "discovery", "connect", ... or "all"/"1"; false if unknown */
bool ParseLogCategory(const std::string& name, LogCategory& category);

/** Upper-case category name, "" for NONE or a combined mask */
const char* LogCategoryName(LogCategory category);
const char* LogLevelName(LogLevel level);

class CLogger {
public:
    static CLogger& GetInstance();

    void SetLevel(LogLevel level) { m_level = level; }
    LogLevel GetLevel() const { return m_level; }
    void SetCategories(uint32_t mask) { m_categories = mask; }
    uint32_t GetCategories() const { return m_categories; }
    void SetConsole(bool enable) { m_console = enable; }

    /**
     * Turn on DEBUG output for the named categories only ("all" for every
     * category). An empty list leaves the settings unchanged.
     * @param unknown receives the first name that did not parse
     */
    bool SetDebugCategories(const std::vector<std::string>& names, std::string& unknown);

    /**
     * Append to a log file. A relative path is placed in datadir.
     * The file is rotated to path.1 ... path.N once it reaches max_size.
     */
    bool OpenFile(const std::string& datadir, const std::string& path,
                  size_t max_size = 10 * 1024 * 1024, size_t max_files = 5);
    void Close();
    std::string GetFilePath() const;

    /** Receives every formatted line that passes the filters; null to detach */
    void SetCaptureSink(std::function<void(const std::string&)> sink);

    bool WillLog(LogCategory category, LogLevel level) const;
    void Log(LogCategory category, LogLevel level, const std::string& message);
    void LogFormat(LogCategory category, LogLevel level, const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 4, 5)))
#endif
        ;

    /** Format one line; exposed so the layout can be checked */
    static std::string FormatLine(int64_t time_millis, LogCategory category, LogLevel level,
                                  const std::string& message);

private:
    CLogger() = default;
    ~CLogger();

    void RotateIfNeeded();

    std::atomic<LogLevel> m_level{LogLevel::LVL_INFO};
    std::atomic<uint32_t> m_categories{static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool> m_console{true};

    mutable std::mutex m_mutex;
    std::unique_ptr<std::ofstream> m_file;
    std::string m_filePath;
    size_t m_fileSize{0};
    size_t m_maxFileSize{0};
    size_t m_maxFiles{0};
    std::function<void(const std::string&)> m_sink;
};

#define LogPrintf(category, level, format, ...)                                                        \
    do {                                                                                               \
        if (CLogger::GetInstance().WillLog(LogCategory::category, LogLevel::LVL_##level)) {            \
            CLogger::GetInstance().LogFormat(LogCategory::category, LogLevel::LVL_##level, format,     \
                                             ##__VA_ARGS__);                                           \
        }                                                                                              \
    } while (0)

#endif // PROXIMA_UTIL_LOGGING_H

// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#include <util/logging.h>

#include <util/time.h>

#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>

namespace {

struct CategoryEntry {
    LogCategory category;
    const char* name;
    const char* label;
};

const CategoryEntry CATEGORIES[] = {
    {LogCategory::DISCOVERY, "discovery", "DISCOVERY"},
    {LogCategory::CONNECT, "connect", "CONNECT"},
    {LogCategory::PROTOCOL, "protocol", "PROTOCOL"},
    {LogCategory::PRIVACY, "privacy", "PRIVACY"},
    {LogCategory::TRANSPORT, "transport", "TRANSPORT"},
    {LogCategory::STORAGE, "storage", "STORAGE"},
    {LogCategory::ENGINE, "engine", "ENGINE"},
};

} // namespace

bool ParseLogCategory(const std::string& name, LogCategory& category) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "all" || lower == "1") {
        category = LogCategory::ALL;
        return true;
    }
    for (const CategoryEntry& entry : CATEGORIES) {
        if (lower == entry.name) {
            category = entry.category;
            return true;
        }
    }
    return false;
}

const char* LogCategoryName(LogCategory category) {
    for (const CategoryEntry& entry : CATEGORIES) {
        if (entry.category == category) {
            return entry.label;
        }
    }
    return "";
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

CLogger& CLogger::GetInstance() {
    static CLogger instance;
    return instance;
}

CLogger::~CLogger() {
    Close();
}

bool CLogger::SetDebugCategories(const std::vector<std::string>& names, std::string& unknown) {
    if (names.empty()) {
        return true;
    }
    uint32_t mask = 0;
    for (const std::string& name : names) {
        LogCategory category;
        if (!ParseLogCategory(name, category)) {
            unknown = name;
            return false;
        }
        mask |= static_cast<uint32_t>(category);
    }
    m_categories = mask;
    m_level = LogLevel::LVL_DEBUG;
    return true;
}

bool CLogger::OpenFile(const std::string& datadir, const std::string& path, size_t max_size, size_t max_files) {
    std::filesystem::path file_path(path);
    if (file_path.is_relative() && !datadir.empty()) {
        file_path = std::filesystem::path(datadir) / file_path;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto file = std::make_unique<std::ofstream>(file_path, std::ios::app);
    if (!file->is_open()) {
        std::cerr << "Warning: cannot open log file " << file_path.string() << std::endl;
        return false;
    }
    std::error_code ec;
    uintmax_t existing = std::filesystem::file_size(file_path, ec);

    m_file = std::move(file);
    m_filePath = file_path.string();
    m_fileSize = ec ? 0 : static_cast<size_t>(existing);
    m_maxFileSize = max_size;
    m_maxFiles = std::max<size_t>(max_files, 1);
    return true;
}

void CLogger::Close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file) {
        m_file->flush();
    }
    m_file.reset();
    m_filePath.clear();
    m_fileSize = 0;
}

std::string CLogger::GetFilePath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_filePath;
}

void CLogger::SetCaptureSink(std::function<void(const std::string&)> sink) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sink = std::move(sink);
}

bool CLogger::WillLog(LogCategory category, LogLevel level) const {
    if (level > m_level.load()) {
        return false;
    }
    // ERROR lines are never filtered by category
    return level == LogLevel::LVL_ERROR || (m_categories.load() & static_cast<uint32_t>(category)) != 0;
}

std::string CLogger::FormatLine(int64_t time_millis, LogCategory category, LogLevel level,
                                const std::string& message) {
    std::time_t seconds = static_cast<std::time_t>(time_millis / 1000);
    std::tm utc;
    gmtime_r(&seconds, &utc);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &utc);

    char prefix[96];
    const char* label = LogCategoryName(category);
    if (label[0] != '\0') {
        snprintf(prefix, sizeof(prefix), "%s.%03dZ [%s] [%s] ", stamp, static_cast<int>(time_millis % 1000),
                 LogLevelName(level), label);
    } else {
        snprintf(prefix, sizeof(prefix), "%s.%03dZ [%s] ", stamp, static_cast<int>(time_millis % 1000),
                 LogLevelName(level));
    }
    return prefix + message;
}

void CLogger::Log(LogCategory category, LogLevel level, const std::string& message) {
    if (!WillLog(category, level)) {
        return;
    }
    std::string line = FormatLine(GetWallTimeMillis(), category, level, message);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_console) {
        (level == LogLevel::LVL_ERROR ? std::cerr : std::cout) << line << std::endl;
    }
    if (m_file) {
        RotateIfNeeded();
        if (m_file) {
            *m_file << line << '\n';
            m_file->flush();
            m_fileSize += line.size() + 1;
        }
    }
    if (m_sink) {
        m_sink(line);
    }
}

void CLogger::LogFormat(LogCategory category, LogLevel level, const char* format, ...) {
    char buffer[2048];
    va_list args;
    va_start(args, format);
    int written = vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    if (written < 0) {
        return;
    }

    std::string message(buffer);
    if (static_cast<size_t>(written) >= sizeof(buffer)) {
        message += "...";
    }
    Log(category, level, message);
}

void CLogger::RotateIfNeeded() {
    if (m_maxFileSize == 0 || m_fileSize < m_maxFileSize) {
        return;
    }
    m_file.reset();

    std::error_code ec;
    std::filesystem::remove(m_filePath + "." + std::to_string(m_maxFiles), ec);
    for (size_t i = m_maxFiles; i > 1; i--) {
        std::filesystem::rename(m_filePath + "." + std::to_string(i - 1),
                                m_filePath + "." + std::to_string(i), ec);
    }
    std::filesystem::rename(m_filePath, m_filePath + ".1", ec);
    if (ec) {
        std::cerr << "Warning: log rotation failed: " << ec.message() << std::endl;
    }

    auto file = std::make_unique<std::ofstream>(m_filePath, std::ios::trunc);
    if (file->is_open()) {
        m_file = std::move(file);
    }
    m_fileSize = 0;
}

#include "core/LogManager.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <ctime>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace CamSync {

// ==================== LogEntry ====================

std::string LogEntry::toJson() const {
    nlohmann::json j;
    j["timestamp"] = timestamp;
    j["level"] = LogManager::levelToString(level);
    j["category"] = LogManager::categoryToString(category);
    j["action"] = action;
    j["message"] = message;
    if (!details.empty()) j["details"] = details;
    if (!networkName.empty()) j["network"] = networkName;
    if (!filePath.empty()) j["filePath"] = filePath;
    return j.dump();
}

std::string LogEntry::toString() const {
    std::stringstream ss;
    ss << LogManager::formatTimestamp(timestamp) << " ";
    ss << "[" << LogManager::levelToString(level) << "] ";
    ss << "[" << LogManager::categoryToString(category) << "] ";
    ss << action << ": " << message;
    if (!details.empty()) ss << " (" << details << ")";
    if (!networkName.empty()) ss << " (network: " << networkName << ")";
    if (!filePath.empty()) ss << " (file: " << filePath << ")";
    return ss.str();
}

// ==================== RepeatLogFilter ====================

bool RepeatLogFilter::allow(const LogEntry& entry) {
    std::string key = LogManager::levelToString(entry.level) + "|" +
                      LogManager::categoryToString(entry.category) + "|" +
                      entry.action + "|" + entry.message;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_seen.insert(key).second) {
        return true;
    }
    m_suppressed++;
    return false;
}

void RepeatLogFilter::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_seen.clear();
    m_suppressed = 0;
}

int RepeatLogFilter::suppressedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_suppressed;
}

// ==================== LogManager Singleton ====================

LogManager& LogManager::instance() {
    static LogManager instance;
    return instance;
}

LogManager::LogManager() {
    // Default log directory
    const char* home = getenv("HOME");
    if (home) {
        m_logDir = std::string(home) + "/.camsync/logs";
    } else {
        m_logDir = "./logs";
    }

    m_lastFlushTime = std::chrono::steady_clock::now();
}

LogManager::~LogManager() {
    flush();
    closeLogFiles();
}

// ==================== Configuration ====================

void LogManager::setLogDirectory(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    flushWriteBuffer();
    closeLogFiles();
    m_logDir = path;
}

void LogManager::setFileOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!enabled) {
        flushWriteBuffer();
        closeLogFiles();
    }
    m_fileOutput = enabled;
}

void LogManager::setLogCallback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_logCallback = std::move(callback);
}

bool LogManager::ensureLogDirectory() {
    std::error_code ec;
    fs::create_directories(m_logDir, ec);
    if (ec) {
        std::cerr << "LogManager: Failed to create log directory '" << m_logDir
                  << "': " << ec.message() << std::endl;
        return false;
    }
    return true;
}

std::string LogManager::getCurrentDateString() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    struct tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    char buffer[16];
    snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d",
             tm_now.tm_year + 1900, tm_now.tm_mon + 1, tm_now.tm_mday);
    return buffer;
}

std::string LogManager::getActivityLogPath() const {
    return m_logDir + "/activity_" + getCurrentDateString() + ".log";
}

std::string LogManager::getErrorLogPath() const {
    return m_logDir + "/errors.log";
}

void LogManager::openLogFiles() {
    std::string currentDate = getCurrentDateString();

    // Rotate on a new day
    if (m_currentLogDate != currentDate) {
        if (m_activityLog.is_open()) m_activityLog.close();
        m_currentLogDate = currentDate;
    }

    if (!ensureLogDirectory()) return;

    if (!m_activityLog.is_open()) {
        std::string activityPath = getActivityLogPath();
        m_activityLog.open(activityPath, std::ios::app);
        if (!m_activityLog.is_open()) {
            std::cerr << "LogManager: Failed to open activity log file: " << activityPath << std::endl;
        }
    }

    if (!m_errorLog.is_open()) {
        std::string errorPath = getErrorLogPath();
        m_errorLog.open(errorPath, std::ios::app);
        if (!m_errorLog.is_open()) {
            std::cerr << "LogManager: Failed to open error log file: " << errorPath << std::endl;
        }
    }
}

void LogManager::closeLogFiles() {
    if (m_activityLog.is_open()) m_activityLog.close();
    if (m_errorLog.is_open()) m_errorLog.close();
    m_currentLogDate.clear();
}

// ==================== Static Utilities ====================

int64_t LogManager::currentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string LogManager::formatTimestamp(int64_t timestamp) {
    time_t seconds = timestamp / 1000;
    int millis = timestamp % 1000;
    struct tm tm_info;
    localtime_r(&seconds, &tm_info);

    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
             tm_info.tm_year + 1900, tm_info.tm_mon + 1, tm_info.tm_mday,
             tm_info.tm_hour, tm_info.tm_min, tm_info.tm_sec, millis);
    return buffer;
}

std::string LogManager::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        default: return "UNKNOWN";
    }
}

LogLevel LogManager::stringToLevel(const std::string& level) {
    std::string str = level;
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (str == "DEBUG") return LogLevel::Debug;
    if (str == "INFO") return LogLevel::Info;
    if (str == "WARN" || str == "WARNING") return LogLevel::Warning;
    if (str == "ERROR") return LogLevel::Error;
    return LogLevel::Info;
}

std::string LogManager::categoryToString(LogCategory cat) {
    switch (cat) {
        case LogCategory::General: return "GENERAL";
        case LogCategory::Auth: return "AUTH";
        case LogCategory::Network: return "NETWORK";
        case LogCategory::Sync: return "SYNC";
        case LogCategory::Download: return "DOWNLOAD";
        case LogCategory::Config: return "CONFIG";
        case LogCategory::System: return "SYSTEM";
        default: return "UNKNOWN";
    }
}

// ==================== Logging Methods ====================

void LogManager::log(LogLevel level, LogCategory category,
                     const std::string& action, const std::string& message,
                     const std::string& details) {
    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.action = action;
    entry.message = message;
    entry.details = details;
    write(std::move(entry));
}

void LogManager::write(LogEntry entry) {
    if (entry.level < m_minLevel) return;

    if (entry.timestamp == 0) {
        entry.timestamp = currentTimeMs();
    }

    LogCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_recentEntries.push_back(entry);
        if (m_recentEntries.size() > MAX_CACHED_ENTRIES) {
            m_recentEntries.pop_front();
        }

        if (m_fileOutput) {
            writeToFile(entry);
        }

        if (m_consoleOutput) {
            std::ostream& out = entry.level >= LogLevel::Warning ? std::cerr : std::cout;
            out << entry.toString() << std::endl;
        }

        callback = m_logCallback;
    }

    // Callback (outside lock)
    if (callback) {
        callback(entry);
    }
}

void LogManager::writeToFile(const LogEntry& entry) {
    std::string currentDate = getCurrentDateString();
    if (m_currentLogDate != currentDate || !m_activityLog.is_open()) {
        flushWriteBuffer();
        openLogFiles();
    }

    std::string logLine = entry.toString();
    m_writeBuffer.push_back(logLine);

    // Errors always go to error log immediately
    if (entry.level == LogLevel::Error && m_errorLog.is_open()) {
        m_errorLog << entry.toJson() << "\n";
        m_errorLog.flush();
    }

    auto now = std::chrono::steady_clock::now();
    bool shouldFlush = (m_writeBuffer.size() >= WRITE_BUFFER_SIZE) ||
                       ((now - m_lastFlushTime) >= FLUSH_INTERVAL) ||
                       (entry.level == LogLevel::Error);

    if (shouldFlush) {
        flushWriteBuffer();
    }
}

void LogManager::flushWriteBuffer() {
    if (m_writeBuffer.empty()) return;

    if (m_activityLog.is_open()) {
        for (const auto& line : m_writeBuffer) {
            m_activityLog << line << "\n";
        }
        m_activityLog.flush();
    }

    m_writeBuffer.clear();
    m_lastFlushTime = std::chrono::steady_clock::now();
}

void LogManager::debug(LogCategory cat, const std::string& action, const std::string& msg) {
    log(LogLevel::Debug, cat, action, msg);
}

void LogManager::info(LogCategory cat, const std::string& action, const std::string& msg) {
    log(LogLevel::Info, cat, action, msg);
}

void LogManager::warning(LogCategory cat, const std::string& action, const std::string& msg) {
    log(LogLevel::Warning, cat, action, msg);
}

void LogManager::error(LogCategory cat, const std::string& action, const std::string& msg) {
    log(LogLevel::Error, cat, action, msg);
}

// ==================== Query Methods ====================

std::vector<LogEntry> LogManager::getRecentEntries(int count) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<LogEntry> results;

    for (auto it = m_recentEntries.rbegin();
         it != m_recentEntries.rend() && static_cast<int>(results.size()) < count;
         ++it) {
        results.push_back(*it);
    }

    return results;
}

// ==================== Maintenance ====================

void LogManager::clearRecent() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_recentEntries.clear();
}

void LogManager::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    flushWriteBuffer();
    if (m_activityLog.is_open()) m_activityLog.flush();
    if (m_errorLog.is_open()) m_errorLog.flush();
}

// ==================== Logger ====================

Logger::Logger(LogCategory category,
               std::shared_ptr<RepeatLogFilter> filter,
               std::string networkName)
    : m_category(category)
    , m_filter(std::move(filter))
    , m_networkName(std::move(networkName)) {
}

void Logger::log(LogLevel level, const std::string& action, const std::string& msg,
                 const std::string& details, const std::string& filePath) const {
    LogManager& manager = LogManager::instance();
    if (level < manager.getMinLevel()) return;

    LogEntry entry;
    entry.level = level;
    entry.category = m_category;
    entry.action = action;
    entry.message = msg;
    entry.details = details;
    entry.networkName = m_networkName;
    entry.filePath = filePath;

    if (m_filter && !m_filter->allow(entry)) {
        return;
    }
    manager.write(std::move(entry));
}

void Logger::debug(const std::string& action, const std::string& msg) const {
    log(LogLevel::Debug, action, msg);
}

void Logger::info(const std::string& action, const std::string& msg) const {
    log(LogLevel::Info, action, msg);
}

void Logger::warning(const std::string& action, const std::string& msg) const {
    log(LogLevel::Warning, action, msg);
}

void Logger::error(const std::string& action, const std::string& msg,
                   const std::string& details) const {
    log(LogLevel::Error, action, msg, details);
}

Logger Logger::withCategory(LogCategory category) const {
    return Logger(category, m_filter, m_networkName);
}

Logger Logger::withNetwork(const std::string& networkName) const {
    return Logger(m_category, m_filter, networkName);
}

} // namespace CamSync

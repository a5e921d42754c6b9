#ifndef CAMSYNC_LOG_MANAGER_H
#define CAMSYNC_LOG_MANAGER_H

#include <string>
#include <vector>
#include <deque>
#include <set>
#include <memory>
#include <functional>
#include <mutex>
#include <fstream>
#include <cstdint>
#include <chrono>

namespace CamSync {

/**
 * Log levels
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * Log categories for filtering
 */
enum class LogCategory {
    General,
    Auth,
    Network,
    Sync,
    Download,
    Config,
    System
};

/**
 * Single log entry
 */
struct LogEntry {
    int64_t timestamp = 0;        // Unix timestamp in milliseconds
    LogLevel level = LogLevel::Info;
    LogCategory category = LogCategory::General;
    std::string action;           // e.g., "login_success", "clip_downloaded"
    std::string message;          // Human-readable message
    std::string details;          // Additional details

    // Optional context
    std::string networkName;      // Associated network (if any)
    std::string filePath;         // Associated file (if any)

    std::string toJson() const;
    std::string toString() const;
};

/**
 * Callback for real-time log events
 */
using LogCallback = std::function<void(const LogEntry&)>;

/**
 * RepeatLogFilter - lets each distinct message through once
 *
 * Two entries are the same message when level, category, action and
 * message text all match. Instances are owned by whoever needs
 * deduplication and handed to the Logger handles of their components.
 */
class RepeatLogFilter {
public:
    RepeatLogFilter() = default;

    RepeatLogFilter(const RepeatLogFilter&) = delete;
    RepeatLogFilter& operator=(const RepeatLogFilter&) = delete;

    /**
     * Returns true the first time an entry is seen, false afterwards
     */
    bool allow(const LogEntry& entry);

    /**
     * Forget every message seen so far
     */
    void reset();

    int suppressedCount() const;

private:
    mutable std::mutex m_mutex;
    std::set<std::string> m_seen;
    int m_suppressed = 0;
};

/**
 * LogManager - Centralized logging for all CamSync operations
 *
 * Features:
 * - Multiple log levels (Debug, Info, Warning, Error)
 * - Daily activity log plus a separate error log
 * - Real-time callbacks
 * - In-memory cache of recent entries for queries
 */
class LogManager {
public:
    /**
     * Get singleton instance
     */
    static LogManager& instance();

    // Prevent copying
    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    // ==================== Configuration ====================

    /**
     * Set log directory
     * Default: ~/.camsync/logs/
     */
    void setLogDirectory(const std::string& path);
    std::string getLogDirectory() const { return m_logDir; }

    /**
     * Set minimum log level
     */
    void setMinLevel(LogLevel level) { m_minLevel = level; }
    LogLevel getMinLevel() const { return m_minLevel; }

    /**
     * Enable/disable console output
     */
    void setConsoleOutput(bool enabled) { m_consoleOutput = enabled; }

    /**
     * Enable/disable the activity and error log files
     */
    void setFileOutput(bool enabled);

    /**
     * Set callback for real-time log events
     */
    void setLogCallback(LogCallback callback);

    // ==================== Logging Methods ====================

    void log(LogLevel level, LogCategory category,
             const std::string& action, const std::string& message,
             const std::string& details = "");

    /**
     * Log a prepared entry. The timestamp is filled in if zero.
     */
    void write(LogEntry entry);

    // Convenience methods
    void debug(LogCategory cat, const std::string& action, const std::string& msg);
    void info(LogCategory cat, const std::string& action, const std::string& msg);
    void warning(LogCategory cat, const std::string& action, const std::string& msg);
    void error(LogCategory cat, const std::string& action, const std::string& msg);

    // ==================== Query Methods ====================

    /**
     * Cached entries, newest first
     */
    std::vector<LogEntry> getRecentEntries(int count = 50);

    // ==================== Maintenance ====================

    /**
     * Drop cached entries (files are left alone)
     */
    void clearRecent();

    /**
     * Flush pending writes to disk
     */
    void flush();

    // ==================== Utilities ====================

    static std::string levelToString(LogLevel level);
    static LogLevel stringToLevel(const std::string& str);

    static std::string categoryToString(LogCategory cat);

    static int64_t currentTimeMs();
    static std::string formatTimestamp(int64_t timestamp);

private:
    LogManager();
    ~LogManager();

    // Configuration
    std::string m_logDir;
    LogLevel m_minLevel = LogLevel::Info;
    bool m_consoleOutput = true;
    bool m_fileOutput = true;
    LogCallback m_logCallback;

    // File handles
    std::ofstream m_activityLog;
    std::ofstream m_errorLog;
    std::string m_currentLogDate;

    // Thread safety
    std::mutex m_mutex;

    std::deque<LogEntry> m_recentEntries;
    static const size_t MAX_CACHED_ENTRIES = 1000;

    // Write buffer for batched disk writes
    std::vector<std::string> m_writeBuffer;
    std::chrono::steady_clock::time_point m_lastFlushTime;
    static const size_t WRITE_BUFFER_SIZE = 100;
    static constexpr std::chrono::seconds FLUSH_INTERVAL{5};

    bool ensureLogDirectory();
    void openLogFiles();
    void closeLogFiles();
    void writeToFile(const LogEntry& entry);
    void flushWriteBuffer();
    std::string getActivityLogPath() const;
    std::string getErrorLogPath() const;
    std::string getCurrentDateString() const;
};

/**
 * Logger - per-component logging handle
 *
 * Fixes the category and optionally routes entries through a shared
 * RepeatLogFilter before they reach the LogManager.
 */
class Logger {
public:
    explicit Logger(LogCategory category,
                    std::shared_ptr<RepeatLogFilter> filter = nullptr,
                    std::string networkName = "");

    void debug(const std::string& action, const std::string& msg) const;
    void info(const std::string& action, const std::string& msg) const;
    void warning(const std::string& action, const std::string& msg) const;
    void error(const std::string& action, const std::string& msg,
               const std::string& details = "") const;

    void log(LogLevel level, const std::string& action, const std::string& msg,
             const std::string& details = "", const std::string& filePath = "") const;

    LogCategory category() const { return m_category; }
    const std::shared_ptr<RepeatLogFilter>& filter() const { return m_filter; }

    /**
     * Same filter, different category/network context
     */
    Logger withCategory(LogCategory category) const;
    Logger withNetwork(const std::string& networkName) const;

private:
    LogCategory m_category;
    std::shared_ptr<RepeatLogFilter> m_filter;
    std::string m_networkName;
};

// ==================== Macros for convenient logging ====================

#define CAMSYNC_LOG_DEBUG(cat, action, msg) \
    CamSync::LogManager::instance().debug(cat, action, msg)

#define CAMSYNC_LOG_INFO(cat, action, msg) \
    CamSync::LogManager::instance().info(cat, action, msg)

#define CAMSYNC_LOG_WARNING(cat, action, msg) \
    CamSync::LogManager::instance().warning(cat, action, msg)

#define CAMSYNC_LOG_ERROR(cat, action, msg) \
    CamSync::LogManager::instance().error(cat, action, msg)

} // namespace CamSync

#endif // CAMSYNC_LOG_MANAGER_H

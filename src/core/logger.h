#pragma once
#include <atomic>
#include <deque>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// NOTE: Avoid bare ERROR / DEBUG – they collide with common platform macros.
enum class LogLevel { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR };

/// Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
std::optional<LogLevel> parseLogLevel(const std::string& name);

const char* logLevelName(LogLevel level);

/// Label printed with every line the calling thread logs. Pool workers set
/// "<pool>-<n>"; other threads print "main" until they set one.
void setThreadLogLabel(const std::string& label);
const std::string& threadLogLabel();

/// Process-wide, thread-safe log sink.
///
/// Line format: "[YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] [thread] message".
/// Every accepted line goes to the optional file, optionally to stderr,
/// and to a ring of the most recent lines.
class Logger {
public:
    static Logger& instance();

    /// Open @p path in append mode, closing any previous file.
    /// An empty path only closes the current file.
    /// @return false when the file cannot be opened.
    bool setLogFile(const std::string& path);

    void setEchoToStderr(bool enabled);

    /// Lines below this level are dropped. Default: LVL_INFO.
    void setMinLevel(LogLevel level);
    LogLevel minLevel() const;

    /// Whether a line at @p level would be written. Lets callers skip
    /// building expensive messages.
    bool enabled(LogLevel level) const;

    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message) { log(LogLevel::LVL_DEBUG, message); }
    void info(const std::string& message)  { log(LogLevel::LVL_INFO, message); }
    void warn(const std::string& message)  { log(LogLevel::LVL_WARN, message); }
    void error(const std::string& message) { log(LogLevel::LVL_ERROR, message); }

    /// The most recent lines, oldest first (at most @p count).
    std::vector<std::string> getRecentLogs(int count = 100) const;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;

    static std::string formatLine(LogLevel level, const std::string& message);

    std::atomic<int> min_level_{static_cast<int>(LogLevel::LVL_INFO)};

    mutable std::mutex mutex_;
    std::ofstream file_;
    bool echo_stderr_ = false;
    std::deque<std::string> recent_;
    static constexpr size_t kRecentCapacity = 1000;
};

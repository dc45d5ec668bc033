#include "logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

thread_local std::string t_label = "main";

std::string timestampNow() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&secs, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis;
    return oss.str();
}

} // anonymous namespace

std::optional<LogLevel> parseLogLevel(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::LVL_DEBUG;
    if (lower == "info")  return LogLevel::LVL_INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::LVL_WARN;
    if (lower == "error") return LogLevel::LVL_ERROR;
    return std::nullopt;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::LVL_DEBUG: return "DEBUG";
        case LogLevel::LVL_INFO:  return "INFO";
        case LogLevel::LVL_WARN:  return "WARN";
        case LogLevel::LVL_ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

void setThreadLogLabel(const std::string& label) {
    t_label = label;
}

const std::string& threadLogLabel() {
    return t_label;
}

// ── Logger ─────────────────────────────────────────────────────

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

bool Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    file_.clear();
    if (path.empty()) {
        return true;
    }
    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

void Logger::setEchoToStderr(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    echo_stderr_ = enabled;
}

void Logger::setMinLevel(LogLevel level) {
    min_level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::minLevel() const {
    return static_cast<LogLevel>(min_level_.load(std::memory_order_relaxed));
}

bool Logger::enabled(LogLevel level) const {
    return static_cast<int>(level) >= min_level_.load(std::memory_order_relaxed);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!enabled(level)) {
        return;
    }
    std::string line = formatLine(level, message);

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << line << '\n';
        file_.flush();
    }
    if (echo_stderr_) {
        std::cerr << line << std::endl;
    }
    recent_.push_back(std::move(line));
    while (recent_.size() > kRecentCapacity) {
        recent_.pop_front();
    }
}

std::vector<std::string> Logger::getRecentLogs(int count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t n = count <= 0 ? 0 : std::min(recent_.size(), static_cast<size_t>(count));
    return std::vector<std::string>(recent_.end() - static_cast<std::ptrdiff_t>(n), recent_.end());
}

std::string Logger::formatLine(LogLevel level, const std::string& message) {
    std::string line;
    line.reserve(message.size() + 48);
    line += '[';
    line += timestampNow();
    line += "] [";
    line += logLevelName(level);
    line += "] [";
    line += threadLogLabel();
    line += "] ";
    line += message;
    return line;
}

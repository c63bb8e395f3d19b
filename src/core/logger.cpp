#include "core/logger.h"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <filesystem>

using namespace std::chrono;

// =======================
// Singleton
// =======================
Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger()
    : lastRotation_(steady_clock::now()) {}

// =======================
// Configuration
// =======================
void Logger::setLevel(LogLevel level) {
    level_ = level;
}

LogLevel Logger::level() const {
    return level_.load();
}

void Logger::setFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    logPath_ = path;

    if (out_.is_open())
        out_.close();

    if (path.empty())
        return;

    out_.open(path, std::ios::app);
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    fileSize_ = ec ? 0 : static_cast<size_t>(size);
}

// =======================
// LogLevel helpers
// =======================
const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "UNKNOWN";
    }
}

LogLevel logLevelFromString(const std::string& s) {
    if (s == "debug")   return LogLevel::Debug;
    if (s == "info")    return LogLevel::Info;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "error")   return LogLevel::Error;
    return LogLevel::Warn;
}

// =======================
// Rotation
// =======================
void Logger::rotateIfNeeded() {
    constexpr size_t MAX_SIZE = 100 * 1024 * 1024; // 100 MB
    constexpr int KEEP = 5;

    if (!out_.is_open() || fileSize_.load() < MAX_SIZE)
        return;

    out_.close();

    std::filesystem::path base(logPath_);
    std::error_code ec;

    // file.4 -> file.5, ..., file -> file.1; the oldest generation is overwritten
    for (int i = KEEP - 1; i >= 1; --i) {
        std::filesystem::path old = base.string() + "." + std::to_string(i);
        std::filesystem::path next = base.string() + "." + std::to_string(i + 1);

        if (std::filesystem::exists(old, ec))
            std::filesystem::rename(old, next, ec);
    }

    if (std::filesystem::exists(base, ec))
        std::filesystem::rename(base, base.string() + ".1", ec);

    out_.open(logPath_, std::ios::app);
    fileSize_.store(0);
    lastRotation_ = steady_clock::now();
}

// =======================
// Logging
// =======================
void Logger::log(LogLevel level, const std::string& message) {
    if (level < level_.load())
        return;
    std::lock_guard<std::mutex> log_lock(mutex_);
    rotateIfNeeded();

    auto now = system_clock::now();
    std::time_t tt = system_clock::to_time_t(now);

    std::tm tm{};
    localtime_r(&tt, &tm);

    // stdout carries the JSON report, so console logging goes to stderr
    std::ostream& os = out_.is_open()
        ? static_cast<std::ostream&>(out_)
        : std::cerr;

    writeToStream(os, level, message, tm);

    fileSize_.fetch_add(message.size() + 32, std::memory_order_relaxed);
}

void Logger::writeToStream(
    std::ostream& os,
    LogLevel level,
    const std::string& message,
    const std::tm& tm
) {
    os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
       << " [" << levelToString(level) << "] "
       << message << std::endl;
}

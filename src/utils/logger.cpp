#include "utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace {
constexpr int levelValue(LogLevel level) {
    return static_cast<int>(level);
}

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARNING";
        case LogLevel::Error:
            return "ERROR";
        default:
            return "UNKNOWN";
    }
}

bool shouldLog(LogLevel level, LogLevel minimum) {
    return levelValue(level) >= levelValue(minimum);
}
}

Logger::Logger(std::size_t maxEntries) : maxEntries_(std::max<std::size_t>(1, maxEntries)) {
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (!shouldLog(level, minLevel_)) {
        return;
    }

    if (entries_.size() >= maxEntries_) {
        entries_.pop_front();
    }

    entries_.emplace_back(
        LogEntry{nowSeconds(), level, std::string(component), std::string(message)});
    if (sink_) {
        sink_(entries_.back());
    }
}

void Logger::debug(std::string_view component, std::string_view message) {
    log(LogLevel::Debug, component, message);
}

void Logger::info(std::string_view component, std::string_view message) {
    log(LogLevel::Info, component, message);
}

void Logger::warning(std::string_view component, std::string_view message) {
    log(LogLevel::Warning, component, message);
}

void Logger::error(std::string_view component, std::string_view message) {
    log(LogLevel::Error, component, message);
}

std::vector<LogEntry> Logger::entries() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return std::vector<LogEntry>(entries_.begin(), entries_.end());
}

std::vector<LogEntry> Logger::entriesFor(std::string_view component) const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<LogEntry> matching;
    for (const auto& entry : entries_) {
        if (entry.component == component) {
            matching.push_back(entry);
        }
    }
    return matching;
}

std::size_t Logger::size() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return entries_.size();
}

bool Logger::empty() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return entries_.empty();
}

void Logger::clear() {
    std::lock_guard<std::mutex> guard(mutex_);
    entries_.clear();
}

void Logger::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> guard(mutex_);
    minLevel_ = level;
}

LogLevel Logger::minLevel() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return minLevel_;
}

void Logger::setMaxEntries(std::size_t maxEntries) {
    std::lock_guard<std::mutex> guard(mutex_);
    maxEntries_ = std::max<std::size_t>(1, maxEntries);
    while (entries_.size() > maxEntries_) {
        entries_.pop_front();
    }
}

std::size_t Logger::maxEntries() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return maxEntries_;
}

void Logger::setSink(LogSink sink) {
    std::lock_guard<std::mutex> guard(mutex_);
    sink_ = std::move(sink);
}

std::string Logger::format(const LogEntry& entry) {
    const std::string timestamp = std::to_string(entry.timestamp);
    const std::string level = toString(entry.level);
    std::string formatted;
    formatted.reserve(timestamp.size() + level.size() + entry.component.size() + entry.message.size() + 8);
    formatted.append("[");
    formatted.append(timestamp);
    formatted.append("] [");
    formatted.append(level);
    formatted.append("] [");
    formatted.append(entry.component);
    formatted.append("] ");
    formatted.append(entry.message);
    return formatted;
}

std::optional<LogLevel> Logger::parseLevel(std::string_view value) {
    std::string lower(value);
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "debug") {
        return LogLevel::Debug;
    }
    if (lower == "info") {
        return LogLevel::Info;
    }
    if (lower == "warning" || lower == "warn") {
        return LogLevel::Warning;
    }
    if (lower == "error") {
        return LogLevel::Error;
    }
    return std::nullopt;
}

std::uint64_t Logger::nowSeconds() {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

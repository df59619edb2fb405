/**
 * @file Logger.cpp
 * @brief Implementation of the component logger
 */

#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace terrain3d {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::shared_ptr<std::ofstream> Logger::log_file_;
std::mutex Logger::registry_mutex_;

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\n\r";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARNING: return "WARN ";
        case LogLevel::INFO: return "INFO ";
        case LogLevel::DETAILED: return "DETL ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "?????";
}

std::string clock_stamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d.%03d",
                  local.tm_hour, local.tm_min, local.tm_sec, static_cast<int>(millis));
    return buffer;
}

} // namespace

Logger::Logger(std::string component_name)
    : component_name_(std::move(component_name)) {
}

Logger::~Logger() {
    flush();
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    if (static_cast<int>(level) > static_cast<int>(getFacilityLevel(component_name_))) {
        return;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    if (level == last_level_ && message == last_message_) {
        ++repeat_count_;
        return;
    }

    writeRepeatSummary();
    writeLine(level, message);
    last_message_ = message;
    last_level_ = level;
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    writeRepeatSummary();
}

void Logger::writeRepeatSummary() const {
    if (repeat_count_ > 0) {
        writeLine(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }
}

void Logger::writeLine(LogLevel level, const std::string& message) const {
    std::ostringstream line;
    line << "[" << clock_stamp() << "] " << level_tag(level) << " " << component_name_ << ": " << message;

    // Errors and warnings go to stderr so piped output stays clean
    if (level <= LogLevel::WARNING) {
        std::cerr << line.str() << std::endl;
    } else {
        std::cout << line.str() << std::endl;
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (log_file_) {
        *log_file_ << line.str() << std::endl;
    }
}

// ============================================================================
// Facility-based logging
// ============================================================================

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_[facility] = level;
}

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = facility_levels_.find(facility);
    return it != facility_levels_.end() ? it->second : default_level_;
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

bool Logger::setDefaultLogFile(const std::optional<std::string>& log_file) {
    std::shared_ptr<std::ofstream> stream;

    if (log_file) {
        std::error_code ec;
        std::filesystem::path path(*log_file);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }

        stream = std::make_shared<std::ofstream>(*log_file, std::ios::app);
        if (!stream->is_open()) {
            std::cerr << "Warning: cannot open log file " << *log_file << std::endl;
            return false;
        }
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    log_file_ = std::move(stream);
    return true;
}

std::optional<int> Logger::parseLogConfig(const std::string& config) {
    std::optional<int> default_level;

    std::istringstream entries(config);
    std::string entry;
    while (std::getline(entries, entry, ',')) {
        entry = trim(entry);
        if (entry.empty()) continue;

        std::string facility = "default";
        std::string value = entry;
        size_t equals = entry.find('=');
        if (equals != std::string::npos) {
            facility = trim(entry.substr(0, equals));
            value = trim(entry.substr(equals + 1));
        }

        int level = 0;
        try {
            level = std::clamp(std::stoi(value), 1, 6);
        } catch (const std::exception&) {
            std::cerr << "Warning: ignoring log level '" << value << "' for " << facility << std::endl;
            continue;
        }

        if (facility == "default") {
            setDefaultLevel(static_cast<LogLevel>(level));
            default_level = level;
        } else {
            setFacilityLevel(facility, static_cast<LogLevel>(level));
        }
    }

    return default_level;
}

} // namespace terrain3d

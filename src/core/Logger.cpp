/**
 * @file Logger.cpp
 * @brief Implementation of component-scoped logging
 */

#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <sstream>

namespace qreport {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::mutex Logger::registry_mutex_;
std::shared_ptr<std::ofstream> Logger::global_file_stream_;
std::mutex Logger::stream_mutex_;

namespace {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARNING: return "WARN ";
        case LogLevel::INFO: return "INFO ";
        case LogLevel::DETAILED: return "DETL ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "     ";
}

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    auto last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

} // namespace

Logger::Logger() : current_level_(LogLevel::WARNING), component_name_(""),
                   last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(const std::string& component_name)
    : current_level_(LogLevel::WARNING), component_name_(component_name),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(LogLevel level, const std::optional<std::string>& log_file)
    : current_level_(level), component_name_(""), log_file_path_(log_file),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
    if (log_file.has_value()) {
        initializeFileStream();
    }
}

Logger::Logger(const Logger& other)
    : current_level_(other.current_level_), component_name_(other.component_name_),
      log_file_path_(other.log_file_path_), file_stream_(other.file_stream_),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger& Logger::operator=(const Logger& other) {
    if (this != &other) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        current_level_ = other.current_level_;
        component_name_ = other.component_name_;
        log_file_path_ = other.log_file_path_;
        file_stream_ = other.file_stream_;
        repeat_count_ = 0;
        has_last_message_ = false;
    }
    return *this;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }

    std::lock_guard<std::mutex> stream_lock(stream_mutex_);
    std::cout.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (static_cast<int>(level) <= static_cast<int>(getEffectiveLevel())) {

        if (has_last_message_ && message == last_message_ && level == last_level_) {
            repeat_count_++;
            return;
        }

        if (has_last_message_ && repeat_count_ > 0) {
            doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        }

        doOutput(level, message);

        last_message_ = message;
        last_level_ = level;
        repeat_count_ = 0;
        has_last_message_ = true;
    }
}

void Logger::setLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(output_mutex_);

    log_file_path_ = log_file;

    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }

    if (log_file.has_value()) {
        initializeFileStream();
    }
}

void Logger::initializeFileStream() {
    try {
        if (log_file_path_.has_value()) {
            std::filesystem::path log_path(log_file_path_.value());
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            file_stream_ = std::make_shared<std::ofstream>(log_file_path_.value(), std::ios::app);

            if (!file_stream_->is_open()) {
                // Not routed through outputMessage to avoid recursion
                std::cerr << "Warning: Failed to open log file: " << log_file_path_.value() << std::endl;
                file_stream_.reset();
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Warning: Exception opening log file: " << e.what() << std::endl;
        file_stream_.reset();
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));

    std::string line = std::string("[") + timestamp + "] " + level_tag(level) + " ";
    if (!component_name_.empty()) {
        line += component_name_ + ": ";
    }
    line += message;

    std::lock_guard<std::mutex> stream_lock(stream_mutex_);

    std::cout << line << std::endl;

    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << line << std::endl;
    }

    std::shared_ptr<std::ofstream> global_stream;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        global_stream = global_file_stream_;
    }
    if (global_stream && global_stream != file_stream_ && global_stream->is_open()) {
        *global_stream << line << std::endl;
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }

    std::lock_guard<std::mutex> stream_lock(stream_mutex_);
    std::cout.flush();

    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
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
    if (it != facility_levels_.end()) {
        return it->second;
    }

    return default_level_;
}

void Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return;

    std::lock_guard<std::mutex> lock(registry_mutex_);

    std::stringstream ss(config);
    std::string token;

    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        size_t equals_pos = token.find('=');
        if (equals_pos != std::string::npos) {
            std::string facility = trim(token.substr(0, equals_pos));
            std::string level_str = trim(token.substr(equals_pos + 1));

            try {
                int level_int = std::stoi(level_str);
                LogLevel level = static_cast<LogLevel>(std::clamp(level_int, 1, 6));

                if (facility == "default") {
                    default_level_ = level;
                } else {
                    facility_levels_[facility] = level;
                }
            } catch (const std::exception&) {
                std::cerr << "Warning: Invalid log level '" << level_str << "' for facility '" << facility << "'" << std::endl;
            }
        } else {
            try {
                int level_int = std::stoi(token);
                default_level_ = static_cast<LogLevel>(std::clamp(level_int, 1, 6));
            } catch (const std::exception&) {
                std::cerr << "Warning: Invalid default log level '" << token << "'" << std::endl;
            }
        }
    }
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

void Logger::setGlobalLogFile(const std::optional<std::string>& log_file) {
    std::shared_ptr<std::ofstream> stream;
    if (log_file.has_value()) {
        std::error_code ec;
        std::filesystem::path log_path(log_file.value());
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path(), ec);
        }
        stream = std::make_shared<std::ofstream>(log_file.value(), std::ios::app);
        if (!stream->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << log_file.value() << std::endl;
            stream.reset();
        }
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    global_file_stream_ = stream;
}

LogLevel Logger::getEffectiveLevel() const {
    if (!component_name_.empty()) {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }

    // An explicitly configured instance level wins over the global default
    if (current_level_ != LogLevel::WARNING) {
        return current_level_;
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    return default_level_;
}

} // namespace qreport

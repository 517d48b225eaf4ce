#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

std::mutex Logger::mutex_;
LogLevel Logger::currentLevel_ = LogLevel::INFO;
bool Logger::initialized_ = false;
bool Logger::console_ = true;
std::string Logger::logPath_ = "/tmp/ftassist.log";
std::ofstream Logger::logFile_;

bool Logger::initialize(const std::string& logPath, LogLevel level, bool console) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        std::cerr << "Logger already initialized with " << logPath_ << std::endl;
        return false;
    }

    try {
        std::filesystem::path logDir = std::filesystem::path(logPath).parent_path();
        if (!logDir.empty() && !std::filesystem::exists(logDir)) {
            std::filesystem::create_directories(logDir);
        }

        logFile_.open(logPath, std::ios::out | std::ios::app);
        if (!logFile_.is_open()) {
            std::cerr << "Failed to open log file " << logPath << ": " << std::strerror(errno) << std::endl;
            return false;
        }

        logPath_ = logPath;
        currentLevel_ = level;
        console_ = console;
        initialized_ = true;
    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        return false;
    }

    logFile_ << formatLine(LogLevel::INFO, "Logger initialized with level " + levelToString(level));
    logFile_.flush();
    return true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        logFile_ << formatLine(LogLevel::INFO, "Logger shutting down");
        logFile_.close();
        initialized_ = false;
    }
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

bool Logger::isInitialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Without a log file only warnings and worse make it out, on stderr
    if (!initialized_) {
        if (level >= LogLevel::WARNING) {
            std::cerr << formatLine(level, message);
        }
        return;
    }

    if (level < currentLevel_) {
        return;
    }

    std::string line = formatLine(level, message);

    if (console_) {
        if (level >= LogLevel::ERROR) {
            std::cerr << line;
            std::cerr.flush();
        } else {
            std::cout << line;
            std::cout.flush();
        }
    }

    logFile_ << line;
    logFile_.flush();
    if (!logFile_) {
        std::cerr << "Failed to write log file " << logPath_ << std::endl;
        logFile_.clear();
    }
}

std::string Logger::formatLine(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << ms.count()
       << " [" << levelToString(level) << "]"
       << " [" << std::this_thread::get_id() << "] "
       << message << "\n";
    return ss.str();
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::FATAL, message);
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKNOWN";
    }
}

std::optional<LogLevel> Logger::levelFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    return std::nullopt;
}

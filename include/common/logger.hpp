#pragma once

#include <fstream>
#include <mutex>
#include <optional>
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

class Logger {
public:
    static bool initialize(const std::string& logPath, LogLevel level = LogLevel::INFO, bool console = true);
    static void shutdown();
    static void setLogLevel(LogLevel level);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);
    static void fatal(const std::string& message);
    static bool isInitialized();

    static std::string levelToString(LogLevel level);
    static std::optional<LogLevel> levelFromString(const std::string& name);

private:
    static void log(LogLevel level, const std::string& message);
    static std::string formatLine(LogLevel level, const std::string& message);

    static std::mutex mutex_;
    static LogLevel currentLevel_;
    static bool initialized_;
    static bool console_;
    static std::string logPath_;
    static std::ofstream logFile_;
};

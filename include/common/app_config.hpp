#pragma once

#include "common/logger.hpp"
#include "transfer/transfer_config.hpp"
#include <nlohmann/json.hpp>
#include <string>

struct AppConfig {
    TransferConfig transfer;
    std::string logFile = "/tmp/ftassist.log";
    LogLevel logLevel = LogLevel::INFO;

    // Reads a JSON settings file over the current values. Keys that are
    // absent keep their value; a bad value fails the whole load.
    static bool loadFromFile(const std::string& path, AppConfig& config, std::string& error);
    static bool loadFromJson(const nlohmann::json& document, AppConfig& config, std::string& error);

    nlohmann::json toJson() const;
};

#include "common/app_config.hpp"
#include <fstream>

using json = nlohmann::json;

namespace {

bool readPositive(const json& section, const std::string& key, size_t& out, std::string& error) {
    auto it = section.find(key);
    if (it == section.end()) {
        return true;
    }
    if (!it->is_number_integer() || it->get<long long>() <= 0) {
        error = "transfer." + key + " must be a positive integer";
        return false;
    }
    out = static_cast<size_t>(it->get<long long>());
    return true;
}

bool readBool(const json& section, const std::string& prefix, const std::string& key,
              bool& out, std::string& error) {
    auto it = section.find(key);
    if (it == section.end()) {
        return true;
    }
    if (!it->is_boolean()) {
        error = prefix + "." + key + " must be true or false";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool readString(const json& section, const std::string& prefix, const std::string& key,
                std::string& out, std::string& error) {
    auto it = section.find(key);
    if (it == section.end()) {
        return true;
    }
    if (!it->is_string() || it->get<std::string>().empty()) {
        error = prefix + "." + key + " must be a non-empty string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool loadTransferSection(const json& section, TransferConfig& transfer, std::string& error) {
    if (!section.is_object()) {
        error = "transfer must be an object";
        return false;
    }

    if (!readPositive(section, "chunk_size", transfer.chunkSize, error) ||
        !readPositive(section, "checksum_block_size", transfer.checksumBlockSize, error) ||
        !readPositive(section, "workers", transfer.workerCount, error) ||
        !readBool(section, "transfer", "verify_checksum", transfer.verifyChecksum, error) ||
        !readBool(section, "transfer", "preserve_timestamps", transfer.preserveTimestamps, error)) {
        return false;
    }

    auto timeout = section.find("stop_timeout_ms");
    if (timeout != section.end()) {
        if (!timeout->is_number_integer() || timeout->get<long long>() < 0) {
            error = "transfer.stop_timeout_ms must be a non-negative integer";
            return false;
        }
        transfer.stopTimeout = std::chrono::milliseconds(timeout->get<long long>());
    }

    // The settings dialog has written both spellings over time
    for (const char* key : {"conflict_resolution", "overwrite_policy"}) {
        std::string policyName;
        if (!readString(section, "transfer", key, policyName, error)) {
            return false;
        }
        if (policyName.empty()) {
            continue;
        }
        auto policy = conflictPolicyFromString(policyName);
        if (!policy) {
            error = std::string("transfer.") + key + " has unknown policy '" + policyName + "'";
            return false;
        }
        transfer.conflictPolicy = *policy;
    }
    return true;
}

} // namespace

bool AppConfig::loadFromFile(const std::string& path, AppConfig& config, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Failed to open config file: " + path;
        return false;
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        error = "Failed to parse config file " + path + ": " + e.what();
        return false;
    }

    if (!loadFromJson(document, config, error)) {
        error = path + ": " + error;
        return false;
    }
    Logger::debug("Loaded configuration from " + path);
    return true;
}

bool AppConfig::loadFromJson(const json& document, AppConfig& config, std::string& error) {
    if (!document.is_object()) {
        error = "configuration root must be an object";
        return false;
    }

    AppConfig updated = config;

    auto transfer = document.find("transfer");
    if (transfer != document.end() && !loadTransferSection(*transfer, updated.transfer, error)) {
        return false;
    }

    auto logging = document.find("logging");
    if (logging != document.end()) {
        if (!logging->is_object()) {
            error = "logging must be an object";
            return false;
        }
        if (!readString(*logging, "logging", "file", updated.logFile, error)) {
            return false;
        }
        std::string levelName;
        if (!readString(*logging, "logging", "level", levelName, error)) {
            return false;
        }
        if (!levelName.empty()) {
            auto level = Logger::levelFromString(levelName);
            if (!level) {
                error = "logging.level has unknown level '" + levelName + "'";
                return false;
            }
            updated.logLevel = *level;
        }
    }

    config = updated;
    return true;
}

json AppConfig::toJson() const {
    json document;
    document["transfer"] = {
        {"chunk_size", transfer.chunkSize},
        {"verify_checksum", transfer.verifyChecksum},
        {"checksum_block_size", transfer.checksumBlockSize},
        {"workers", transfer.workerCount},
        {"stop_timeout_ms", transfer.stopTimeout.count()},
        {"overwrite_policy", toString(transfer.conflictPolicy)},
        {"preserve_timestamps", transfer.preserveTimestamps}
    };
    document["logging"] = {
        {"file", logFile},
        {"level", Logger::levelToString(logLevel)}
    };
    return document;
}

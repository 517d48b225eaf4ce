#pragma once

#include "common/app_config.hpp"
#include "transfer/transfer_item.hpp"
#include "transfer/transfer_queue.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct TransferRequest {
    std::string source;
    std::string destination;
};

struct TransferOptions {
    AppConfig config;
    std::string configPath;
    std::vector<TransferRequest> requests;
    bool jsonOutput = false;
};

class TransferCLI {
public:
    TransferCLI() = default;

    // Returns the process exit code
    int run(int argc, char* argv[]);
    static void printUsage();

    static nlohmann::json snapshotToJson(const TransferSnapshot& snapshot);
    static nlohmann::json progressToJson(const OverallProgress& progress);

private:
    int handleTransferCommand(int argc, char* argv[]);
    int handleChecksumCommand(int argc, char* argv[]);
    int handleConfigCommand(int argc, char* argv[]);
    bool parseTransferOptions(int argc, char* argv[], TransferOptions& options, std::string& error);
    bool loadConfigOption(int argc, char* argv[], AppConfig& config, std::string& configPath,
                          std::string& error);
    void attachConsoleReporter(TransferQueue& queue) const;
};

#include "cli/transfer_cli.hpp"
#include "common/logger.hpp"
#include "transfer/checksum_verifier.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>

using json = nlohmann::json;

namespace {

std::atomic<bool> interruptRequested{false};

void handleInterrupt(int) {
    interruptRequested.store(true);
}

bool parseSize(const std::string& text, size_t& value) {
    try {
        size_t used = 0;
        long long parsed = std::stoll(text, &used);
        if (used != text.size() || parsed <= 0) {
            return false;
        }
        value = static_cast<size_t>(parsed);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string formatTime(const std::optional<TimePoint>& time) {
    if (!time) {
        return "";
    }
    std::time_t t = std::chrono::system_clock::to_time_t(*time);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string formatBytes(uint64_t bytes) {
    const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::stringstream ss;
    ss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << ' ' << units[unit];
    return ss.str();
}

} // namespace

void TransferCLI::printUsage() {
    std::cout << "Usage: ftassist [command] [options]\n"
              << "Commands:\n"
              << "  transfer  - Copy files or directories\n"
              << "  checksum  - Print SHA-256 digests of files\n"
              << "  config    - Print the effective configuration\n"
              << "\n"
              << "Transfer options:\n"
              << "  -s, --source PATH        Source file or directory (repeatable)\n"
              << "  -d, --dest PATH          Destination for the preceding source (repeatable)\n"
              << "  --verify                 Verify copies with SHA-256\n"
              << "  --chunk-size BYTES       Copy chunk size\n"
              << "  --workers N              Number of parallel transfers\n"
              << "  --on-conflict POLICY     skip, overwrite, rename or ask\n"
              << "  --config FILE            JSON configuration file\n"
              << "  --log-file FILE          Log file path\n"
              << "  --log-level LEVEL        debug, info, warning, error\n"
              << "  --json                   Print the final report as JSON\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help    Show this help message\n"
              << "  -v, --version Show version information\n";
}

int TransferCLI::run(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        printUsage();
        return 0;
    }
    if (command == "-v" || command == "--version") {
        std::cout << "ftassist version 1.0.0\n";
        return 0;
    }

    // Drop the program name so handlers see the command as argv[0]
    if (command == "transfer") {
        return handleTransferCommand(argc - 1, argv + 1);
    } else if (command == "checksum") {
        return handleChecksumCommand(argc - 1, argv + 1);
    } else if (command == "config") {
        return handleConfigCommand(argc - 1, argv + 1);
    }

    std::cerr << "Error: Unknown command: " << command << std::endl;
    printUsage();
    return 1;
}

bool TransferCLI::loadConfigOption(int argc, char* argv[], AppConfig& config,
                                   std::string& configPath, std::string& error) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                error = "--config requires a file";
                return false;
            }
            configPath = argv[++i];
        }
    }

    if (configPath.empty()) {
        return true;
    }
    return AppConfig::loadFromFile(configPath, config, error);
}

bool TransferCLI::parseTransferOptions(int argc, char* argv[], TransferOptions& options,
                                       std::string& error) {
    // The config file is applied first so the command line can override it
    if (!loadConfigOption(argc, argv, options.config, options.configPath, error)) {
        return false;
    }

    std::vector<std::string> sources;
    std::vector<std::string> destinations;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto needValue = [&](std::string& value) {
            if (i + 1 >= argc) {
                error = arg + " requires a value";
                return false;
            }
            value = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "-s" || arg == "--source") {
            if (!needValue(value)) return false;
            sources.push_back(value);
        } else if (arg == "-d" || arg == "--dest") {
            if (!needValue(value)) return false;
            destinations.push_back(value);
        } else if (arg == "--verify") {
            options.config.transfer.verifyChecksum = true;
        } else if (arg == "--chunk-size") {
            if (!needValue(value)) return false;
            if (!parseSize(value, options.config.transfer.chunkSize)) {
                error = "Invalid chunk size: " + value;
                return false;
            }
        } else if (arg == "--workers") {
            if (!needValue(value)) return false;
            if (!parseSize(value, options.config.transfer.workerCount)) {
                error = "Invalid worker count: " + value;
                return false;
            }
        } else if (arg == "--on-conflict") {
            if (!needValue(value)) return false;
            auto policy = conflictPolicyFromString(value);
            if (!policy) {
                error = "Unknown conflict policy: " + value;
                return false;
            }
            options.config.transfer.conflictPolicy = *policy;
        } else if (arg == "--config") {
            ++i;
        } else if (arg == "--log-file") {
            if (!needValue(options.config.logFile)) return false;
        } else if (arg == "--log-level") {
            if (!needValue(value)) return false;
            auto level = Logger::levelFromString(value);
            if (!level) {
                error = "Unknown log level: " + value;
                return false;
            }
            options.config.logLevel = *level;
        } else if (arg == "--json") {
            options.jsonOutput = true;
        } else {
            error = "Unknown option: " + arg;
            return false;
        }
    }

    if (sources.empty()) {
        error = "At least one --source/--dest pair is required";
        return false;
    }
    if (sources.size() != destinations.size()) {
        error = "Every --source needs a matching --dest";
        return false;
    }
    for (size_t i = 0; i < sources.size(); ++i) {
        options.requests.push_back({sources[i], destinations[i]});
    }
    return true;
}

void TransferCLI::attachConsoleReporter(TransferQueue& queue) const {
    auto lastPercent = std::make_shared<std::map<std::string, int>>();
    auto outputMutex = std::make_shared<std::mutex>();

    queue.events().start.subscribe([outputMutex](const TransferSnapshot& snapshot) {
        std::lock_guard<std::mutex> lock(*outputMutex);
        std::cout << "==> " << snapshot.source << " -> " << snapshot.destination << std::endl;
    });

    queue.events().progress.subscribe([lastPercent, outputMutex](const TransferSnapshot& snapshot) {
        int percent = static_cast<int>(snapshot.progressFraction * 100.0);
        std::lock_guard<std::mutex> lock(*outputMutex);
        auto it = lastPercent->find(snapshot.id);
        if (it != lastPercent->end() && it->second / 10 == percent / 10) {
            return;
        }
        (*lastPercent)[snapshot.id] = percent;
        std::cout << "    " << std::setw(3) << percent << "%  "
                  << formatBytes(snapshot.bytesTransferred) << " / "
                  << formatBytes(snapshot.totalBytes) << std::endl;
    });

    queue.events().complete.subscribe([outputMutex](const TransferSnapshot& snapshot) {
        std::lock_guard<std::mutex> lock(*outputMutex);
        std::cout << "    " << toString(snapshot.status);
        if (!snapshot.error.empty()) {
            std::cout << ": " << snapshot.error;
        }
        if (snapshot.status == TransferStatus::Completed) {
            std::cout << " (" << formatBytes(snapshot.bytesTransferred) << ", "
                      << formatBytes(static_cast<uint64_t>(snapshot.speed)) << "/s)";
        }
        if (snapshot.isDirectory && snapshot.filesFailed > 0) {
            std::cout << " [" << snapshot.filesFailed << " file(s) failed]";
        }
        std::cout << std::endl;
    });
}

int TransferCLI::handleTransferCommand(int argc, char* argv[]) {
    TransferOptions options;
    std::string error;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        }
    }

    if (!parseTransferOptions(argc, argv, options, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    if (!Logger::initialize(options.config.logFile, options.config.logLevel, false)) {
        std::cerr << "Failed to initialize logger at " << options.config.logFile << std::endl;
        return 1;
    }

    TransferQueue queue(options.config.transfer);
    if (!options.jsonOutput) {
        attachConsoleReporter(queue);
    }

    std::vector<std::string> ids;
    for (const auto& request : options.requests) {
        std::error_code ec;
        bool isDirectory = std::filesystem::is_directory(request.source, ec);
        ids.push_back(queue.enqueue(std::filesystem::absolute(request.source, ec),
                                    std::filesystem::absolute(request.destination, ec),
                                    isDirectory));
    }

    interruptRequested.store(false);
    auto previousHandler = std::signal(SIGINT, handleInterrupt);

    queue.start();
    bool stopRequested = false;
    while (!queue.waitForCompletion(std::chrono::milliseconds(200))) {
        if (interruptRequested.load() && !stopRequested) {
            std::cerr << "Interrupted, stopping transfers..." << std::endl;
            Logger::warning("Interrupted by user");
            stopRequested = true;
            queue.stop();
        }
    }
    std::signal(SIGINT, previousHandler);

    OverallProgress progress = queue.overallProgress();
    if (options.jsonOutput) {
        json report;
        report["transfers"] = json::array();
        for (const auto& id : ids) {
            auto snapshot = queue.statusOf(id);
            if (snapshot) {
                report["transfers"].push_back(snapshotToJson(*snapshot));
            }
        }
        report["summary"] = progressToJson(progress);
        std::cout << report.dump(4) << std::endl;
    } else {
        std::cout << progress.completed << " of " << progress.total << " transfer(s) finished, "
                  << progress.skipped << " skipped, " << progress.failed << " failed, "
                  << progress.queued << " not started" << std::endl;
    }

    Logger::shutdown();
    return (progress.failed > 0 || progress.queued > 0) ? 2 : 0;
}

int TransferCLI::handleChecksumCommand(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Error: checksum needs at least one file" << std::endl;
        return 1;
    }

    int status = 0;
    for (int i = 1; i < argc; i++) {
        try {
            std::cout << ChecksumVerifier::digest(argv[i]) << "  " << argv[i] << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "ftassist: " << e.what() << std::endl;
            status = 1;
        }
    }
    return status;
}

int TransferCLI::handleConfigCommand(int argc, char* argv[]) {
    AppConfig config;
    std::string configPath;
    std::string error;
    if (!loadConfigOption(argc, argv, config, configPath, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }
    std::cout << config.toJson().dump(4) << std::endl;
    return 0;
}

json TransferCLI::snapshotToJson(const TransferSnapshot& snapshot) {
    json j = {
        {"id", snapshot.id},
        {"source", snapshot.source},
        {"destination", snapshot.destination},
        {"is_directory", snapshot.isDirectory},
        {"status", toString(snapshot.status)},
        {"bytes_transferred", snapshot.bytesTransferred},
        {"total_bytes", snapshot.totalBytes},
        {"progress", snapshot.progressFraction},
        {"speed", snapshot.speed},
        {"duration", snapshot.duration}
    };
    j["error"] = snapshot.error.empty() ? json(nullptr) : json(snapshot.error);
    j["started_at"] = snapshot.startedAt ? json(formatTime(snapshot.startedAt)) : json(nullptr);
    j["finished_at"] = snapshot.finishedAt ? json(formatTime(snapshot.finishedAt)) : json(nullptr);
    if (snapshot.isDirectory) {
        j["files"] = {
            {"transferred", snapshot.filesTransferred},
            {"skipped", snapshot.filesSkipped},
            {"failed", snapshot.filesFailed}
        };
    }
    return j;
}

json TransferCLI::progressToJson(const OverallProgress& progress) {
    return {
        {"total", progress.total},
        {"completed", progress.completed},
        {"failed", progress.failed},
        {"active", progress.active},
        {"queued", progress.queued},
        {"skipped", progress.skipped},
        {"bytes_transferred", progress.bytesTransferred},
        {"progress", progress.percentComplete}
    };
}

#include "cli/transfer_cli.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    try {
        TransferCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        if (Logger::isInitialized()) {
            Logger::error("Error in main: " + std::string(e.what()));
        }
        return 1;
    }
}

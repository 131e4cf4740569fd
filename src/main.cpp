#include "backup_api.hpp"
#include "backup_service.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <path>] "
              << "{backup|list|cleanup|restore <file>|delete <file>|import <path>}" << std::endl;
    std::cerr << "       " << program << " [--config <path>] --daemon" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    bool daemonMode = false;
    std::string configFile = "backup_config.json";
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--daemon") {
            daemonMode = true;
        } else if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (daemonMode) {
        try {
            BackupService service(configFile);
            service.runDaemon();
        } catch (const std::exception& e) {
            std::cerr << "Error: Daemon failed to start: " << e.what() << std::endl;
            return 1;
        }
        return 0;
    }

    if (positional.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string& command = positional[0];
    auto needsName = [&]() {
        if (positional.size() < 2) {
            std::cerr << "Error: '" << command << "' needs a file argument" << std::endl;
            return false;
        }
        return true;
    };

    if (command == "backup") {
        auto result = BackupAPI::startBackup(configFile);
        if (!result) {
            std::cerr << "Error: " << result.error() << std::endl;
            return 1;
        }
        std::cout << "Backup created: " << *result << std::endl;
    } else if (command == "list") {
        auto result = BackupAPI::listBackups(configFile);
        if (!result) {
            std::cerr << "Error: " << result.error() << std::endl;
            return 1;
        }
        std::cout << result->toStyledString();
    } else if (command == "cleanup") {
        auto result = BackupAPI::cleanupBackups(configFile);
        if (!result) {
            std::cerr << "Error: " << result.error() << std::endl;
            return 1;
        }
        std::cout << "Deleted " << *result << " redundant backups." << std::endl;
    } else if (command == "restore") {
        if (!needsName()) {
            return 1;
        }
        auto result = BackupAPI::restoreBackup(configFile, positional[1]);
        if (!result) {
            std::cerr << "Error: " << result.error() << std::endl;
            return 1;
        }
        std::cout << "Database restored successfully. Application might need a restart." << std::endl;
    } else if (command == "delete") {
        if (!needsName()) {
            return 1;
        }
        auto result = BackupAPI::deleteBackup(configFile, positional[1]);
        if (!result) {
            std::cerr << "Error: " << result.error() << std::endl;
            return 1;
        }
        std::cout << "Deleted " << positional[1] << std::endl;
    } else if (command == "import") {
        if (!needsName()) {
            return 1;
        }
        auto result = BackupAPI::importBackup(configFile, positional[1]);
        if (!result) {
            std::cerr << "Error: " << result.error() << std::endl;
            return 1;
        }
        std::cout << "Database imported successfully." << std::endl;
    } else {
        printUsage(argv[0]);
        return 1;
    }

    return 0;
}

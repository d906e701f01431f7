#include <iostream>
#include <string>
#include <vector>
#include <limits>
#include <memory>
#include <exception>

#include "core/BackupEngine.hpp"
#include "core/BackupService.hpp"
#include "core/BackupSession.hpp"
#include "utils/ConsoleLogger.hpp"
#include "utils/ZipPackager.hpp"

// 配置结构体定义
struct AppConfig {
    std::string sourceDir = "./source";
    std::string backupDir = "./backup";
    int intervalMinutes = 30;
};

// 用户界面抽象接口
class IUserInterface {
public:
    virtual ~IUserInterface() = default;

    virtual void initialize() = 0;

    virtual void run() = 0;

    virtual void showHelp() = 0;

    // 启动定时备份
    virtual void startTimedBackup() = 0;

    // 停止定时备份
    virtual void stopTimedBackup() = 0;

    // 立即执行一次完整备份
    virtual void performBackup() = 0;

    virtual void performRestore() = 0;

    virtual void listArchives() = 0;

    virtual void setSourceDirectory() = 0;

    virtual void setBackupDirectory() = 0;

    virtual void setInterval() = 0;

    virtual void showMessage(const std::string& message) = 0;

    virtual void showError(const std::string& message) = 0;
};

// 控制器类 - 处理业务逻辑，与具体界面实现解耦合
class ApplicationController {
private:
    IUserInterface* ui;  // 使用原始指针避免循环依赖
    ConsoleLogger& logger;
    AppConfig config;
    BackupService service;

    LogCallback makeLogCallback() {
        return [this](const std::string& message) { logger.info(message); };
    }

public:
    ApplicationController(IUserInterface* ui, ConsoleLogger& logger)
        : ui(ui), logger(logger) {}

    void setUserInterface(IUserInterface* ui) {
        this->ui = ui;
    }

    void start() {
        if (ui) {
            ui->initialize();
            ui->run();
        }
    }

    AppConfig& getConfig() {
        return config;
    }

    bool isBackupRunning() {
        return service.isRunning();
    }

    bool startTimedBackup() {
        bool success = service.start(config.sourceDir, config.backupDir, config.intervalMinutes, makeLogCallback());
        if (!success) {
            auto error = service.getLastError();
            if (ui) ui->showError(error ? toString(error->kind) + ": " + error->message : "Failed to start backup service");
        }
        return success;
    }

    void stopTimedBackup() {
        service.stop();
    }

    // 单次备份使用独立会话，总是完整备份
    bool executeBackup() {
        BackupConfig backupConfig(config.sourceDir, config.backupDir, config.intervalMinutes);
        BackupError error;
        if (!BackupEngine::validateConfig(backupConfig, error)) {
            logger.error(error.message);
            if (ui) ui->showError(error.message);
            return false;
        }

        BackupSession session(backupConfig, &logger);
        PassResult result = session.runPass();
        if (result.status != TaskStatus::COMPLETED) {
            if (ui) ui->showError("Backup operation failed");
            return false;
        }
        if (ui) {
            ui->showMessage(result.archiveWritten
                ? "Backup written to " + result.archivePath.string()
                : "Nothing to back up");
        }
        return true;
    }

    bool executeRestore(const std::string& archivePath, const std::string& restoreDir) {
        RestoreResult result = BackupService::restore(archivePath, restoreDir, makeLogCallback());
        if (result.success) {
            if (ui) ui->showMessage("Restore operation completed successfully");
        } else {
            if (ui) ui->showError(result.error ? result.error->message : "Restore operation failed");
        }
        return result.success;
    }

    std::vector<fs::path> getArchives() {
        return BackupEngine::listArchives(config.backupDir);
    }

    ConsoleLogger& getLogger() {
        return logger;
    }
};

// 命令行界面实现 - 作为IUserInterface的具体实现
class CommandLineInterface : public IUserInterface {
private:
    ApplicationController& controller;
    int argc;
    char** argv;

public:
    CommandLineInterface(ApplicationController& controller, int argc, char** argv)
        : controller(controller), argc(argc), argv(argv) {}

    void initialize() override {
    }

    void run() override {
        // 首先尝试解析命令行参数
        if (argc > 1) {
            if (!parseArguments()) {
                return;
            }
        }

        int choice;
        do {
            displayMenu();
            std::cout << "Please choose your operation [0-9]: ";

            while (!(std::cin >> choice)) {
                if (std::cin.eof()) {
                    choice = 0;
                    break;
                }
                std::cin.clear();
                std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
                std::cout << "Invalid input, please enter a number [0-9]: ";
            }

            handleUserChoice(choice);
        } while (choice != 0);

        controller.stopTimedBackup();
    }

    void showHelp() override {
        std::cout << "=== Zip Backup Help Information ===\n";
        std::cout << "Usage: zipbackup [options] [command]\n\n";
        std::cout << "Commands:\n";
        std::cout << "  start, -s                 Run scheduled backups until Enter is pressed\n";
        std::cout << "  backup, -b                Run one full backup now\n";
        std::cout << "  restore, -r <zip> <dir>   Restore an archive into a directory\n";
        std::cout << "  list, -l                  List archives in the backup directory\n";
        std::cout << "  -h, --help                Show this help information\n\n";
        std::cout << "Options:\n";
        std::cout << "  --source <path>           Set source directory path\n";
        std::cout << "  --backup <path>           Set backup directory path\n";
        std::cout << "  --interval <minutes>      Set backup interval in minutes (default: 30)\n";
        std::cout << "  --verbose                 Log every archived file\n\n";
        std::cout << "Examples:\n";
        std::cout << "  zipbackup --source ./data --backup ./backup --interval 5 start\n";
        std::cout << "  zipbackup --backup ./backup list\n";
        std::cout << "  zipbackup restore ./backup/backup_20240101_120000.zip ./restored\n";
    }

    void startTimedBackup() override {
        if (controller.isBackupRunning()) {
            showMessage("Timed backup is already running");
            return;
        }
        if (controller.startTimedBackup()) {
            showMessage("Timed backup started, use menu option 2 to stop it");
        }
    }

    void stopTimedBackup() override {
        if (!controller.isBackupRunning()) {
            showMessage("Timed backup is not running");
            return;
        }
        controller.stopTimedBackup();
    }

    void performBackup() override {
        controller.executeBackup();
    }

    void performRestore() override {
        std::string archivePath;
        std::string restoreDir;
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        std::cout << "Enter archive path: ";
        std::getline(std::cin, archivePath);
        std::cout << "Enter restore directory: ";
        std::getline(std::cin, restoreDir);
        if (archivePath.empty() || restoreDir.empty()) {
            showError("Both the archive and the restore directory are required");
            return;
        }
        controller.executeRestore(archivePath, restoreDir);
    }

    void listArchives() override {
        AppConfig& config = controller.getConfig();
        auto archives = controller.getArchives();
        if (archives.empty()) {
            std::cout << "No archives found in " << config.backupDir << "\n";
            return;
        }

        ZipPackager packager;
        for (const auto& archive : archives) {
            std::vector<std::string> entries;
            if (!packager.listEntries(archive, entries)) {
                showError(packager.getLastError());
                continue;
            }
            std::cout << archive.filename().string() << " (" << entries.size() << " entries)\n";
            for (const auto& entry : entries) {
                std::cout << "    " << entry << "\n";
            }
        }
    }

    void setSourceDirectory() override {
        AppConfig& config = controller.getConfig();
        std::string newPath;
        std::cout << "Enter new source directory path (Current: " << config.sourceDir << ", press Enter to keep unchanged): ";
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        std::getline(std::cin, newPath);
        if (!newPath.empty()) {
            config.sourceDir = newPath;
            std::cout << "Source directory updated to: " << config.sourceDir << "\n";
        }
    }

    void setBackupDirectory() override {
        AppConfig& config = controller.getConfig();
        std::string newPath;
        std::cout << "Enter new backup directory path (Current: " << config.backupDir << ", press Enter to keep unchanged): ";
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        std::getline(std::cin, newPath);
        if (!newPath.empty()) {
            config.backupDir = newPath;
            std::cout << "Backup directory updated to: " << config.backupDir << "\n";
        }
    }

    void setInterval() override {
        AppConfig& config = controller.getConfig();
        int minutes;
        std::cout << "Enter backup interval in minutes (Current: " << config.intervalMinutes << "): ";
        while (!(std::cin >> minutes) || minutes <= 0) {
            if (std::cin.eof()) {
                return;
            }
            std::cin.clear();
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            std::cout << "Invalid interval, please enter a positive number: ";
        }
        config.intervalMinutes = minutes;
        std::cout << "Backup interval updated to: " << config.intervalMinutes << " minutes\n";
        if (controller.isBackupRunning()) {
            std::cout << "Restart the timed backup to apply the new interval.\n";
        }
    }

    void showMessage(const std::string& message) override {
        std::cout << "[Info] " << message << "\n";
    }

    void showError(const std::string& message) override {
        std::cout << "[Error] " << message << "\n";
    }

private:
    // 先解析全部选项，再执行命令
    bool parseArguments() {
        AppConfig& config = controller.getConfig();
        std::vector<std::string> args(argv + 1, argv + argc);
        std::string command;
        std::vector<std::string> operands;

        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "-h" || args[i] == "--help") {
                showHelp();
                return false;
            } else if (args[i] == "--source" && i + 1 < args.size()) {
                config.sourceDir = args[++i];
            } else if (args[i] == "--backup" && i + 1 < args.size()) {
                config.backupDir = args[++i];
            } else if (args[i] == "--interval" && i + 1 < args.size()) {
                try {
                    config.intervalMinutes = std::stoi(args[++i]);
                } catch (const std::exception&) {
                    showError("Invalid interval: " + args[i]);
                    return false;
                }
            } else if (args[i] == "--verbose") {
                controller.getLogger().setLogLevel(LogLevel::DEBUG);
            } else if (command.empty()) {
                command = args[i];
            } else {
                operands.push_back(args[i]);
            }
        }

        if (command.empty()) {
            return true;
        }

        if (command == "start" || command == "-s") {
            if (controller.startTimedBackup()) {
                std::cout << "Press Enter to stop...\n";
                std::cin.get();
                controller.stopTimedBackup();
            }
        } else if (command == "backup" || command == "-b") {
            controller.executeBackup();
        } else if (command == "restore" || command == "-r") {
            if (operands.size() != 2) {
                showError("restore needs <archive> <destination>");
                return false;
            }
            controller.executeRestore(operands[0], operands[1]);
        } else if (command == "list" || command == "-l") {
            listArchives();
        } else {
            showError("Unknown command: " + command);
            showHelp();
        }
        return false;
    }

    void displayMenu() {
        AppConfig& config = controller.getConfig();
        std::cout << "\n=== Zip Backup ===\n";
        std::cout << "[1] Start Timed Backup (" << (controller.isBackupRunning() ? "Running" : "Stopped") << ")\n";
        std::cout << "[2] Stop Timed Backup\n";
        std::cout << "[3] Perform Full Backup Now\n";
        std::cout << "[4] Restore From Archive\n";
        std::cout << "[5] List Archives\n";
        std::cout << "[6] Change Source Directory (Current: " << config.sourceDir << ")\n";
        std::cout << "[7] Change Backup Directory (Current: " << config.backupDir << ")\n";
        std::cout << "[8] Change Interval (Current: " << config.intervalMinutes << " minutes)\n";
        std::cout << "[9] Show Help\n";
        std::cout << "[0] Exit Program\n";
    }

    void handleUserChoice(int choice) {
        switch (choice) {
            case 1:
                startTimedBackup();
                break;
            case 2:
                stopTimedBackup();
                break;
            case 3:
                performBackup();
                break;
            case 4:
                performRestore();
                break;
            case 5:
                listArchives();
                break;
            case 6:
                setSourceDirectory();
                break;
            case 7:
                setBackupDirectory();
                break;
            case 8:
                setInterval();
                break;
            case 9:
                showHelp();
                break;
            case 0:
                std::cout << "Thank you for using Zip Backup, goodbye!\n";
                break;
            default:
                std::cout << "Invalid selection, please try again.\n";
        }
    }
};

int main(int argc, char* argv[]) {
    ConsoleLogger logger;

    // 1. First create controller with null interface pointer
    ApplicationController controller(nullptr, logger);

    // 2. Create command line interface and pass controller reference
    CommandLineInterface cli(controller, argc, argv);

    // 3. Set interface to controller
    controller.setUserInterface(&cli);

    controller.start();

    return 0;
}

#include "TimerBackupManager.hpp"
#include "BackupEngine.hpp"
#include "utils/ILogger.hpp"
#include <exception>
#include <iostream>
#include <utility>

TimerBackupManager::TimerBackupManager(ILogger* log, BackupSession::Clock clock)
    : logger(log), clock(std::move(clock)), running(false), passCount(0),
      interval(std::chrono::minutes(1)) {
}

TimerBackupManager::~TimerBackupManager() {
    stop();
}

bool TimerBackupManager::start(const BackupConfig& config) {
    std::lock_guard<std::mutex> controlLock(controlMutex);

    if (running) {
        std::lock_guard<std::mutex> lock(mutex);
        lastError = BackupError{BackupErrorKind::AlreadyRunning, "Timer backup is already running."};
        logger->error(lastError->message);
        return false;
    }

    BackupError error;
    if (!BackupEngine::validateConfig(config, error)) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            lastError = error;
        }
        logger->error(error.message);
        logger->error("Timer backup cannot start without a valid configuration.");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        session = std::make_unique<BackupSession>(config, logger, clock);
        interval = std::chrono::minutes(config.intervalMinutes);
        lastPassResult = PassResult();
        lastError.reset();
        passCount = 0;
        running = true;
    }

    logger->info("Backup service started: " + config.sourceRoot.string() + " -> " +
                 config.backupRoot.string() + ", interval " + std::to_string(config.intervalMinutes) +
                 " minutes");

    // 启动定时器线程
    timerThread = std::thread(&TimerBackupManager::timerThreadFunc, this);
    return true;
}

void TimerBackupManager::stop() {
    std::lock_guard<std::mutex> controlLock(controlMutex);

    if (!running) {
        return;
    }

    logger->info("Stopping timer backup...");
    {
        // 持锁修改，避免定时器线程错过唤醒
        std::lock_guard<std::mutex> lock(mutex);
        running = false;
    }
    cv.notify_all();

    // 正在执行的备份会完整结束
    if (timerThread.joinable()) {
        timerThread.join();
    }

    logger->info("Backup service stopped.");
}

bool TimerBackupManager::isRunning() const {
    return running;
}

void TimerBackupManager::setInterval(std::chrono::seconds seconds) {
    if (seconds.count() <= 0) {
        logger->warn("Ignoring non-positive backup interval: " + std::to_string(seconds.count()) + " seconds");
        return;
    }
    if (std::chrono::duration_cast<std::chrono::minutes>(seconds).count() > BackupEngine::maxIntervalMinutes()) {
        logger->warn("Ignoring backup interval that is too large: " + std::to_string(seconds.count()) + " seconds");
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        interval = seconds;
    }
    cv.notify_all();
    logger->info("Timer backup interval updated to: " + std::to_string(seconds.count()) + " seconds");
}

std::chrono::seconds TimerBackupManager::getInterval() const {
    std::lock_guard<std::mutex> lock(mutex);
    return std::chrono::duration_cast<std::chrono::seconds>(interval);
}

std::size_t TimerBackupManager::getPassCount() const {
    return passCount;
}

PassResult TimerBackupManager::getLastPassResult() const {
    std::lock_guard<std::mutex> lock(mutex);
    return lastPassResult;
}

std::optional<BackupError> TimerBackupManager::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex);
    return lastError;
}

std::optional<fs::file_time_type> TimerBackupManager::getLastBackupTime() const {
    std::lock_guard<std::mutex> lock(mutex);
    if (!session) {
        return std::nullopt;
    }
    return session->getLastBackupTime();
}

void TimerBackupManager::executeBackup() {
    PassResult result;
    try {
        logger->debug("Timer backup triggered.");
        result = session->runPass();
    } catch (const std::exception& e) {
        // 日志回调本身抛出的异常也在这里截住，不能让定时器线程退出
        result = PassResult();
        result.status = TaskStatus::FAILED;
        result.error = BackupError{BackupErrorKind::PassFailure, e.what()};
        try {
            logger->error("Exception during timer backup: " + std::string(e.what()));
        } catch (const std::exception& logFailure) {
            std::cerr << "[ERROR] Exception during timer backup: " << e.what()
                      << " (logging failed: " << logFailure.what() << ")" << std::endl;
        }
    }

    std::lock_guard<std::mutex> lock(mutex);
    lastPassResult = result;
    if (result.error) {
        lastError = result.error;
    }
    ++passCount;
}

void TimerBackupManager::timerThreadFunc() {
    std::unique_lock<std::mutex> lock(mutex);
    while (running) {
        lastPassStart = std::chrono::steady_clock::now();
        lock.unlock();
        executeBackup();
        lock.lock();

        // 等到下一次到期；间隔被修改时按新间隔重新计算
        while (running && std::chrono::steady_clock::now() < lastPassStart + interval) {
            cv.wait_until(lock, lastPassStart + interval);
        }
    }
}

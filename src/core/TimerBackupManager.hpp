#pragma once
#include <memory>
#include <optional>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstddef>
#include "Types.hpp"
#include "BackupSession.hpp"

// 前向声明
class ILogger;

// 定时备份管理器
// 备份在定时器线程上串行执行：启动后立即执行一次，之后每隔interval执行一次；
// 某次备份超过间隔时，错过的触发合并为一次，在该次备份结束后立即执行
class TimerBackupManager {
private:
    ILogger* logger;
    BackupSession::Clock clock;
    std::unique_ptr<BackupSession> session;

    // 线程安全机制
    std::thread timerThread;
    std::atomic<bool> running;
    std::atomic<std::size_t> passCount;
    std::mutex controlMutex;        // 串行化start/stop
    mutable std::mutex mutex;       // 保护以下字段
    std::condition_variable cv;
    std::chrono::steady_clock::duration interval;
    std::chrono::steady_clock::time_point lastPassStart;
    PassResult lastPassResult;
    std::optional<BackupError> lastError;

    // 执行备份
    void executeBackup();

    // 定时器线程函数
    void timerThreadFunc();

public:
    explicit TimerBackupManager(ILogger* log, BackupSession::Clock clock = nullptr);
    ~TimerBackupManager();

    TimerBackupManager(const TimerBackupManager&) = delete;
    TimerBackupManager& operator=(const TimerBackupManager&) = delete;

    // 启动定时备份，每次启动都是新的会话（水位线重置为从未备份）
    bool start(const BackupConfig& config);

    // 停止定时备份；不中断正在执行的备份，等待其结束后返回
    // 不能在日志回调中调用
    void stop();

    bool isRunning() const;

    // 更新备份间隔，下一次触发时间从上一次备份开始时重新计算
    void setInterval(std::chrono::seconds seconds);

    std::chrono::seconds getInterval() const;

    std::size_t getPassCount() const;

    PassResult getLastPassResult() const;

    std::optional<BackupError> getLastError() const;

    std::optional<fs::file_time_type> getLastBackupTime() const;
};

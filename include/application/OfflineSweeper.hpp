#pragma once

#include "ports/input/IPresenceService.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace finger::application {

/**
 * @brief Фоновый поток, переводящий истёкшие статусы в offline
 *
 * Корректность от него не зависит (истечение считается при чтении),
 * он только не даёт хранилищу копить устаревшие online-записи.
 */
class OfflineSweeper {
public:
    OfflineSweeper(
        std::shared_ptr<ports::input::IPresenceService> presenceService,
        std::chrono::milliseconds interval)
        : presenceService_(std::move(presenceService))
        , interval_(interval)
        , running_(false)
        , sweepCount_(0)
    {}

    ~OfflineSweeper() {
        stop();
    }

    OfflineSweeper(const OfflineSweeper&) = delete;
    OfflineSweeper& operator=(const OfflineSweeper&) = delete;

    void start() {
        if (running_.exchange(true)) return;

        std::cout << "[OfflineSweeper] Started, interval " << interval_.count() << "ms" << std::endl;
        thread_ = std::thread([this]() {
            std::unique_lock<std::mutex> lock(mutex_);
            while (running_) {
                if (cv_.wait_for(lock, interval_, [this]() { return !running_; })) {
                    break;
                }
                lock.unlock();
                sweepOnce();
                lock.lock();
            }
        });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.exchange(false)) {
                return;
            }
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
        std::cout << "[OfflineSweeper] Stopped" << std::endl;
    }

    bool isRunning() const { return running_; }

    uint64_t sweepCount() const { return sweepCount_; }

    /**
     * @brief Один проход чистки (вызывается потоком и тестами)
     */
    size_t sweepOnce() {
        ++sweepCount_;
        try {
            return presenceService_->expireStale();
        } catch (const std::exception& e) {
            std::cerr << "[OfflineSweeper] Sweep failed: " << e.what() << std::endl;
            return 0;
        }
    }

private:
    std::shared_ptr<ports::input::IPresenceService> presenceService_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> sweepCount_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace finger::application

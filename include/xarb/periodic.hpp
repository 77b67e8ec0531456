// xarb - Periodic Task
// Background thread running a callback at a fixed interval

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace xarb {

// Exceptions thrown by the callback are logged and the loop keeps going.
// stop() interrupts the sleep, so it returns within one callback run.
class PeriodicTask {
public:
    PeriodicTask(std::string name, int64_t interval_ms, std::function<void()> task);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] uint64_t runs() const noexcept { return runs_.load(); }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    void loop();

    std::string name_;
    int64_t interval_ms_;
    std::function<void()> task_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> runs_{0};
    std::unique_ptr<std::thread> thread_;
};

}  // namespace xarb

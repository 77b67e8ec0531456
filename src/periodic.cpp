// xarb - Periodic Task Implementation

#include <xarb/periodic.hpp>
#include <xarb/logging.hpp>
#include <chrono>

namespace xarb {

PeriodicTask::PeriodicTask(std::string name, int64_t interval_ms, std::function<void()> task)
    : name_(std::move(name)), interval_ms_(interval_ms), task_(std::move(task)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (running_.exchange(true)) {
        return;
    }

    thread_ = std::make_unique<std::thread>(&PeriodicTask::loop, this);
    Logger::debug("Started periodic task {} every {}ms", name_, interval_ms_);
}

void PeriodicTask::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
    }
    cv_.notify_all();

    if (thread_ && thread_->joinable()) {
        thread_->join();
    }
    thread_.reset();
}

void PeriodicTask::loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(interval_ms_),
                         [this] { return !running_.load(); });
        }
        if (!running_.load()) break;

        try {
            task_();
            ++runs_;
        } catch (const std::exception& e) {
            Logger::error("Periodic task {} failed: {}", name_, e.what());
        }
    }
}

}  // namespace xarb

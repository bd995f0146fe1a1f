#include "Dispatcher.hpp"

#include <exception>
#include <spdlog/spdlog.h>

using namespace pairchat::dispatch;

void Dispatcher::start() {
    if (running_) return;
    // Left behind by a task that stopped the dispatcher.
    if (worker_.joinable())
        worker_.join();
    running_ = true;
    worker_ = std::thread([this]() { run(); });
}

void Dispatcher::run() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            while (running_) {
                if (taskQueue_.empty()) {
                    cv_.wait(lock);
                    continue;
                }
                auto due = taskQueue_.begin()->first;
                if (due <= Clock::now())
                    break;
                cv_.wait_until(lock, due);
            }
            if (!running_) return;

            auto node = taskQueue_.extract(taskQueue_.begin());
            task = std::move(node.mapped());
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Dispatcher task failed: {}", e.what());
        }
    }
}

void Dispatcher::post(Task task) {
    enqueue(std::chrono::milliseconds::zero(), std::move(task));
}

void Dispatcher::postAfter(std::chrono::milliseconds delay, Task task) {
    enqueue(delay, std::move(task));
}

void Dispatcher::enqueue(std::chrono::milliseconds delay, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        taskQueue_.emplace(Clock::now() + delay, std::move(task));
    }
    cv_.notify_one();
}

void Dispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
        worker_.join();
}

Dispatcher::~Dispatcher() {
    stop();
    if (worker_.joinable()) {
        spdlog::critical("Dispatcher destroyed from its own worker thread");
        worker_.detach();
    }
}

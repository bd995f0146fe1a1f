#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <map>
#include <thread>

namespace pairchat::dispatch {

// Single worker thread. Ready tasks run in posting order; delayed tasks run
// once their deadline passes, ordered by deadline and then by posting order.
// A task may call stop(); the worker is then joined by the next stop() or
// the destructor on the owning thread.
class Dispatcher {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void()>;

    Dispatcher() = default;
    ~Dispatcher();
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void start();
    void stop();
    void post(Task task);
    void postAfter(std::chrono::milliseconds delay, Task task);
    bool isRunning() const { return running_.load(); }

private:
    std::mutex mutex_;
    // Keyed by deadline; equal deadlines keep posting order.
    std::multimap<Clock::time_point, Task> taskQueue_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> running_{false};

    void run();
    void enqueue(std::chrono::milliseconds delay, Task task);
};

}

#pragma once
#include <thread>
#include <mutex>
#include <queue>
#include <functional>
#include <condition_variable>
#include <atomic>
#include <string>

// Single background thread for slow jobs (weather fetches) that must never
// hold up tile sending. Jobs run in submission order.
class BackgroundWorker {
public:
    explicit BackgroundWorker(std::string name, std::size_t max_queued = 4);
    ~BackgroundWorker();

    BackgroundWorker(const BackgroundWorker &) = delete;
    BackgroundWorker &operator=(const BackgroundWorker &) = delete;

    // false when the queue is full or the worker is stopping
    bool submit(std::function<void()> job);

private:
    void worker_loop();

    std::string name_;
    std::size_t max_queued_;
    std::thread thread_;
    std::queue<std::function<void()>> jobs_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stop_{false};
};

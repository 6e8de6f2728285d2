#include "background_worker.h"
#include <exception>
#include <iostream>

BackgroundWorker::BackgroundWorker(std::string name, std::size_t max_queued)
    : name_(std::move(name)), max_queued_(max_queued == 0 ? 1 : max_queued) {
    thread_ = std::thread([this]() { worker_loop(); });
}

BackgroundWorker::~BackgroundWorker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_.store(true, std::memory_order_relaxed);
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

bool BackgroundWorker::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_.load(std::memory_order_relaxed) || jobs_.size() >= max_queued_) {
            return false;
        }
        jobs_.push(std::move(job));
    }
    cv_.notify_one();
    return true;
}

void BackgroundWorker::worker_loop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&]() {
                return stop_.load(std::memory_order_relaxed) || !jobs_.empty();
            });
            // pending jobs are abandoned on shutdown
            if (stop_.load(std::memory_order_relaxed)) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop();
        }
        try {
            if (job) job();
        } catch (const std::exception &ex) {
            std::cerr << "[" << name_ << "] Job failed: " << ex.what() << "\n";
        }
    }
}

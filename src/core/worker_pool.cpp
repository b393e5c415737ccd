#include "worker_pool.hpp"
#include "log.hpp"
#include <fmt/format.h>
#include <exception>

WorkerPool::WorkerPool(int threads)
    : thread_count_(threads > 0 ? threads : 1) {}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    if (running_.exchange(true)) return;
    for (int i = 0; i < thread_count_; i++) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return false;
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!tasks_.empty()) {
        log_debug(fmt::format("workers: dropped {} queued task(s) at stop", tasks_.size()));
        tasks_.clear();
    }
}

size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !running_ || !tasks_.empty(); });
            if (!running_) return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        try {
            task();
        } catch (const std::exception& e) {
            log_error(fmt::format("workers: task threw: {}", e.what()));
        }
    }
}

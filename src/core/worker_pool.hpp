#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed-size pool for slow work that must not run on the reactor or on a
// channel's reader thread (remote attach, exec).
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(int threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();

    // Queue a task. False once the pool is stopping.
    bool submit(Task task);

    // Let running tasks finish, drop queued ones, join.
    void stop();

    size_t pending() const;

private:
    void worker_loop();

    const int thread_count_;
    std::atomic<bool> running_{false};
    std::vector<std::thread> threads_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
};

// ThreadPool.hpp
#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <atomic>
#include <functional>
#include <mutex>
#include <condition_variable>

#include "threadpool/Task.hpp"

// Fixed set of workers pulling connection tasks from a FIFO queue.
class ThreadPool {
public:
    explicit ThreadPool(int threads);
    ~ThreadPool();

    // Tasks waiting + running.
    std::size_t getPendingTaskCount() const {
        return pendingTasks.load(std::memory_order_relaxed);
    }

    // Returns the number of pending tasks before this one.
    std::size_t enqueue(Task task);

    // Stops accepting work, lets queued tasks finish, joins the workers.
    void shutdown();

private:
    void workerLoop();

    std::vector<std::thread> workers;
    std::queue<Task> tasks;
    bool stop = false;

    std::atomic<std::size_t> pendingTasks{0};

    std::condition_variable cv;
    std::mutex queueMutex;
};

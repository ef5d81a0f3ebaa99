#include "threadpool/ThreadPool.hpp"

#include <exception>
#include <stdexcept>

#include "monitor/Trace.hpp"

ThreadPool::ThreadPool(int threads) {
    if (threads < 1) {
        throw std::invalid_argument("ThreadPool requires at least one worker");
    }

    for (int i = 0; i < threads; ++i) {
        workers.emplace_back([this]() {
            workerLoop();
        });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

std::size_t ThreadPool::enqueue(Task task) {
    std::size_t before;
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (stop) {
            throw std::runtime_error("enqueue on a stopped ThreadPool");
        }
        before = pendingTasks.fetch_add(1, std::memory_order_relaxed);
        tasks.push(std::move(task));
    }
    cv.notify_one();
    return before;
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (stop) return;
        stop = true;
    }
    cv.notify_all();

    for (auto& w : workers) {
        if (w.joinable()) {
            w.join();
        }
    }
}

void ThreadPool::workerLoop() {
    while (true) {
        Task t;

        {
            std::unique_lock<std::mutex> lock(queueMutex);
            cv.wait(lock, [this]() {
                return stop || !tasks.empty();
            });
            if (tasks.empty()) {
                return;  // stopped and drained
            }
            t = std::move(tasks.front());
            tasks.pop();
        }

        if (t.fn) {
            try {
                t.fn();
            } catch (const std::exception& e) {
                FAKEREST_ERR("POOL", "task " << t.id << " (" << t.peer << ") failed: " << e.what());
            }
        } else {
            FAKEREST_LOG("POOL", "Got empty task (fn=null)");
        }
        pendingTasks.fetch_sub(1, std::memory_order_relaxed);
    }
}

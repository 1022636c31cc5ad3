#ifndef RUBIKPOW_THREAD_POOL_H
#define RUBIKPOW_THREAD_POOL_H

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace rubikpow {

struct WorkQueue {
    std::queue<std::function<void()>> tasks;
    std::mutex mutex;
    std::condition_variable cv;
    bool shutdown{false};

    void push(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            tasks.push(std::move(task));
        }
        cv.notify_one();
    }

    // Blocks until a task is available; false once shut down and drained
    bool pop(std::function<void()>& task) {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return !tasks.empty() || shutdown; });
        if (tasks.empty()) {
            return false;
        }
        task = std::move(tasks.front());
        tasks.pop();
        return true;
    }

    void requestShutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            shutdown = true;
        }
        cv.notify_all();
    }

    size_t pending() {
        std::lock_guard<std::mutex> lock(mutex);
        return tasks.size();
    }
};

class ThreadPool {
public:
    explicit ThreadPool(int n = static_cast<int>(std::thread::hardware_concurrency())) : numThreads(n) {
        if (n <= 0) {
            throw std::invalid_argument("Thread count must be positive");
        }
        workers.reserve(numThreads);
        for (int i = 0; i < numThreads; ++i) {
            workers.emplace_back([this, i]() { run(i); });
        }
    }

    ~ThreadPool() {
        shutdown();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drains queued tasks, then joins every worker
    void shutdown() {
        if (!stopped.exchange(true)) {
            queue.requestShutdown();
            for (auto& worker : workers) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        }
    }

    // Enqueue a task and get a future for its result; exceptions surface through the future
    template<typename Func, typename... Args>
    auto enqueue(Func&& f, Args&&... args) -> std::future<decltype(f(args...))> {
        if (stopped.load()) {
            throw std::runtime_error("Cannot enqueue tasks on a stopped thread pool");
        }

        using ReturnType = decltype(f(args...));
        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<Func>(f), std::forward<Args>(args)...)
        );
        std::future<ReturnType> res = task->get_future();
        queue.push([task]() { (*task)(); });
        return res;
    }

    size_t getThreadCount() const { return static_cast<size_t>(numThreads); }
    size_t getPendingTaskCount() { return queue.pending(); }

private:
    void run(int id) {
        std::function<void()> task;
        while (queue.pop(task)) {
            try {
                task();
            } catch (const std::exception& e) {
                std::cerr << "Task exception in worker " << id << ": " << e.what() << std::endl;
            }
            task = nullptr;
        }
    }

    WorkQueue queue;
    std::vector<std::thread> workers;
    int numThreads;
    std::atomic<bool> stopped{false};
};

} // namespace rubikpow

#endif // RUBIKPOW_THREAD_POOL_H

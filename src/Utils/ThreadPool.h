// src/Utils/ThreadPool.h
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed set of workers draining a FIFO of tasks. Workers share their
// state through a shared_ptr so a worker stuck in a task can be detached
// at shutdown without touching a destroyed pool.
class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Enqueue a task returning a future for its result.
    // Throws std::runtime_error once the pool is stopping.
    template<typename F, typename... Args>
    auto Enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    // Stops accepting work and drops queued tasks (their futures report
    // broken_promise). Running tasks get up to grace to finish; workers
    // still busy after that are detached. Returns false if any were.
    bool Shutdown(std::chrono::milliseconds grace = std::chrono::milliseconds(1000));

    size_t GetWorkerCount() const { return workers_.size(); }
    size_t GetQueuedCount() const;
    size_t GetBusyCount() const;

private:
    struct State {
        mutable std::mutex                mutex;
        std::condition_variable           workReady;
        std::condition_variable           idle;
        std::queue<std::function<void()>> tasks;
        size_t                            busy = 0;
        bool                              stopping = false;
    };

    static void Worker(std::shared_ptr<State> state);

    std::shared_ptr<State>   state_;
    std::vector<std::thread> workers_;
};

template<typename F, typename... Args>
auto ThreadPool::Enqueue(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>>
{
    using ReturnType = std::invoke_result_t<F, Args...>;
    auto packagedTask = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );
    std::future<ReturnType> result = packagedTask->get_future();
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->stopping) {
            throw std::runtime_error("ThreadPool is stopped; cannot enqueue new tasks");
        }
        state_->tasks.emplace([packagedTask]() { (*packagedTask)(); });
    }
    state_->workReady.notify_one();
    return result;
}

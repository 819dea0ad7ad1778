// src/Utils/ThreadPool.cpp
#include "Utils/ThreadPool.h"

ThreadPool::ThreadPool(size_t numThreads)
    : state_(std::make_shared<State>())
{
    if (numThreads == 0) numThreads = 1;
    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ThreadPool::Worker, state_);
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

bool ThreadPool::Shutdown(std::chrono::milliseconds grace) {
    if (workers_.empty()) return true;

    std::queue<std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopping = true;
        dropped.swap(state_->tasks);
    }
    state_->workReady.notify_all();

    bool finished = false;
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        finished = state_->idle.wait_for(lock, grace, [this] { return state_->busy == 0; });
    }

    for (auto& t : workers_) {
        if (!t.joinable()) continue;
        if (finished) {
            t.join();
        } else {
            t.detach();
        }
    }
    workers_.clear();
    return finished;
}

size_t ThreadPool::GetQueuedCount() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->tasks.size();
}

size_t ThreadPool::GetBusyCount() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->busy;
}

void ThreadPool::Worker(std::shared_ptr<State> state) {
    std::unique_lock<std::mutex> lock(state->mutex);
    while (true) {
        state->workReady.wait(lock, [&state] {
            return state->stopping || !state->tasks.empty();
        });
        if (state->stopping) return;

        std::function<void()> task = std::move(state->tasks.front());
        state->tasks.pop();
        ++state->busy;

        lock.unlock();
        task();
        task = nullptr;
        lock.lock();

        --state->busy;
        state->idle.notify_all();
    }
}

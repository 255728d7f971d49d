// src/runtime/executor.cpp
#include "alm/runtime/executor.hpp"
#include <stdexcept>

namespace alm::runtime {

ThreadPoolExecutor::ThreadPoolExecutor(size_t num_threads) {
    if (num_threads == 0) {
        throw std::invalid_argument("ThreadPoolExecutor needs at least one thread");
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPoolExecutor::worker_loop, this);
    }
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    shutdown();
}

void ThreadPoolExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    work_available_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPoolExecutor::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw std::runtime_error("submit on stopped ThreadPoolExecutor");
        }
        tasks_.push_back(std::move(task));
    }
    work_available_.notify_one();
}

void ThreadPoolExecutor::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_available_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        // packaged_task stores any exception in the future
        task();
    }
}

std::unique_ptr<Executor> get_pool_executor(size_t num_workers) {
    if (num_workers == 0) {
        return std::make_unique<InlineExecutor>();
    }
    return std::make_unique<ThreadPoolExecutor>(num_workers);
}

} // namespace alm::runtime

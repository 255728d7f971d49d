// include/alm/runtime/executor.hpp
#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace alm::runtime {

// Runs callables and hands back futures. Exceptions thrown by a task are
// stored in its future and rethrown by get().
class Executor {
public:
    virtual ~Executor() = default;

    template <typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using return_type = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
        std::future<return_type> result = task->get_future();
        post([task]() { (*task)(); });
        return result;
    }

    virtual size_t num_workers() const = 0;

protected:
    virtual void post(std::function<void()> task) = 0;
};

// Executes every task synchronously inside submit(); used when no worker is
// requested.
class InlineExecutor : public Executor {
public:
    size_t num_workers() const override { return 0; }

protected:
    void post(std::function<void()> task) override { task(); }
};

class ThreadPoolExecutor : public Executor {
public:
    explicit ThreadPoolExecutor(size_t num_threads);
    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    // Runs the queued tasks to completion and joins the workers
    void shutdown();

    size_t num_workers() const override { return workers_.size(); }

protected:
    void post(std::function<void()> task) override;

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable work_available_;
    bool stop_ = false;
};

// 0 workers -> InlineExecutor, otherwise a thread pool of num_workers threads
std::unique_ptr<Executor> get_pool_executor(size_t num_workers);

} // namespace alm::runtime

#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <type_traits>

// Runs submitted jobs one at a time, in order, on a single dedicated thread.
// Used to confine a non-reentrant resource (the local model) to one thread.
class SerialExecutor {
public:
    SerialExecutor() : worker_([this](std::stop_token st) { run(st); }) {}

    ~SerialExecutor() {
        worker_.request_stop();
        cv_.notify_all();
    }

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto fut = task->get_future();
        {
            std::lock_guard lock(mu_);
            jobs_.emplace_back([task] { (*task)(); });
        }
        cv_.notify_one();
        return fut;
    }

    // True when called from the executor's own thread.
    bool on_executor_thread() const { return std::this_thread::get_id() == worker_.get_id(); }

private:
    void run(std::stop_token st) {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock lock(mu_);
                cv_.wait(lock, st, [this] { return !jobs_.empty(); });
                if (jobs_.empty()) return;  // stop requested
                job = std::move(jobs_.front());
                jobs_.pop_front();
            }
            job();
        }
    }

    std::mutex mu_;
    std::condition_variable_any cv_;
    std::deque<std::function<void()>> jobs_;
    std::jthread worker_;  // last: joins before the queue is destroyed
};

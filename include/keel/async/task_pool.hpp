#pragma once

/// @file task_pool.hpp
/// @brief Worker threads for blocking I/O

#include "io_task.hpp"
#include <keel/core/error.hpp>
#include <nlohmann/json_fwd.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace keel_async {

// =============================================================================
// IoConfig
// =============================================================================

/// Configuration for the I/O worker pool
struct IoConfig {
    std::size_t worker_threads = 2;

    /// Read the "io" config section; absent keys keep their defaults
    [[nodiscard]] static keel_core::Result<IoConfig> from_json(const nlohmann::json& j);
};

// =============================================================================
// IoWorkerPool
// =============================================================================

/// Thread pool running blocking file and network work off the scheduler thread
class IoWorkerPool {
public:
    using Job = std::function<void()>;

    /// Create pool with specified number of threads (at least one)
    explicit IoWorkerPool(std::size_t num_threads = 2);

    /// Destructor - cancels queued jobs and joins the workers
    ~IoWorkerPool();

    IoWorkerPool(const IoWorkerPool&) = delete;
    IoWorkerPool& operator=(const IoWorkerPool&) = delete;

    /// Submit a job for execution
    void submit(Job job);

    /// Submit a job and get a task observing its result
    template<typename F, typename R = std::invoke_result_t<F>>
    [[nodiscard]] IoTask<R> submit_task(F&& func) {
        auto promise = std::make_shared<std::promise<R>>();
        IoTask<R> task(promise->get_future());

        submit([promise, func = std::forward<F>(func)]() mutable {
            try {
                if constexpr (std::is_void_v<R>) {
                    func();
                    promise->set_value();
                } else {
                    promise->set_value(func());
                }
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });

        return task;
    }

    /// Stop the workers. Queued jobs run first when @p drain is true, and
    /// are dropped otherwise (their tasks report Cancelled).
    void shutdown(bool drain);

    /// Get number of jobs queued or running
    [[nodiscard]] std::size_t pending_count() const;

    /// Get number of worker threads
    [[nodiscard]] std::size_t thread_count() const noexcept { return m_threads.size(); }

    /// Block until all submitted jobs have finished
    void wait_all();

private:
    void worker_thread();

    std::vector<std::thread> m_threads;
    std::deque<Job> m_jobs;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::condition_variable m_done_condition;
    std::atomic<std::size_t> m_pending{0};
    bool m_stop = false;
    bool m_drain = true;
};

} // namespace keel_async

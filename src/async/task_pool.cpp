/// @file task_pool.cpp
/// @brief IoWorkerPool implementation

#include <keel/async/task_pool.hpp>
#include <keel/core/config.hpp>
#include <keel/core/log.hpp>

#include <algorithm>

namespace keel_async {

// =============================================================================
// IoConfig
// =============================================================================

keel_core::Result<IoConfig> IoConfig::from_json(const nlohmann::json& j) {
    IoConfig config;
    if (auto result = keel_core::read_config_key(j, "worker_threads", config.worker_threads); !result) {
        return keel_core::Err<IoConfig>(result.error());
    }
    if (config.worker_threads == 0) {
        return keel_core::Err<IoConfig>(keel_core::Error(keel_core::ErrorCode::InvalidArgument,
            "io.worker_threads must be at least 1"));
    }
    return keel_core::Ok(config);
}

// =============================================================================
// IoWorkerPool
// =============================================================================

IoWorkerPool::IoWorkerPool(std::size_t num_threads) {
    num_threads = std::max<std::size_t>(num_threads, 1);
    for (std::size_t i = 0; i < num_threads; ++i) {
        m_threads.emplace_back(&IoWorkerPool::worker_thread, this);
    }
    keel_core::async_logger()->debug("I/O worker pool started with {} threads", num_threads);
}

IoWorkerPool::~IoWorkerPool() {
    shutdown(false);
}

void IoWorkerPool::submit(Job job) {
    {
        std::lock_guard lock(m_mutex);
        if (m_stop) {
            // Dropping the job breaks its promise; the task reads as Cancelled
            keel_core::async_logger()->warn("Job submitted to a stopped I/O worker pool was dropped");
            return;
        }
        m_jobs.push_back(std::move(job));
        ++m_pending;
    }
    m_condition.notify_one();
}

void IoWorkerPool::shutdown(bool drain) {
    std::deque<Job> dropped;
    {
        std::lock_guard lock(m_mutex);
        if (m_stop && m_threads.empty()) {
            return;
        }
        m_stop = true;
        m_drain = drain;
        if (!drain) {
            dropped.swap(m_jobs);
            m_pending -= dropped.size();
        }
    }
    m_condition.notify_all();

    for (auto& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    m_threads.clear();

    if (!dropped.empty()) {
        keel_core::async_logger()->debug("I/O worker pool cancelled {} queued jobs", dropped.size());
    }
    m_done_condition.notify_all();
}

std::size_t IoWorkerPool::pending_count() const {
    return m_pending.load();
}

void IoWorkerPool::wait_all() {
    std::unique_lock lock(m_mutex);
    m_done_condition.wait(lock, [this] {
        return m_pending == 0;
    });
}

void IoWorkerPool::worker_thread() {
    while (true) {
        Job job;
        {
            std::unique_lock lock(m_mutex);
            m_condition.wait(lock, [this] {
                return m_stop || !m_jobs.empty();
            });

            if (m_stop && (m_jobs.empty() || !m_drain)) {
                return;
            }

            job = std::move(m_jobs.front());
            m_jobs.pop_front();
        }

        job();

        {
            std::lock_guard lock(m_mutex);
            --m_pending;
        }
        m_done_condition.notify_all();
    }
}

} // namespace keel_async

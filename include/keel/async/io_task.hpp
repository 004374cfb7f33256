#pragma once

/// @file io_task.hpp
/// @brief Pollable completion signal for work done outside the scheduler

#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace keel_async {

// =============================================================================
// TaskStatus
// =============================================================================

/// Outcome of an external task
enum class TaskStatus : std::uint8_t {
    Pending,    // Still running
    Succeeded,  // Completed with a value
    Faulted,    // Completed by raising an exception
    Cancelled,  // Abandoned before producing a value or a fault
};

/// Get task status name
[[nodiscard]] inline const char* task_status_name(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "Pending";
        case TaskStatus::Succeeded: return "Succeeded";
        case TaskStatus::Faulted: return "Faulted";
        case TaskStatus::Cancelled: return "Cancelled";
        default: return "Unknown";
    }
}

// =============================================================================
// IoTask<T>
// =============================================================================

/// Handle to the result of external work, observed by polling.
///
/// The producer side is a std::promise. A promise destroyed without a value
/// (broken promise) reads as Cancelled; an exception stored in the promise
/// reads as Faulted with the exception's message.
template<typename T>
class IoTask {
public:
    using Stored = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    /// Empty task (never completes)
    IoTask() = default;

    /// Wrap a future fulfilled by the producer
    explicit IoTask(std::future<T> future) : m_future(std::move(future)) {}

    IoTask(IoTask&&) noexcept = default;
    IoTask& operator=(IoTask&&) noexcept = default;
    IoTask(const IoTask&) = delete;
    IoTask& operator=(const IoTask&) = delete;

    /// Already-succeeded task
    template<typename... Args>
    [[nodiscard]] static IoTask completed(Args&&... args) {
        std::promise<T> promise;
        if constexpr (std::is_void_v<T>) {
            promise.set_value();
        } else {
            promise.set_value(T(std::forward<Args>(args)...));
        }
        return IoTask(promise.get_future());
    }

    /// Already-faulted task
    [[nodiscard]] static IoTask faulted(const std::string& message) {
        std::promise<T> promise;
        promise.set_exception(std::make_exception_ptr(std::runtime_error(message)));
        return IoTask(promise.get_future());
    }

    /// Already-cancelled task
    [[nodiscard]] static IoTask cancelled() {
        std::future<T> future;
        {
            std::promise<T> promise;
            future = promise.get_future();
        }
        return IoTask(std::move(future));
    }

    /// Whether this task is bound to a producer
    [[nodiscard]] bool valid() const noexcept {
        return m_future.valid() || m_status != TaskStatus::Pending;
    }

    /// Non-blocking completion check
    [[nodiscard]] bool is_completed() {
        poll();
        return m_status != TaskStatus::Pending;
    }

    /// Current status (polls the producer)
    [[nodiscard]] TaskStatus status() {
        poll();
        return m_status;
    }

    [[nodiscard]] bool is_completed_successfully() {
        return status() == TaskStatus::Succeeded;
    }

    /// Fault message (empty unless Faulted)
    [[nodiscard]] const std::string& fault_message() const noexcept {
        return m_fault;
    }

    /// Result value (only meaningful when Succeeded)
    [[nodiscard]] Stored& result() {
        return *m_value;
    }

    /// Move the result out (only meaningful when Succeeded)
    [[nodiscard]] Stored take() {
        return std::move(*m_value);
    }

private:
    void poll() {
        if (m_status != TaskStatus::Pending || !m_future.valid()) {
            return;
        }
        if (m_future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return;
        }

        try {
            if constexpr (std::is_void_v<T>) {
                m_future.get();
                m_value.emplace();
            } else {
                m_value.emplace(m_future.get());
            }
            m_status = TaskStatus::Succeeded;
        } catch (const std::future_error& e) {
            if (e.code() == std::make_error_code(std::future_errc::broken_promise)) {
                m_status = TaskStatus::Cancelled;
            } else {
                m_status = TaskStatus::Faulted;
                m_fault = e.what();
            }
        } catch (const std::exception& e) {
            m_status = TaskStatus::Faulted;
            m_fault = e.what();
        } catch (...) {
            // Worker jobs may throw anything; the fault is recorded, not rethrown
            m_status = TaskStatus::Faulted;
            m_fault = "unknown exception";
        }
    }

    std::future<T> m_future;
    TaskStatus m_status = TaskStatus::Pending;
    std::optional<Stored> m_value;
    std::string m_fault;
};

} // namespace keel_async

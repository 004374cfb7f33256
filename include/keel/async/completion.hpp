#pragma once

/// @file completion.hpp
/// @brief Exactly-once success/error callback slot for operations

#include "operation.hpp"
#include <keel/core/log.hpp>

#include <functional>
#include <string>
#include <utility>

namespace keel_async {

using CompletionCallback = std::function<void()>;

/// Render an error payload for logging
[[nodiscard]] inline std::string describe_failure(const std::string& message) {
    return message;
}

/// Callback pair of one operation invocation.
///
/// At most one of the two callbacks fires, at most once. The slot is marked
/// resolved before the callback runs, so a throwing callback cannot cause a
/// second report. An empty error callback drops the failure for the caller;
/// it is still logged.
template<typename... ErrorArgs>
class Completion {
public:
    using ErrorCallback = std::function<void(ErrorArgs...)>;

    Completion(CompletionCallback on_complete, ErrorCallback on_error, std::string operation)
        : m_on_complete(std::move(on_complete))
        , m_on_error(std::move(on_error))
        , m_operation(std::move(operation)) {}

    [[nodiscard]] bool is_resolved() const noexcept { return m_resolved; }
    [[nodiscard]] bool has_error_handler() const noexcept { return static_cast<bool>(m_on_error); }

    /// Fire the completion callback
    OperationState succeed() {
        if (!mark_resolved()) {
            return OperationState::Completed;
        }
        if (m_on_complete) {
            m_on_complete();
        }
        return OperationState::Completed;
    }

    /// Fire the error callback
    OperationState fail(ErrorArgs... args) {
        if (!mark_resolved()) {
            return OperationState::Failed;
        }
        if (m_on_error) {
            m_on_error(args...);
        } else {
            keel_core::log_structured(spdlog::level::warn, "keel_async",
                "Operation failed with no error handler",
                {{"operation", m_operation}, {"error", describe_failure(args...)}});
        }
        return OperationState::Failed;
    }

private:
    bool mark_resolved() {
        if (m_resolved) {
            keel_core::async_logger()->error("Operation '{}' tried to report its outcome twice", m_operation);
            return false;
        }
        m_resolved = true;
        return true;
    }

    CompletionCallback m_on_complete;
    ErrorCallback m_on_error;
    std::string m_operation;
    bool m_resolved = false;
};

} // namespace keel_async

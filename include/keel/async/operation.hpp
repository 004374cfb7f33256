#pragma once

/// @file operation.hpp
/// @brief Cooperative operation state machine

#include <cstdint>
#include <string>

namespace keel_async {

// =============================================================================
// OperationState
// =============================================================================

/// Lifecycle of a cooperative operation
enum class OperationState : std::uint8_t {
    Idle,       // Not started
    Awaiting,   // Suspended on external work
    Completed,  // Success callback fired
    Failed,     // Error reported
};

/// Get operation state name
[[nodiscard]] inline const char* operation_state_name(OperationState state) {
    switch (state) {
        case OperationState::Idle: return "Idle";
        case OperationState::Awaiting: return "Awaiting";
        case OperationState::Completed: return "Completed";
        case OperationState::Failed: return "Failed";
        default: return "Unknown";
    }
}

/// Check if a state is terminal
[[nodiscard]] constexpr bool is_finished(OperationState state) noexcept {
    return state == OperationState::Completed || state == OperationState::Failed;
}

// =============================================================================
// Operation
// =============================================================================

/// Base class for asynchronous load and save operations.
///
/// The body is an explicit state machine: step() runs from the current
/// suspension point to the next one and never blocks. Resource state is only
/// mutated in the branch that decides the outcome, so destroying an
/// unfinished operation leaves its resource as it was.
class Operation {
public:
    explicit Operation(std::string name) : m_name(std::move(name)) {}
    virtual ~Operation() = default;

    Operation(const Operation&) = delete;
    Operation& operator=(const Operation&) = delete;

    /// Advance to the next suspension point. No-op once finished.
    OperationState resume() {
        if (!keel_async::is_finished(m_state)) {
            m_state = step();
        }
        return m_state;
    }

    [[nodiscard]] OperationState state() const noexcept { return m_state; }
    [[nodiscard]] bool is_finished() const noexcept { return keel_async::is_finished(m_state); }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

protected:
    /// Run the body until it suspends or finishes
    virtual OperationState step() = 0;

private:
    std::string m_name;
    OperationState m_state = OperationState::Idle;
};

} // namespace keel_async

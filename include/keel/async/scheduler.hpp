#pragma once

/// @file scheduler.hpp
/// @brief Single-threaded cooperative driver for operations

#include "operation.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace keel_async {

using OperationId = std::uint64_t;

/// Drives operations from one thread.
///
/// spawn() runs an operation up to its first suspension point right away;
/// tick() resumes every live operation once. Operations that finish are
/// dropped. The scheduler provides no exclusion between operations that
/// touch the same resource; callers serialize those themselves.
class CooperativeScheduler {
public:
    CooperativeScheduler() = default;

    CooperativeScheduler(const CooperativeScheduler&) = delete;
    CooperativeScheduler& operator=(const CooperativeScheduler&) = delete;

    /// Start an operation. Returns 0 if it finished synchronously.
    OperationId spawn(std::unique_ptr<Operation> operation);

    /// Resume each live operation once; returns the number still live.
    /// An exception thrown by a callback propagates after its operation
    /// has been removed.
    std::size_t tick();

    /// Tick until idle or until @p budget has elapsed.
    /// Returns true if every operation finished.
    bool run_until_idle(std::chrono::milliseconds budget = std::chrono::seconds(30));

    /// Drop every live operation without resuming it
    std::size_t abandon_all();

    [[nodiscard]] bool is_active(OperationId id) const;
    [[nodiscard]] std::size_t active_count() const noexcept { return m_active.size(); }
    [[nodiscard]] bool is_idle() const noexcept { return m_active.empty(); }

    /// Number of ticks run so far
    [[nodiscard]] std::uint64_t tick_count() const noexcept { return m_ticks; }

private:
    struct Entry {
        OperationId id;
        std::unique_ptr<Operation> operation;
    };

    std::vector<Entry> m_active;
    OperationId m_next_id = 1;
    std::uint64_t m_ticks = 0;
};

} // namespace keel_async

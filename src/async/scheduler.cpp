/// @file scheduler.cpp
/// @brief CooperativeScheduler implementation

#include <keel/async/scheduler.hpp>
#include <keel/core/log.hpp>

#include <algorithm>
#include <thread>

namespace keel_async {

OperationId CooperativeScheduler::spawn(std::unique_ptr<Operation> operation) {
    if (!operation) {
        return 0;
    }

    keel_core::async_logger()->trace("Starting operation '{}'", operation->name());

    if (is_finished(operation->resume())) {
        keel_core::async_logger()->trace("Operation '{}' finished synchronously ({})",
            operation->name(), operation_state_name(operation->state()));
        return 0;
    }

    OperationId id = m_next_id++;
    m_active.push_back(Entry{id, std::move(operation)});
    return id;
}

std::size_t CooperativeScheduler::tick() {
    ++m_ticks;

    // Callbacks may spawn new operations; only resume the ones present now
    std::size_t count = m_active.size();
    std::size_t i = 0;
    while (i < count) {
        OperationState state;
        try {
            state = m_active[i].operation->resume();
        } catch (...) {
            m_active.erase(m_active.begin() + static_cast<std::ptrdiff_t>(i));
            throw;
        }

        if (is_finished(state)) {
            keel_core::async_logger()->trace("Operation '{}' finished ({})",
                m_active[i].operation->name(), operation_state_name(state));
            m_active.erase(m_active.begin() + static_cast<std::ptrdiff_t>(i));
            --count;
        } else {
            ++i;
        }
    }

    return m_active.size();
}

bool CooperativeScheduler::run_until_idle(std::chrono::milliseconds budget) {
    auto deadline = std::chrono::steady_clock::now() + budget;
    while (!m_active.empty()) {
        if (tick() == 0) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            keel_core::async_logger()->warn("Scheduler budget of {}ms exhausted with {} operations live",
                budget.count(), m_active.size());
            return false;
        }
        std::this_thread::yield();
    }
    return true;
}

std::size_t CooperativeScheduler::abandon_all() {
    std::size_t count = m_active.size();
    if (count > 0) {
        keel_core::async_logger()->debug("Abandoning {} live operations", count);
    }
    m_active.clear();
    return count;
}

bool CooperativeScheduler::is_active(OperationId id) const {
    return std::any_of(m_active.begin(), m_active.end(), [id](const Entry& entry) {
        return entry.id == id;
    });
}

} // namespace keel_async

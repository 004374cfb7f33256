/// @file error.cpp
/// @brief Error handling implementation for keel_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Error statistics

#include <keel/core/error.hpp>
#include <array>
#include <atomic>
#include <sstream>
#include <vector>

namespace keel_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format resource error with full context
std::string format_resource_error(const ResourceError& err) {
    std::ostringstream oss;
    oss << "[ResourceError:" << resource_error_kind_name(err.kind) << "] " << err.message;

    if (!err.location.empty()) {
        oss << " (location: " << err.location << ")";
    }

    return oss.str();
}

} // namespace detail

/// Build a full error message with code, kind and context
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ResourceError>) {
            oss << detail::format_resource_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::uint8_t>, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

namespace {

constexpr std::size_t k_resource_kind_count = 6;

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
    std::array<std::atomic<std::uint64_t>, k_resource_kind_count> resource_errors{};
};

ErrorStats& stats() {
    static ErrorStats s_stats;
    return s_stats;
}

} // anonymous namespace

void record_error(const Error& error) {
    auto& s = stats();
    s.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (const auto* res = error.as<ResourceError>()) {
        auto index = static_cast<std::size_t>(res->kind);
        if (index < k_resource_kind_count) {
            s.resource_errors[index].fetch_add(1, std::memory_order_relaxed);
        }
    } else {
        s.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return stats().total_errors.load(std::memory_order_relaxed);
}

std::uint64_t resource_error_count(ResourceError::Kind kind) {
    auto index = static_cast<std::size_t>(kind);
    if (index >= k_resource_kind_count) {
        return 0;
    }
    return stats().resource_errors[index].load(std::memory_order_relaxed);
}

void reset_error_stats() {
    auto& s = stats();
    s.total_errors.store(0, std::memory_order_relaxed);
    s.generic_errors.store(0, std::memory_order_relaxed);
    for (auto& counter : s.resource_errors) {
        counter.store(0, std::memory_order_relaxed);
    }
}

std::string error_stats_summary() {
    auto& s = stats();
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s.total_errors.load() << "\n";
    for (std::size_t i = 0; i < k_resource_kind_count; ++i) {
        oss << "  " << resource_error_kind_name(static_cast<ResourceError::Kind>(i))
            << ": " << s.resource_errors[i].load() << "\n";
    }
    oss << "  Generic: " << s.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace keel_core

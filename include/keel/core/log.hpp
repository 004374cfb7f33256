#pragma once

/// @file log.hpp
/// @brief Logging utilities for keel

#include "error.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <map>
#include <memory>
#include <optional>

namespace keel_core {

/// @brief Initialize the logging system (basic)
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;

    /// Read the "log" config section; absent keys keep their defaults
    [[nodiscard]] static Result<LogConfig> from_json(const nlohmann::json& j);
};

/// Configure logging system with full options
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Core module logger
std::shared_ptr<spdlog::logger> core_logger();

/// Scheduler and operation logger
std::shared_ptr<spdlog::logger> async_logger();

/// File system logger
std::shared_ptr<spdlog::logger> io_logger();

/// Media loading logger
std::shared_ptr<spdlog::logger> media_logger();

/// Document store logger
std::shared_ptr<spdlog::logger> document_logger();

// =============================================================================
// Log Levels
// =============================================================================

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Logging
// =============================================================================

/// Log entry with structured data
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush and drop every keel logger
void shutdown_logging();

} // namespace keel_core

/// @file log.cpp
/// @brief Logging system implementation for keel
///
/// One spdlog logger per keel subsystem, created on first use from the
/// active LogConfig.

#include <keel/core/log.hpp>
#include <keel/core/config.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <mutex>
#include <map>
#include <memory>
#include <vector>
#include <filesystem>

namespace keel_core {

// =============================================================================
// Logger Registry
// =============================================================================

namespace {

/// Named loggers and the configuration they were built from
struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    LogConfig config;
};

LoggerRegistry& get_registry() {
    static LoggerRegistry registry;
    return registry;
}

/// Console sink plus an optional rotating file sink per logger
std::vector<spdlog::sink_ptr> create_sinks(const LogConfig& config, const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(std::move(console));
    }

    if (!config.file_enabled || config.log_directory.empty()) {
        return sinks;
    }

    const auto file_name = (std::filesystem::path(config.log_directory) / (name + ".log")).string();
    try {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file_name, config.max_file_size, config.max_files);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
        sinks.push_back(std::move(file));
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("Logger '{}' writes to the console only, {} unavailable: {}", name, file_name, e.what());
    }

    return sinks;
}

} // anonymous namespace

// =============================================================================
// Logger Configuration
// =============================================================================

Result<LogConfig> LogConfig::from_json(const nlohmann::json& j) {
    LogConfig config;

    std::string level_name = log_level_name(config.level);
    for (auto result : {
            read_config_key(j, "console", config.console_enabled),
            read_config_key(j, "file", config.file_enabled),
            read_config_key(j, "directory", config.log_directory),
            read_config_key(j, "max_file_size", config.max_file_size),
            read_config_key(j, "max_files", config.max_files),
            read_config_key(j, "level", level_name)}) {
        if (!result) {
            return Err<LogConfig>(result.error());
        }
    }

    auto level = parse_log_level(level_name);
    if (!level) {
        return Err<LogConfig>(Error(ErrorCode::InvalidArgument, "Unknown log level: " + level_name));
    }
    config.level = *level;

    if (config.file_enabled && config.log_directory.empty()) {
        return Err<LogConfig>(Error(ErrorCode::InvalidArgument,
            "File logging requires a log directory"));
    }

    return Ok(std::move(config));
}

void configure_logging(const LogConfig& config) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config = config;

    // Existing loggers keep their sinks and pick up the new level
    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(config.level);
    }
    spdlog::set_level(config.level);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (auto found = reg.loggers.find(name); found != reg.loggers.end()) {
        return found->second;
    }

    auto sinks = create_sinks(reg.config, name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.config.level);
    reg.loggers.emplace(name, logger);

    if (!spdlog::get(name)) {
        spdlog::register_logger(logger);
    }
    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    return get_logger("keel_core");
}

std::shared_ptr<spdlog::logger> async_logger() {
    return get_logger("keel_async");
}

std::shared_ptr<spdlog::logger> io_logger() {
    return get_logger("keel_io");
}

std::shared_ptr<spdlog::logger> media_logger() {
    return get_logger("keel_media");
}

std::shared_ptr<spdlog::logger> document_logger() {
    return get_logger("keel_document");
}

// =============================================================================
// Log Levels
// =============================================================================

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Structured Logging Support
// =============================================================================

void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields)
{
    std::string line = message;
    if (!fields.empty()) {
        const char* separator = " {";
        for (const auto& [key, value] : fields) {
            line += separator;
            line += key + "=\"" + value + "\"";
            separator = ", ";
        }
        line += "}";
    }

    get_logger(logger_name)->log(level, line);
}

// =============================================================================
// Logging Shutdown
// =============================================================================

void shutdown_logging() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
        spdlog::drop(name);
    }
    reg.loggers.clear();
    spdlog::default_logger()->flush();
}

} // namespace keel_core

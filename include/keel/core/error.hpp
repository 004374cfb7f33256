#pragma once

/// @file error.hpp
/// @brief Error handling types for keel_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>

namespace keel_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    NotSupported,
    NetworkError,
    Cancelled,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::NotSupported: return "NotSupported";
        case ErrorCode::NetworkError: return "NetworkError";
        case ErrorCode::Cancelled: return "Cancelled";
        default: return "Unknown";
    }
}

// =============================================================================
// ResourceError
// =============================================================================

/// Failures of a resource load or save
struct ResourceError {
    enum class Kind : std::uint8_t {
        FormatUnrecognized,  // Extension maps to no known media type
        TransportFailure,    // Network or local fetch failed
        FileAbsent,          // Strict load found no backing file
        IoFault,             // Read, write or flush raised a fault
        IoIndeterminate,     // I/O did not complete but raised no fault
        CodecFailure,        // Document or payload could not be decoded
    };

    Kind kind;
    std::string message;
    std::string location;

    [[nodiscard]] static ResourceError format_unrecognized(const std::string& location) {
        return ResourceError{Kind::FormatUnrecognized,
            "Unrecognized file format. Does the filename have the correct extension?", location};
    }

    [[nodiscard]] static ResourceError transport_failure(const std::string& location, const std::string& reason) {
        return ResourceError{Kind::TransportFailure, reason, location};
    }

    [[nodiscard]] static ResourceError file_absent(const std::string& location) {
        return ResourceError{Kind::FileAbsent, "File: [" + location + "] does not exist!", location};
    }

    [[nodiscard]] static ResourceError io_fault(const std::string& location, const std::string& reason) {
        return ResourceError{Kind::IoFault, reason, location};
    }

    [[nodiscard]] static ResourceError read_indeterminate(const std::string& location) {
        return ResourceError{Kind::IoIndeterminate,
            "Loading file " + location + " failed for unknown reason", location};
    }

    [[nodiscard]] static ResourceError write_indeterminate(const std::string& location) {
        return ResourceError{Kind::IoIndeterminate,
            "Failed to create a file at " + location + " for an unknown reason", location};
    }

    [[nodiscard]] static ResourceError flush_indeterminate(const std::string& location) {
        return ResourceError{Kind::IoIndeterminate,
            "Failed to create a file at " + location + " for an unknown reason (flush failed)", location};
    }

    [[nodiscard]] static ResourceError codec_failure(const std::string& location, const std::string& reason) {
        return ResourceError{Kind::CodecFailure,
            "Failed to decode '" + location + "': " + reason, location};
    }
};

/// Get resource error kind name
[[nodiscard]] inline const char* resource_error_kind_name(ResourceError::Kind kind) {
    switch (kind) {
        case ResourceError::Kind::FormatUnrecognized: return "FormatUnrecognized";
        case ResourceError::Kind::TransportFailure: return "TransportFailure";
        case ResourceError::Kind::FileAbsent: return "FileAbsent";
        case ResourceError::Kind::IoFault: return "IoFault";
        case ResourceError::Kind::IoIndeterminate: return "IoIndeterminate";
        case ResourceError::Kind::CodecFailure: return "CodecFailure";
        default: return "Unknown";
    }
}

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ResourceError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ResourceError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(ResourceError::Kind kind) {
        switch (kind) {
            case ResourceError::Kind::FormatUnrecognized: return ErrorCode::NotSupported;
            case ResourceError::Kind::TransportFailure: return ErrorCode::NetworkError;
            case ResourceError::Kind::FileAbsent: return ErrorCode::NotFound;
            case ResourceError::Kind::IoFault: return ErrorCode::IOError;
            case ResourceError::Kind::IoIndeterminate: return ErrorCode::Cancelled;
            case ResourceError::Kind::CodecFailure: return ErrorCode::ParseError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type (similar to Rust's Result<T, E>)
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with code, kind and context
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Get count of recorded errors of one resource kind
std::uint64_t resource_error_count(ResourceError::Kind kind);

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace keel_core

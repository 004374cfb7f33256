#pragma once

/// @file transport.hpp
/// @brief Transport contract for fetching media bytes

#include "format.hpp"
#include <keel/async/io_task.hpp>
#include <keel/async/task_pool.hpp>
#include <keel/core/error.hpp>
#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace keel_media {

// =============================================================================
// TransportResult
// =============================================================================

/// Classification of a finished request
enum class TransportResult : std::uint8_t {
    InProgress,           // Not finished
    Success,              // Payload available
    ConnectionError,      // Could not reach the resource
    ProtocolError,        // Server answered with an error status
    DataProcessingError,  // Payload could not be used
};

/// Get transport result name
[[nodiscard]] inline const char* transport_result_name(TransportResult result) {
    switch (result) {
        case TransportResult::InProgress: return "InProgress";
        case TransportResult::Success: return "Success";
        case TransportResult::ConnectionError: return "ConnectionError";
        case TransportResult::ProtocolError: return "ProtocolError";
        case TransportResult::DataProcessingError: return "DataProcessingError";
        default: return "Unknown";
    }
}

/// Render a media error for logging
[[nodiscard]] inline std::string describe_failure(TransportResult result, const std::string& message) {
    return std::string(transport_result_name(result)) + ": " + message;
}

// =============================================================================
// Request / Response
// =============================================================================

/// Media fetch request
struct TransportRequest {
    std::string url;
    MediaType type_hint = MediaType::Unknown;
};

/// Media fetch response
struct TransportResponse {
    TransportResult result = TransportResult::InProgress;
    std::string error;
    long status_code = 0;
    std::vector<std::uint8_t> body;

    [[nodiscard]] bool is_success() const noexcept { return result == TransportResult::Success; }

    [[nodiscard]] static TransportResponse success(std::vector<std::uint8_t> payload, long status = 200) {
        TransportResponse response;
        response.result = TransportResult::Success;
        response.status_code = status;
        response.body = std::move(payload);
        return response;
    }

    [[nodiscard]] static TransportResponse failure(TransportResult result, std::string message, long status = 0) {
        TransportResponse response;
        response.result = result;
        response.error = std::move(message);
        response.status_code = status;
        return response;
    }
};

// =============================================================================
// ITransport
// =============================================================================

/// Network / local fetch abstraction
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start a request; the task completes when the transfer ends
    [[nodiscard]] virtual keel_async::IoTask<TransportResponse> send(const TransportRequest& request) = 0;
};

// =============================================================================
// TransportConfig
// =============================================================================

/// Transport settings
struct TransportConfig {
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds request_timeout{30000};
    bool verify_ssl = true;
    std::string user_agent = "keel/1.0";
    long max_redirects = 5;

    /// Read the "transport" config section; absent keys keep their defaults
    [[nodiscard]] static keel_core::Result<TransportConfig> from_json(const nlohmann::json& j);
};

/// Create the libcurl transport (http, https and file URLs)
[[nodiscard]] std::shared_ptr<ITransport> create_curl_transport(
    TransportConfig config,
    std::shared_ptr<keel_async::IoWorkerPool> pool);

} // namespace keel_media

/// @file curl_transport.cpp
/// @brief Transport implementation using libcurl

#include <keel/media/transport.hpp>
#include <keel/core/config.hpp>
#include <keel/core/log.hpp>

#include <curl/curl.h>

#include <mutex>

namespace keel_media {

// =============================================================================
// TransportConfig
// =============================================================================

keel_core::Result<TransportConfig> TransportConfig::from_json(const nlohmann::json& j) {
    TransportConfig config;

    auto connect_ms = static_cast<std::int64_t>(config.connect_timeout.count());
    auto request_ms = static_cast<std::int64_t>(config.request_timeout.count());

    for (auto result : {
            keel_core::read_config_key(j, "connect_timeout_ms", connect_ms),
            keel_core::read_config_key(j, "request_timeout_ms", request_ms),
            keel_core::read_config_key(j, "verify_ssl", config.verify_ssl),
            keel_core::read_config_key(j, "user_agent", config.user_agent),
            keel_core::read_config_key(j, "max_redirects", config.max_redirects)}) {
        if (!result) {
            return keel_core::Err<TransportConfig>(result.error());
        }
    }

    if (connect_ms < 0 || request_ms < 0) {
        return keel_core::Err<TransportConfig>(keel_core::Error(keel_core::ErrorCode::InvalidArgument,
            "Transport timeouts must not be negative"));
    }

    config.connect_timeout = std::chrono::milliseconds(connect_ms);
    config.request_timeout = std::chrono::milliseconds(request_ms);
    return keel_core::Ok(std::move(config));
}

namespace {

// =============================================================================
// libcurl Transport Implementation
// =============================================================================

void ensure_curl_initialized() {
    static std::once_flag s_once;
    std::call_once(s_once, [] {
        curl_global_init(CURL_GLOBAL_ALL);
    });
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* body = static_cast<std::vector<std::uint8_t>*>(userdata);
    std::size_t total = size * nmemb;
    body->insert(body->end(), ptr, ptr + total);
    return total;
}

/// Map a curl failure onto a transport result
TransportResult classify_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_FILE_COULDNT_READ_FILE:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
            return TransportResult::ConnectionError;
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
        case CURLE_TOO_MANY_REDIRECTS:
            return TransportResult::ProtocolError;
        case CURLE_WRITE_ERROR:
        case CURLE_BAD_CONTENT_ENCODING:
            return TransportResult::DataProcessingError;
        default:
            return TransportResult::ConnectionError;
    }
}

class CurlTransport : public ITransport {
public:
    CurlTransport(TransportConfig config, std::shared_ptr<keel_async::IoWorkerPool> pool)
        : m_config(std::move(config))
        , m_pool(std::move(pool))
    {
        ensure_curl_initialized();
    }

    keel_async::IoTask<TransportResponse> send(const TransportRequest& request) override {
        keel_core::media_logger()->debug("Requesting {} (type hint {})",
            request.url, media_type_name(request.type_hint));

        return m_pool->submit_task([config = m_config, request]() {
            return perform(config, request);
        });
    }

private:
    static TransportResponse perform(const TransportConfig& config, const TransportRequest& request) {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return TransportResponse::failure(TransportResult::ConnectionError, "curl_easy_init failed");
        }

        std::vector<std::uint8_t> body;
        char error_buffer[CURL_ERROR_SIZE] = {0};

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config.verify_ssl ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config.verify_ssl ? 2L : 0L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config.request_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, config.max_redirects);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

        CURLcode res = curl_easy_perform(curl);

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            std::string message = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
            keel_core::media_logger()->debug("Request {} failed: {}", request.url, message);
            return TransportResponse::failure(classify_curl_error(res), message, status);
        }

        // file:// transfers report no status
        if (status >= 400) {
            return TransportResponse::failure(TransportResult::ProtocolError,
                "HTTP/1.1 " + std::to_string(status), status);
        }

        return TransportResponse::success(std::move(body), status);
    }

    TransportConfig m_config;
    std::shared_ptr<keel_async::IoWorkerPool> m_pool;
};

} // anonymous namespace

std::shared_ptr<ITransport> create_curl_transport(
    TransportConfig config,
    std::shared_ptr<keel_async::IoWorkerPool> pool)
{
    return std::make_shared<CurlTransport>(std::move(config), std::move(pool));
}

} // namespace keel_media

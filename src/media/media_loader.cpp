/// @file media_loader.cpp
/// @brief MediaLoader and its load operation

#include <keel/media/media_loader.hpp>
#include <keel/async/completion.hpp>
#include <keel/async/io_task.hpp>
#include <keel/core/config.hpp>
#include <keel/core/log.hpp>

namespace keel_media {

// =============================================================================
// MediaSource serialization
// =============================================================================

void to_json(nlohmann::json& j, const MediaSource& source) {
    j = nlohmann::json{
        {"path", source.location},
        {"isWeb", source.is_remote},
    };
}

void from_json(const nlohmann::json& j, MediaSource& source) {
    j.at("path").get_to(source.location);
    source.is_remote = j.value("isWeb", false);
}

// =============================================================================
// MediaLoadConfig
// =============================================================================

keel_core::Result<MediaLoadConfig> MediaLoadConfig::from_json(const nlohmann::json& j) {
    MediaLoadConfig config;

    std::string hint = "resolved";
    auto result = keel_core::read_config_key(j, "type_hint", hint);
    if (!result) {
        return keel_core::Err<MediaLoadConfig>(result.error());
    }

    if (hint == "resolved") {
        config.type_hint = TypeHintPolicy::Resolved;
    } else if (hint == "fixed_mpeg") {
        config.type_hint = TypeHintPolicy::FixedMpeg;
    } else {
        return keel_core::Err<MediaLoadConfig>(keel_core::Error(keel_core::ErrorCode::InvalidArgument,
            "Unknown media type_hint '" + hint + "'"));
    }

    return keel_core::Ok(std::move(config));
}

// =============================================================================
// MediaLoadOperation
// =============================================================================

class MediaLoadOperation : public keel_async::Operation {
public:
    MediaLoadOperation(MediaLoader& loader, LoadFinishedCallback on_finished, MediaErrorCallback on_error)
        : Operation("media load " + loader.location())
        , m_loader(loader)
        , m_completion(std::move(on_finished), std::move(on_error), name()) {}

protected:
    keel_async::OperationState step() override {
        if (!m_started) {
            m_started = true;
            return start();
        }
        if (!m_task.is_completed()) {
            return keel_async::OperationState::Awaiting;
        }
        return finish();
    }

private:
    keel_async::OperationState start() {
        MediaType type = m_loader.media_type();
        if (type == MediaType::Unknown) {
            return fail(TransportResult::DataProcessingError,
                keel_core::ResourceError::format_unrecognized(m_loader.location()));
        }

        if (!m_loader.m_transport) {
            return fail(TransportResult::ConnectionError,
                keel_core::ResourceError::transport_failure(m_loader.location(), "No transport configured"));
        }

        TransportRequest request;
        request.url = m_loader.request_url();
        request.type_hint = m_loader.m_config.type_hint == TypeHintPolicy::FixedMpeg
            ? MediaType::Mpeg
            : type;

        keel_core::media_logger()->debug("Loading {} as {}", request.url, media_type_name(type));
        m_type = type;
        m_task = m_loader.m_transport->send(request);
        if (!m_task.valid()) {
            return fail(TransportResult::ConnectionError,
                keel_core::ResourceError::transport_failure(m_loader.location(), "Transport returned no request"));
        }

        // Transports may complete synchronously
        if (m_task.is_completed()) {
            return finish();
        }
        return keel_async::OperationState::Awaiting;
    }

    keel_async::OperationState finish() {
        const std::string& location = m_loader.location();

        switch (m_task.status()) {
            case keel_async::TaskStatus::Faulted:
                return fail(TransportResult::ConnectionError,
                    keel_core::ResourceError::transport_failure(location, m_task.fault_message()));
            case keel_async::TaskStatus::Cancelled:
            case keel_async::TaskStatus::Pending:
                return fail(TransportResult::ConnectionError,
                    keel_core::ResourceError::transport_failure(location, "Request for " + location + " was cancelled"));
            case keel_async::TaskStatus::Succeeded:
                break;
        }

        TransportResponse response = m_task.take();
        if (!response.is_success()) {
            TransportResult result = response.result == TransportResult::InProgress
                ? TransportResult::ConnectionError
                : response.result;
            return fail(result, keel_core::ResourceError::transport_failure(location, response.error));
        }

        auto clip = decode_audio_clip(std::move(response.body), m_type, location);
        if (!clip) {
            return fail(TransportResult::DataProcessingError, clip.error());
        }

        m_loader.assign_handle(std::move(clip).value());
        keel_core::media_logger()->debug("Loaded {}", location);
        return m_completion.succeed();
    }

    keel_async::OperationState fail(TransportResult result, keel_core::Error error) {
        m_loader.assign_handle(nullptr);

        error.with_context("operation", name());
        keel_core::debug::record_error(error);
        keel_core::media_logger()->warn("Failed to load {}: {} ({})",
            m_loader.location(), error.message(), transport_result_name(result));

        return m_completion.fail(result, error.message());
    }

    MediaLoader& m_loader;
    keel_async::Completion<TransportResult, const std::string&> m_completion;
    keel_async::IoTask<TransportResponse> m_task;
    MediaType m_type = MediaType::Unknown;
    bool m_started = false;
};

// =============================================================================
// MediaLoader
// =============================================================================

MediaLoader::MediaLoader(MediaSource source, std::shared_ptr<ITransport> transport, MediaLoadConfig config)
    : m_source(std::move(source))
    , m_transport(std::move(transport))
    , m_config(std::move(config))
{
    if (!m_config.resolver) {
        m_config.resolver = resolve_media_type;
    }
}

MediaType MediaLoader::media_type() const {
    return m_config.resolver(m_source.location);
}

std::string MediaLoader::request_url() const {
    if (m_source.is_remote) {
        return m_source.location;
    }
    return "file://" + m_source.location;
}

std::unique_ptr<keel_async::Operation> MediaLoader::load(
    LoadFinishedCallback on_finished, MediaErrorCallback on_error)
{
    return std::make_unique<MediaLoadOperation>(*this, std::move(on_finished), std::move(on_error));
}

void MediaLoader::assign_handle(MediaHandle handle) {
    m_handle = std::move(handle);
}

} // namespace keel_media

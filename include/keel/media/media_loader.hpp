#pragma once

/// @file media_loader.hpp
/// @brief Audio resource loaded from a local path or a remote URL

#include "audio_clip.hpp"
#include "format.hpp"
#include "transport.hpp"
#include <keel/async/operation.hpp>
#include <keel/core/error.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <string>

namespace keel_media {

// =============================================================================
// MediaSource
// =============================================================================

/// Where a media resource lives
struct MediaSource {
    std::string location;
    bool is_remote = false;

    bool operator==(const MediaSource& other) const {
        return location == other.location && is_remote == other.is_remote;
    }
};

/// Serialized as {"path": ..., "isWeb": ...}
void to_json(nlohmann::json& j, const MediaSource& source);
void from_json(const nlohmann::json& j, MediaSource& source);

// =============================================================================
// MediaLoadConfig
// =============================================================================

/// Which media type the transport request advertises
enum class TypeHintPolicy : std::uint8_t {
    Resolved,   // The type resolved from the extension
    FixedMpeg,  // Always MPEG, whatever the extension
};

/// Media loading settings
struct MediaLoadConfig {
    TypeHintPolicy type_hint = TypeHintPolicy::Resolved;
    FormatResolver resolver = resolve_media_type;

    /// Read the "media" config section ("type_hint": "resolved" | "fixed_mpeg")
    [[nodiscard]] static keel_core::Result<MediaLoadConfig> from_json(const nlohmann::json& j);
};

// =============================================================================
// MediaLoader
// =============================================================================

using LoadFinishedCallback = std::function<void()>;
using MediaErrorCallback = std::function<void(TransportResult, const std::string&)>;

class MediaLoadOperation;

/// Audio resource with a lazily loaded handle.
///
/// Construction performs no I/O. The handle reflects only the most recent
/// successful load; any failed load clears it. Running two loads of the same
/// loader at once is a caller error. The loader must outlive its operations.
/// Without a transport every load fails with ConnectionError.
class MediaLoader {
public:
    MediaLoader(MediaSource source, std::shared_ptr<ITransport> transport, MediaLoadConfig config = {});

    MediaLoader(const MediaLoader&) = delete;
    MediaLoader& operator=(const MediaLoader&) = delete;

    [[nodiscard]] const std::string& location() const noexcept { return m_source.location; }
    [[nodiscard]] bool is_remote() const noexcept { return m_source.is_remote; }
    [[nodiscard]] const MediaSource& source() const noexcept { return m_source; }

    /// Loaded clip, or null
    [[nodiscard]] const MediaHandle& handle() const noexcept { return m_handle; }
    [[nodiscard]] bool is_loaded() const noexcept { return m_handle != nullptr; }

    /// Media type resolved from the location
    [[nodiscard]] MediaType media_type() const;

    /// URL handed to the transport
    [[nodiscard]] std::string request_url() const;

    /// Create a load operation; drive it with a CooperativeScheduler.
    /// @param on_finished Fired after the handle has been stored
    /// @param on_error Fired after the handle has been cleared; may be empty
    [[nodiscard]] std::unique_ptr<keel_async::Operation> load(
        LoadFinishedCallback on_finished, MediaErrorCallback on_error = nullptr);

private:
    friend class MediaLoadOperation;

    void assign_handle(MediaHandle handle);

    MediaSource m_source;
    std::shared_ptr<ITransport> m_transport;
    MediaLoadConfig m_config;
    MediaHandle m_handle;
};

} // namespace keel_media

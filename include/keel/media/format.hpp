#pragma once

/// @file format.hpp
/// @brief Media type resolution from file extensions

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace keel_media {

// =============================================================================
// MediaType
// =============================================================================

/// Audio container/codec family
enum class MediaType : std::uint8_t {
    Unknown = 0,
    Mpeg,
    OggVorbis,
    Wav,
    Aiff,
    Xma,
    Xm,
    It,
    Mod,
    AudioQueue,
    S3m,
    Vag,
};

/// Get media type name
[[nodiscard]] const char* media_type_name(MediaType type);

/// Extension after the last '.', lowercased. Empty if there is no '.'.
[[nodiscard]] std::string extract_extension(std::string_view filename);

/// Map a filename or URL to its media type by extension.
/// Pure; unrecognized or missing extensions give MediaType::Unknown.
[[nodiscard]] MediaType resolve_media_type(std::string_view filename);

/// Replaceable resolution policy
using FormatResolver = std::function<MediaType(std::string_view)>;

} // namespace keel_media

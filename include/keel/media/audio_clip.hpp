#pragma once

/// @file audio_clip.hpp
/// @brief Decoded audio payload held by a loaded media handle

#include "format.hpp"
#include <keel/core/error.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace keel_media {

// =============================================================================
// SampleFormat
// =============================================================================

/// Layout of AudioClip::data
enum class SampleFormat : std::uint8_t {
    Encoded,     // Payload kept in its container encoding
    PCM_S16,     // Interleaved signed 16-bit
    PCM_F32,     // Interleaved 32-bit float
};

/// Get bytes per sample for format (0 for encoded payloads)
[[nodiscard]] inline std::uint32_t bytes_per_sample(SampleFormat format) {
    switch (format) {
        case SampleFormat::Encoded: return 0;
        case SampleFormat::PCM_S16: return 2;
        case SampleFormat::PCM_F32: return 4;
    }
    return 0;
}

// =============================================================================
// AudioClip
// =============================================================================

/// Audio loaded by a MediaLoader
struct AudioClip {
    std::string name;
    MediaType type = MediaType::Unknown;
    SampleFormat format = SampleFormat::Encoded;
    std::uint32_t sample_rate = 0;
    std::uint32_t channels = 0;
    std::uint64_t frame_count = 0;
    std::vector<std::uint8_t> data;  // PCM samples, or the encoded payload

    /// Whether data holds PCM samples
    [[nodiscard]] bool is_decoded() const { return format != SampleFormat::Encoded; }

    /// Get duration in seconds (0 when unknown)
    [[nodiscard]] double duration() const {
        if (sample_rate == 0) return 0.0;
        return static_cast<double>(frame_count) / static_cast<double>(sample_rate);
    }

    /// Get bytes per frame
    [[nodiscard]] std::uint32_t bytes_per_frame() const {
        return channels * bytes_per_sample(format);
    }
};

/// Opaque handle to a loaded clip; null when nothing is loaded
using MediaHandle = std::shared_ptr<const AudioClip>;

/// Build a clip from a fetched payload.
///
/// WAV (dr_wav), MPEG (minimp3) and Ogg Vorbis (stb_vorbis) payloads are
/// decoded to interleaved PCM; a payload the decoder rejects is a codec
/// failure. Tracker, console and AIFF formats keep their encoded bytes.
[[nodiscard]] keel_core::Result<MediaHandle> decode_audio_clip(
    std::vector<std::uint8_t> payload, MediaType type, const std::string& name);

} // namespace keel_media

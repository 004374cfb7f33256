#pragma once

/// @file audio_fixtures.hpp
/// @brief Minimal encoded audio payloads for media tests

#include <cstdint>
#include <cstring>
#include <vector>

namespace keel_test {

inline void put_u16(std::vector<std::uint8_t>& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value >> 8));
}

inline void put_u32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

inline void put_tag(std::vector<std::uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

struct WavShape {
    std::uint16_t channels = 1;
    std::uint32_t sample_rate = 8000;
    std::uint32_t frames = 0;
    std::uint16_t format_tag = 1;  // 1 = PCM, 3 = IEEE float
    std::uint16_t bits = 16;
    bool list_chunk = false;       // odd-sized chunk ahead of "fmt "
};

/// RIFF/WAVE file of silent frames
inline std::vector<std::uint8_t> make_wav(const WavShape& shape) {
    std::uint16_t block_align = static_cast<std::uint16_t>(shape.channels * shape.bits / 8);
    std::uint32_t data_size = shape.frames * block_align;
    std::vector<std::uint8_t> out;

    put_tag(out, "RIFF");
    put_u32(out, 0);  // patched below
    put_tag(out, "WAVE");

    if (shape.list_chunk) {
        put_tag(out, "LIST");
        put_u32(out, 3);
        out.insert(out.end(), {'a', 'b', 'c', 0});
    }

    put_tag(out, "fmt ");
    put_u32(out, 16);
    put_u16(out, shape.format_tag);
    put_u16(out, shape.channels);
    put_u32(out, shape.sample_rate);
    put_u32(out, shape.sample_rate * block_align);
    put_u16(out, block_align);
    put_u16(out, shape.bits);

    put_tag(out, "data");
    put_u32(out, data_size);
    out.insert(out.end(), data_size, 0);

    std::uint32_t riff_size = static_cast<std::uint32_t>(out.size() - 8);
    std::memcpy(out.data() + 4, &riff_size, 4);
    return out;
}

constexpr std::uint32_t k_mp3_frame_samples = 1152;

/// MPEG-1 Layer III stream of silent frames: 44.1 kHz, 128 kbit/s, mono.
/// Zeroed side info gives empty granules with no reservoir.
inline std::vector<std::uint8_t> make_silent_mp3(std::size_t frames) {
    constexpr std::size_t k_frame_bytes = 417;  // 144 * 128000 / 44100
    std::vector<std::uint8_t> out;
    for (std::size_t i = 0; i < frames; ++i) {
        std::size_t start = out.size();
        out.insert(out.end(), {0xFF, 0xFB, 0x90, 0xC0});
        out.resize(start + k_frame_bytes, 0);
    }
    return out;
}

/// Ogg Vorbis stream: 8 kHz mono, one codebook, ten silent 256-sample
/// packets, final granule position 1152.
inline std::vector<std::uint8_t> silent_ogg_vorbis() {
    return {
        0x4F, 0x67, 0x67, 0x53, 0x00, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x6C, 0x65, 0x65, 0x6B, 0x00, 0x00, 0x00, 0x00, 0x5F, 0xFE,
        0xEB, 0xAC, 0x01, 0x1E, 0x01, 0x76, 0x6F, 0x72, 0x62, 0x69, 0x73, 0x00,
        0x00, 0x00, 0x00, 0x01, 0x40, 0x1F, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xB8, 0x01, 0x4F, 0x67,
        0x67, 0x53, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x6C, 0x65, 0x65, 0x6B, 0x01, 0x00, 0x00, 0x00, 0x1A, 0x35, 0x5B, 0x53,
        0x02, 0x10, 0x34, 0x03, 0x76, 0x6F, 0x72, 0x62, 0x69, 0x73, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x05, 0x76, 0x6F, 0x72, 0x62,
        0x69, 0x73, 0x00, 0x42, 0x43, 0x56, 0x01, 0x00, 0x02, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x10, 0x00, 0x00, 0x40, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x4F,
        0x67, 0x67, 0x53, 0x00, 0x04, 0x80, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x6C, 0x65, 0x65, 0x6B, 0x02, 0x00, 0x00, 0x00, 0xFA, 0x95, 0x37,
        0x74, 0x0A, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    };
}

} // namespace keel_test

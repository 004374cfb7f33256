/// @file audio_clip.cpp
/// @brief Payload decoding into audio clips

#include <keel/media/audio_clip.hpp>
#include <keel/core/log.hpp>

#include <climits>
#include <cstdlib>
#include <cstring>

// Implementations live in audio_codecs.cpp
#include <dr_wav.h>
#include <minimp3_ex.h>
#define STB_VORBIS_HEADER_ONLY
#include <stb_vorbis.c>

namespace keel_media {

namespace {

using ClipResult = keel_core::Result<MediaHandle>;

constexpr drwav_uint64 k_wav_chunk_frames = 4096;

ClipResult decode_failure(const AudioClip& clip, const std::string& reason) {
    return keel_core::Err<MediaHandle>(keel_core::ResourceError::codec_failure(clip.name, reason));
}

ClipResult finish_clip(AudioClip clip) {
    keel_core::media_logger()->trace("Decoded '{}' ({}): {} Hz, {} channels, {} frames",
        clip.name, media_type_name(clip.type), clip.sample_rate, clip.channels, clip.frame_count);

    MediaHandle handle = std::make_shared<AudioClip>(std::move(clip));
    return keel_core::Ok(std::move(handle));
}

template<typename Sample, typename ReadFn>
drwav_uint64 read_wav_frames(drwav& wav, std::vector<std::uint8_t>& out, ReadFn read) {
    std::vector<Sample> chunk(static_cast<std::size_t>(k_wav_chunk_frames) * wav.channels);
    drwav_uint64 total = 0;

    while (true) {
        drwav_uint64 frames = read(&wav, k_wav_chunk_frames, chunk.data());
        if (frames == 0) {
            break;
        }
        auto bytes = static_cast<std::size_t>(frames) * wav.channels * sizeof(Sample);
        auto offset = out.size();
        out.resize(offset + bytes);
        std::memcpy(out.data() + offset, chunk.data(), bytes);
        total += frames;
    }

    return total;
}

// =============================================================================
// WAV (dr_wav)
// =============================================================================

ClipResult decode_wav(const std::vector<std::uint8_t>& payload, AudioClip clip) {
    drwav wav;
    if (!drwav_init_memory(&wav, payload.data(), payload.size(), nullptr)) {
        return decode_failure(clip, "invalid WAV header");
    }

    if (wav.channels == 0 || wav.sampleRate == 0) {
        drwav_uninit(&wav);
        return decode_failure(clip, "WAV header declares no channels or sample rate");
    }

    clip.sample_rate = wav.sampleRate;
    clip.channels = wav.channels;

    const drwav_uint64 declared = wav.totalPCMFrameCount;
    const std::uint16_t encoding = wav.translatedFormatTag;

    if (encoding == DR_WAVE_FORMAT_IEEE_FLOAT) {
        clip.format = SampleFormat::PCM_F32;
        clip.frame_count = read_wav_frames<float>(wav, clip.data, drwav_read_pcm_frames_f32);
    } else {
        clip.format = SampleFormat::PCM_S16;
        clip.frame_count = read_wav_frames<drwav_int16>(wav, clip.data, drwav_read_pcm_frames_s16);
    }
    drwav_uninit(&wav);

    if (declared > 0 && clip.frame_count == 0) {
        return decode_failure(clip, "unsupported WAV encoding " + std::to_string(encoding));
    }

    return finish_clip(std::move(clip));
}

// =============================================================================
// MPEG (minimp3)
// =============================================================================

ClipResult decode_mpeg(const std::vector<std::uint8_t>& payload, AudioClip clip) {
    mp3dec_t decoder;
    mp3dec_init(&decoder);

    mp3dec_file_info_t info;
    std::memset(&info, 0, sizeof(info));

    int result = mp3dec_load_buf(&decoder, payload.data(), payload.size(), &info, nullptr, nullptr);
    if (result != 0 || info.buffer == nullptr || info.samples == 0 || info.channels <= 0 || info.hz <= 0) {
        std::free(info.buffer);
        return decode_failure(clip, "no decodable MPEG audio frames");
    }

    clip.format = SampleFormat::PCM_S16;
    clip.sample_rate = static_cast<std::uint32_t>(info.hz);
    clip.channels = static_cast<std::uint32_t>(info.channels);
    clip.frame_count = static_cast<std::uint64_t>(info.samples / static_cast<std::size_t>(info.channels));

    std::size_t data_size = info.samples * sizeof(mp3d_sample_t);
    clip.data.resize(data_size);
    std::memcpy(clip.data.data(), info.buffer, data_size);
    std::free(info.buffer);

    return finish_clip(std::move(clip));
}

// =============================================================================
// Ogg Vorbis (stb_vorbis)
// =============================================================================

ClipResult decode_ogg_vorbis(const std::vector<std::uint8_t>& payload, AudioClip clip) {
    if (payload.size() > static_cast<std::size_t>(INT_MAX)) {
        return decode_failure(clip, "Ogg Vorbis payload is too large");
    }

    int channels = 0;
    int sample_rate = 0;
    short* output = nullptr;

    int samples = stb_vorbis_decode_memory(
        payload.data(), static_cast<int>(payload.size()),
        &channels, &sample_rate, &output);

    if (samples < 0 || output == nullptr || channels <= 0) {
        std::free(output);
        return decode_failure(clip, "invalid Ogg Vorbis stream");
    }

    clip.format = SampleFormat::PCM_S16;
    clip.sample_rate = static_cast<std::uint32_t>(sample_rate);
    clip.channels = static_cast<std::uint32_t>(channels);
    clip.frame_count = static_cast<std::uint64_t>(samples);

    // stb_vorbis counts frames, not samples
    std::size_t data_size = static_cast<std::size_t>(samples) * static_cast<std::size_t>(channels) * sizeof(short);
    clip.data.resize(data_size);
    std::memcpy(clip.data.data(), output, data_size);
    std::free(output);

    return finish_clip(std::move(clip));
}

} // anonymous namespace

// =============================================================================
// Clip Construction
// =============================================================================

keel_core::Result<MediaHandle> decode_audio_clip(
    std::vector<std::uint8_t> payload, MediaType type, const std::string& name)
{
    AudioClip clip;
    clip.name = name;
    clip.type = type;

    if (payload.empty()) {
        return decode_failure(clip, "payload is empty");
    }

    switch (type) {
        case MediaType::Wav:
            return decode_wav(payload, std::move(clip));
        case MediaType::Mpeg:
            return decode_mpeg(payload, std::move(clip));
        case MediaType::OggVorbis:
            return decode_ogg_vorbis(payload, std::move(clip));
        default:
            break;
    }

    // No decoder for this family; playback backends take the container as is
    clip.data = std::move(payload);
    return finish_clip(std::move(clip));
}

} // namespace keel_media

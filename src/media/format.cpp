/// @file format.cpp
/// @brief Media type resolution

#include <keel/media/format.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace keel_media {

namespace {

constexpr std::array<std::pair<std::string_view, MediaType>, 14> k_extensions = {{
    {"mp3", MediaType::Mpeg},
    {"mp2", MediaType::Mpeg},
    {"mpeg", MediaType::Mpeg},
    {"ogg", MediaType::OggVorbis},
    {"wav", MediaType::Wav},
    {"aiff", MediaType::Aiff},
    {"xma", MediaType::Xma},
    {"xm", MediaType::Xm},
    {"it", MediaType::It},
    {"mod", MediaType::Mod},
    {"alac", MediaType::AudioQueue},
    {"aac", MediaType::AudioQueue},
    {"s3m", MediaType::S3m},
    {"vag", MediaType::Vag},
}};

} // anonymous namespace

const char* media_type_name(MediaType type) {
    switch (type) {
        case MediaType::Unknown: return "Unknown";
        case MediaType::Mpeg: return "MPEG";
        case MediaType::OggVorbis: return "OGGVORBIS";
        case MediaType::Wav: return "WAV";
        case MediaType::Aiff: return "AIFF";
        case MediaType::Xma: return "XMA";
        case MediaType::Xm: return "XM";
        case MediaType::It: return "IT";
        case MediaType::Mod: return "MOD";
        case MediaType::AudioQueue: return "AUDIOQUEUE";
        case MediaType::S3m: return "S3M";
        case MediaType::Vag: return "VAG";
    }
    return "Unknown";
}

std::string extract_extension(std::string_view filename) {
    auto pos = filename.rfind('.');
    if (pos == std::string_view::npos) {
        return {};
    }

    std::string ext(filename.substr(pos + 1));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

MediaType resolve_media_type(std::string_view filename) {
    auto ext = extract_extension(filename);
    if (ext.empty()) {
        return MediaType::Unknown;
    }

    for (const auto& [name, type] : k_extensions) {
        if (name == ext) {
            return type;
        }
    }
    return MediaType::Unknown;
}

} // namespace keel_media

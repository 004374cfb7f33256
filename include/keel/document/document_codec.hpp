#pragma once

/// @file document_codec.hpp
/// @brief JSON wrapping codec for persisted documents

#include <keel/core/error.hpp>

#include <nlohmann/json.hpp>

#include <exception>
#include <string>

namespace keel_document {

/// Key under which the document value is stored
inline constexpr const char* k_content_key = "content";

/// Encodes a value as {"content": value}.
/// T is any type nlohmann/json can convert.
template<typename T>
struct DocumentCodec {
    /// Pretty-printed document text
    [[nodiscard]] static keel_core::Result<std::string> serialize(const T& value, const std::string& location) {
        try {
            nlohmann::json j;
            j[k_content_key] = value;
            return keel_core::Ok(j.dump(4));
        } catch (const std::exception& e) {
            // nlohmann errors and whatever a user to_json throws
            return keel_core::Err<std::string>(keel_core::Error(keel_core::ErrorCode::InvalidArgument,
                "Failed to encode '" + location + "': " + e.what()));
        }
    }

    /// Parse document text
    [[nodiscard]] static keel_core::Result<T> deserialize(const std::string& text, const std::string& location) {
        try {
            auto j = nlohmann::json::parse(text);
            if (!j.is_object() || !j.contains(k_content_key)) {
                return keel_core::Err<T>(keel_core::ResourceError::codec_failure(location,
                    std::string("missing '") + k_content_key + "' field"));
            }
            return keel_core::Ok(j.at(k_content_key).template get<T>());
        } catch (const std::exception& e) {
            // nlohmann errors and whatever a user from_json throws
            return keel_core::Err<T>(keel_core::ResourceError::codec_failure(location, e.what()));
        }
    }
};

} // namespace keel_document

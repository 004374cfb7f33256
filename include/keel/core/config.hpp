#pragma once

/// @file config.hpp
/// @brief JSON configuration helpers for keel

#include "error.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>

namespace keel_core {

/// Read and parse a JSON configuration file
[[nodiscard]] Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/// Get a config section, or an empty object if the section is absent
[[nodiscard]] Result<nlohmann::json> config_section(const nlohmann::json& root, const std::string& name);

/// Read an optional key into @p out; absent keys leave @p out unchanged.
/// Fails if the key is present with an incompatible type.
template<typename T>
[[nodiscard]] Result<void> read_config_key(const nlohmann::json& section, const std::string& key, T& out) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return Ok();
    }
    try {
        out = it->template get<T>();
    } catch (const nlohmann::json::exception& e) {
        return Err(Error(ErrorCode::InvalidArgument,
            "Invalid value for config key '" + key + "': " + e.what()));
    }
    return Ok();
}

} // namespace keel_core

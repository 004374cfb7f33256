/// @file config.cpp
/// @brief JSON configuration helpers for keel

#include <keel/core/config.hpp>
#include <keel/core/log.hpp>

#include <fstream>
#include <sstream>

namespace keel_core {

Result<nlohmann::json> read_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<nlohmann::json>(Error(ErrorCode::NotFound,
            "Failed to open config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        return Err<nlohmann::json>(Error(ErrorCode::ParseError,
            "Failed to parse config file '" + path.string() + "': " + e.what()));
    }

    if (!j.is_object()) {
        return Err<nlohmann::json>(Error(ErrorCode::ParseError,
            "Config file '" + path.string() + "' must contain a JSON object"));
    }

    core_logger()->debug("Loaded config file {}", path.string());
    return Ok(std::move(j));
}

Result<nlohmann::json> config_section(const nlohmann::json& root, const std::string& name) {
    auto it = root.find(name);
    if (it == root.end() || it->is_null()) {
        return Ok(nlohmann::json::object());
    }
    if (!it->is_object()) {
        return Err<nlohmann::json>(Error(ErrorCode::InvalidArgument,
            "Config section '" + name + "' must be an object"));
    }
    return Ok(nlohmann::json(*it));
}

} // namespace keel_core

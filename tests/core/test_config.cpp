/// @file test_config.cpp
/// @brief Tests for keel_core configuration and log configuration

#include <catch2/catch_test_macros.hpp>
#include <keel/core/config.hpp>
#include <keel/core/log.hpp>

#include <filesystem>
#include <fstream>

using namespace keel_core;

namespace {

std::filesystem::path write_temp_file(const std::string& name, const std::string& text) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::trunc);
    out << text;
    return path;
}

} // anonymous namespace

// =============================================================================
// Config File Tests
// =============================================================================

TEST_CASE("read_json_file: parses object", "[core][config]") {
    auto path = write_temp_file("keel_config_ok.json", R"({"log": {"level": "debug"}})");

    auto result = read_json_file(path);
    REQUIRE(result.is_ok());
    REQUIRE(result.value()["log"]["level"] == "debug");

    std::filesystem::remove(path);
}

TEST_CASE("read_json_file: errors", "[core][config]") {
    SECTION("missing file") {
        auto result = read_json_file(std::filesystem::temp_directory_path() / "keel_config_missing.json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("malformed JSON") {
        auto path = write_temp_file("keel_config_bad.json", "{ nope");
        auto result = read_json_file(path);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
        std::filesystem::remove(path);
    }

    SECTION("not an object") {
        auto path = write_temp_file("keel_config_array.json", "[1, 2]");
        auto result = read_json_file(path);
        REQUIRE(result.is_err());
        std::filesystem::remove(path);
    }
}

TEST_CASE("config_section: absent section is empty", "[core][config]") {
    nlohmann::json root = {{"io", {{"worker_threads", 4}}}};

    auto io = config_section(root, "io");
    REQUIRE(io.is_ok());
    REQUIRE(io.value()["worker_threads"] == 4);

    auto media = config_section(root, "media");
    REQUIRE(media.is_ok());
    REQUIRE(media.value().empty());

    nlohmann::json bad = {{"io", 3}};
    REQUIRE(config_section(bad, "io").is_err());
}

TEST_CASE("read_config_key: type mismatch names the key", "[core][config]") {
    nlohmann::json section = {{"count", "three"}};
    int count = 7;

    auto result = read_config_key(section, "count", count);
    REQUIRE(result.is_err());
    REQUIRE(result.error().message().find("count") != std::string::npos);
    REQUIRE(count == 7);

    REQUIRE(read_config_key(section, "absent", count).is_ok());
    REQUIRE(count == 7);
}

// =============================================================================
// LogConfig Tests
// =============================================================================

TEST_CASE("LogConfig: defaults and overrides", "[core][log]") {
    SECTION("empty section keeps defaults") {
        auto config = LogConfig::from_json(nlohmann::json::object());
        REQUIRE(config.is_ok());
        REQUIRE(config.value().console_enabled);
        REQUIRE_FALSE(config.value().file_enabled);
        REQUIRE(config.value().level == spdlog::level::info);
    }

    SECTION("level and files") {
        nlohmann::json j = {{"level", "warn"}, {"file", true}, {"directory", "logs"}, {"max_files", 2}};
        auto config = LogConfig::from_json(j);
        REQUIRE(config.is_ok());
        REQUIRE(config.value().level == spdlog::level::warn);
        REQUIRE(config.value().file_enabled);
        REQUIRE(config.value().log_directory == "logs");
        REQUIRE(config.value().max_files == 2);
    }

    SECTION("unknown level") {
        auto config = LogConfig::from_json({{"level", "loud"}});
        REQUIRE(config.is_err());
    }

    SECTION("file logging needs a directory") {
        auto config = LogConfig::from_json({{"file", true}});
        REQUIRE(config.is_err());
    }
}

TEST_CASE("Log levels: parse and name", "[core][log]") {
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
}

TEST_CASE("Named loggers are shared", "[core][log]") {
    auto a = get_logger("keel_test_logger");
    auto b = get_logger("keel_test_logger");
    REQUIRE(a == b);
    REQUIRE(media_logger()->name() == "keel_media");
    REQUIRE(document_logger()->name() == "keel_document");
}

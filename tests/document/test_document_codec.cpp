/// @file test_document_codec.cpp
/// @brief Tests for keel_document DocumentCodec

#include <catch2/catch_test_macros.hpp>
#include <keel/document/document_codec.hpp>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace keel_document;

namespace {

struct Preferences {
    std::string player;
    int volume = 0;
    std::vector<std::string> recent;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Preferences, player, volume, recent)

/// Port number whose conversions validate the range
struct Port {
    int number = 0;
};

void to_json(nlohmann::json& j, const Port& port) {
    if (port.number <= 0) {
        throw std::out_of_range("port must be positive");
    }
    j = port.number;
}

void from_json(const nlohmann::json& j, Port& port) {
    port.number = j.get<int>();
    if (port.number > 65535) {
        throw std::invalid_argument("port above 65535");
    }
}

} // anonymous namespace

TEST_CASE("DocumentCodec: wraps the value in content", "[document][codec]") {
    auto text = DocumentCodec<int>::serialize(5, "n.json");
    REQUIRE(text.is_ok());

    auto j = nlohmann::json::parse(text.value());
    REQUIRE(j.size() == 1);
    REQUIRE(j["content"] == 5);
    REQUIRE(text.value().find("\n    \"content\"") != std::string::npos);
}

TEST_CASE("DocumentCodec: records", "[document][codec]") {
    Preferences prefs{"ada", 7, {"a.mp3", "b.ogg"}};

    auto text = DocumentCodec<Preferences>::serialize(prefs, "prefs.json");
    REQUIRE(text.is_ok());

    auto decoded = DocumentCodec<Preferences>::deserialize(text.value(), "prefs.json");
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.value().player == "ada");
    REQUIRE(decoded.value().volume == 7);
    REQUIRE(decoded.value().recent == std::vector<std::string>{"a.mp3", "b.ogg"});
}

TEST_CASE("DocumentCodec: decode failures", "[document][codec]") {
    SECTION("malformed text") {
        auto decoded = DocumentCodec<int>::deserialize("{\"content\": ", "n.json");
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.error().code() == keel_core::ErrorCode::ParseError);
        REQUIRE(decoded.error().message().rfind("Failed to decode 'n.json': ", 0) == 0);
    }

    SECTION("missing content field") {
        auto decoded = DocumentCodec<int>::deserialize("{\"value\": 1}", "n.json");
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.error().message() == "Failed to decode 'n.json': missing 'content' field");
    }

    SECTION("wrong content type") {
        auto decoded = DocumentCodec<std::map<std::string, int>>::deserialize("{\"content\": [1, 2]}", "m.json");
        REQUIRE(decoded.is_err());
    }

    SECTION("not an object") {
        REQUIRE(DocumentCodec<int>::deserialize("[1]", "n.json").is_err());
    }
}

TEST_CASE("DocumentCodec: invalid UTF-8 cannot be encoded", "[document][codec]") {
    auto text = DocumentCodec<std::string>::serialize(std::string("\xff\xfe"), "s.json");
    REQUIRE(text.is_err());
    REQUIRE(text.error().code() == keel_core::ErrorCode::InvalidArgument);
}

TEST_CASE("DocumentCodec: exceptions from user conversions", "[document][codec]") {
    SECTION("from_json") {
        auto decoded = DocumentCodec<Port>::deserialize("{\"content\": 70000}", "port.json");
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.error().code() == keel_core::ErrorCode::ParseError);
        REQUIRE(decoded.error().message() == "Failed to decode 'port.json': port above 65535");
    }

    SECTION("to_json") {
        auto text = DocumentCodec<Port>::serialize(Port{0}, "port.json");
        REQUIRE(text.is_err());
        REQUIRE(text.error().code() == keel_core::ErrorCode::InvalidArgument);
        REQUIRE(text.error().message() == "Failed to encode 'port.json': port must be positive");
    }

    SECTION("valid value") {
        auto decoded = DocumentCodec<Port>::deserialize("{\"content\": 8080}", "port.json");
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value().number == 8080);
    }
}

/// @file test_curl_transport.cpp
/// @brief Tests for the libcurl transport over file:// URLs

#include <catch2/catch_test_macros.hpp>
#include <keel/async/scheduler.hpp>
#include <keel/media/media_loader.hpp>
#include <keel/media/transport.hpp>

#include "audio_fixtures.hpp"

#include <filesystem>
#include <fstream>
#include <thread>

using namespace keel_media;

namespace fs = std::filesystem;

namespace {

keel_async::TaskStatus wait_for_task(keel_async::IoTask<TransportResponse>& task) {
    while (!task.is_completed()) {
        std::this_thread::yield();
    }
    return task.status();
}

} // anonymous namespace

TEST_CASE("TransportConfig: from_json", "[media][transport]") {
    auto config = TransportConfig::from_json({{"request_timeout_ms", 500}, {"verify_ssl", false}});
    REQUIRE(config.is_ok());
    REQUIRE(config.value().request_timeout == std::chrono::milliseconds(500));
    REQUIRE_FALSE(config.value().verify_ssl);
    REQUIRE(config.value().user_agent == "keel/1.0");

    REQUIRE(TransportConfig::from_json({{"connect_timeout_ms", -1}}).is_err());
    REQUIRE(TransportConfig::from_json({{"user_agent", 3}}).is_err());
}

TEST_CASE("describe_failure: names the result", "[media][transport]") {
    REQUIRE(describe_failure(TransportResult::ProtocolError, "HTTP/1.1 500") == "ProtocolError: HTTP/1.1 500");
}

TEST_CASE("CurlTransport: reads file URLs", "[media][transport]") {
    auto path = fs::temp_directory_path() / "keel_transport_test.mp3";
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << "ID3payload";
    }

    auto pool = std::make_shared<keel_async::IoWorkerPool>(1);
    auto transport = create_curl_transport(TransportConfig{}, pool);

    SECTION("existing file") {
        auto task = transport->send({"file://" + path.string(), MediaType::Mpeg});
        REQUIRE(wait_for_task(task) == keel_async::TaskStatus::Succeeded);

        const auto& response = task.result();
        REQUIRE(response.is_success());
        REQUIRE(std::string(response.body.begin(), response.body.end()) == "ID3payload");
    }

    SECTION("missing file") {
        auto task = transport->send({"file://" + path.string() + ".missing", MediaType::Mpeg});
        REQUIRE(wait_for_task(task) == keel_async::TaskStatus::Succeeded);
        REQUIRE(task.result().result == TransportResult::ConnectionError);
        REQUIRE_FALSE(task.result().error.empty());
    }

    SECTION("through a MediaLoader") {
        auto wav_path = fs::temp_directory_path() / "keel_transport_test.wav";
        keel_test::WavShape shape;
        shape.frames = 80;
        auto wav = keel_test::make_wav(shape);
        {
            std::ofstream out(wav_path, std::ios::binary | std::ios::trunc);
            out.write(reinterpret_cast<const char*>(wav.data()), static_cast<std::streamsize>(wav.size()));
        }

        MediaLoader loader({wav_path.string(), false}, transport);
        keel_async::CooperativeScheduler scheduler;
        int finished = 0;

        scheduler.spawn(loader.load([&] { ++finished; }));
        REQUIRE(scheduler.run_until_idle(std::chrono::seconds(10)));
        REQUIRE(finished == 1);
        REQUIRE(loader.handle()->frame_count == 80);
        REQUIRE(loader.handle()->sample_rate == 8000);

        fs::remove(wav_path);
    }

    fs::remove(path);
}

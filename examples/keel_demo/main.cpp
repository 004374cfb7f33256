/// @file main.cpp
/// @brief keel demo
///
/// Keeps a media library in a JSON document, creating it on first run, and
/// loads every audio source it lists through the libcurl transport.

#include <keel/async/scheduler.hpp>
#include <keel/core/config.hpp>
#include <keel/core/log.hpp>
#include <keel/document/document_store.hpp>
#include <keel/io/local_file_system.hpp>
#include <keel/media/media_loader.hpp>

#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

struct DemoOptions {
    std::string config_path;
    std::string library_path = "keel_library.json";
    std::vector<std::string> additions;
    bool debug = false;
    bool help = false;
};

struct DemoConfig {
    keel_core::LogConfig log;
    keel_async::IoConfig io;
    keel_media::TransportConfig transport;
    keel_media::MediaLoadConfig media;
};

void print_usage() {
    std::cout
        << "Usage: keel_demo [options]\n"
        << "  -c, --config <file>    JSON configuration (sections: log, io, transport, media)\n"
        << "  -l, --library <file>   Library document (default: keel_library.json)\n"
        << "  -a, --add <location>   Add a path or http(s) URL to the library\n"
        << "  -d, --debug            Debug logging\n"
        << "  -h, --help             Show this help\n";
}

keel_core::Result<DemoOptions> apply_cli(int argc, char* argv[]) {
    DemoOptions options;
    std::vector<std::string> args(argv + 1, argv + argc);

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if ((arg == "--config" || arg == "-c") && i + 1 < args.size()) {
            options.config_path = args[++i];
        } else if ((arg == "--library" || arg == "-l") && i + 1 < args.size()) {
            options.library_path = args[++i];
        } else if ((arg == "--add" || arg == "-a") && i + 1 < args.size()) {
            options.additions.push_back(args[++i]);
        } else if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else {
            return keel_core::Err<DemoOptions>(keel_core::Error(keel_core::ErrorCode::InvalidArgument,
                "Unknown or incomplete argument: " + arg));
        }
    }

    return keel_core::Ok(std::move(options));
}

keel_core::Result<DemoConfig> load_config(const std::string& path) {
    DemoConfig config;
    if (path.empty()) {
        return keel_core::Ok(std::move(config));
    }

    auto root = keel_core::read_json_file(path);
    if (!root) {
        return keel_core::Err<DemoConfig>(root.error());
    }

    auto log = keel_core::config_section(*root, "log");
    auto io = keel_core::config_section(*root, "io");
    auto transport = keel_core::config_section(*root, "transport");
    auto media = keel_core::config_section(*root, "media");

    if (!log) return keel_core::Err<DemoConfig>(log.error());
    if (!io) return keel_core::Err<DemoConfig>(io.error());
    if (!transport) return keel_core::Err<DemoConfig>(transport.error());
    if (!media) return keel_core::Err<DemoConfig>(media.error());

    auto log_config = keel_core::LogConfig::from_json(*log);
    if (!log_config) return keel_core::Err<DemoConfig>(log_config.error());
    auto io_config = keel_async::IoConfig::from_json(*io);
    if (!io_config) return keel_core::Err<DemoConfig>(io_config.error());
    auto transport_config = keel_media::TransportConfig::from_json(*transport);
    if (!transport_config) return keel_core::Err<DemoConfig>(transport_config.error());
    auto media_config = keel_media::MediaLoadConfig::from_json(*media);
    if (!media_config) return keel_core::Err<DemoConfig>(media_config.error());

    config.log = log_config.value();
    config.io = io_config.value();
    config.transport = transport_config.value();
    config.media = media_config.value();
    return keel_core::Ok(std::move(config));
}

bool is_url(const std::string& location) {
    return location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    keel_core::init_logging();

    auto options = apply_cli(argc, argv);
    if (!options) {
        spdlog::error("Failed to parse command line: {}", options.error().message());
        print_usage();
        return 1;
    }
    if (options->help) {
        print_usage();
        return 0;
    }

    auto config = load_config(options->config_path);
    if (!config) {
        spdlog::error("Failed to load configuration: {}", keel_core::build_error_chain(config.error()));
        return 1;
    }
    if (options->debug) {
        config->log.level = spdlog::level::debug;
    }
    keel_core::configure_logging(config->log);

    if (auto result = keel_io::configure_default_io(config->io); !result) {
        spdlog::error("Failed to start I/O workers: {}", result.error().message());
        return 1;
    }

    auto transport = keel_media::create_curl_transport(config->transport, keel_io::default_io_pool());
    keel_async::CooperativeScheduler scheduler;

    // Library document
    keel_document::DocumentStore<std::vector<keel_media::MediaSource>> library(options->library_path);

    bool library_ready = false;
    scheduler.spawn(library.load_or_init(
        [&] { library_ready = true; },
        [](const std::string& message) { spdlog::error("Library unavailable: {}", message); }));
    scheduler.run_until_idle();

    if (!library_ready) {
        keel_core::shutdown_logging();
        return 1;
    }
    spdlog::info("Library {} lists {} sources", library.location(), library.value().size());

    if (!options->additions.empty()) {
        for (const auto& location : options->additions) {
            library.value().push_back(keel_media::MediaSource{location, is_url(location)});
        }
        scheduler.spawn(library.save(
            [&] { spdlog::info("Saved {} sources to {}", library.value().size(), library.location()); },
            [](const std::string& message) { spdlog::error("Failed to save library: {}", message); }));
        scheduler.run_until_idle();
    }

    // Media
    std::vector<std::unique_ptr<keel_media::MediaLoader>> loaders;
    for (const auto& source : library.value()) {
        loaders.push_back(std::make_unique<keel_media::MediaLoader>(source, transport, config->media));
    }

    std::size_t loaded = 0;
    for (auto& loader : loaders) {
        auto* current = loader.get();
        scheduler.spawn(current->load(
            [current, &loaded] {
                const auto& clip = *current->handle();
                ++loaded;
                spdlog::info("Loaded {} ({}, {} bytes, {:.2f}s)", current->location(),
                    keel_media::media_type_name(clip.type), clip.data.size(), clip.duration());
            },
            [current](keel_media::TransportResult result, const std::string& message) {
                spdlog::warn("Could not load {}: {} ({})", current->location(), message,
                    keel_media::transport_result_name(result));
            }));
    }

    if (!scheduler.run_until_idle()) {
        scheduler.abandon_all();
    }

    spdlog::info("Loaded {}/{} media sources", loaded, loaders.size());
    spdlog::debug("{}", keel_core::debug::error_stats_summary());

    keel_core::shutdown_logging();
    return loaded == loaders.size() ? 0 : 2;
}

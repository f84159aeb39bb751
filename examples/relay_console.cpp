#include "relay/bot/command.hpp"
#include "relay/bot/replies.hpp"
#include "relay/core/config.hpp"
#include "relay/events/components.hpp"
#include "relay/events/event_bus.hpp"
#include "relay/events/event_queue.hpp"
#include "relay/media/local_media_source.hpp"
#include "relay/media/ytdlp_extractor.hpp"
#include "relay/storage/local_storage.hpp"
#include "relay/transfer/dispatcher.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace fs = std::filesystem;

namespace {

std::mutex output_mutex;

void print_message(const std::string& prefix, const std::string& text) {
    std::lock_guard lock(output_mutex);
    if (prefix.empty()) {
        std::cout << text << "\n" << std::flush;
    } else {
        std::cout << "[" << prefix << "] " << text << "\n" << std::flush;
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-c config.json] [-e .env]\n"
              << "Reads commands from stdin, one per line (/help for the list).\n";
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    relay::ConfigSources sources;
    sources.environment = relay::process_environment();
    if (fs::exists(".env")) {
        sources.env_file = fs::path(".env");
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            sources.json_file = fs::path(argv[++i]);
        } else if ((arg == "-e" || arg == "--env") && i + 1 < argc) {
            sources.env_file = fs::path(argv[++i]);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    auto loaded = relay::load_config(sources);
    if (loaded.is_error()) {
        spdlog::critical("{}", relay::describe(loaded.error()));
        return 1;
    }
    const relay::Config config = loaded.value();
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    if (auto valid = relay::validate(config); valid.is_error()) {
        spdlog::critical("{}", relay::describe(valid.error()));
        return 1;
    }
    auto key_file = relay::materialize_service_account(config);
    if (key_file.is_error()) {
        spdlog::critical("{}", relay::describe(key_file.error()));
        return 1;
    }

    relay::events::EventBus event_bus;
    relay::events::LoggerComponent logger(event_bus);
    relay::events::MetricsComponent metrics(event_bus);

    relay::media::LocalMediaSource direct_source;
    relay::media::YtDlpExtractor extractor(config.ytdlp_path, config.ffmpeg_location);
    relay::storage::LocalStorageClient storage(config.storage_root);

    relay::transfer::PipelineOptions options;
    options.staging_root = config.staging_root;
    options.quality_ceiling = config.quality_ceiling;
    options.progress.cooldown = config.progress_cooldown;
    options.emit_interval = config.progress_tick;
    options.chunk_size = config.upload_chunk_size;
    options.title_max_length = config.title_max_length;
    options.default_folder = config.drive_folder_id;

    // Results are printed from one thread so replies never interleave
    relay::events::ThreadSafeQueue<relay::transfer::TransferResult> results;
    std::thread printer([&results] {
        while (auto result = results.pop()) {
            print_message(result->request_id, relay::bot::format_result(*result));
        }
    });

    spdlog::info("Relay ready: storage={} staging={} workers={}",
                 config.storage_root.string(), config.staging_root.string(), config.worker_threads);

    {
        relay::transfer::TransferDispatcher dispatcher(
            relay::transfer::Capabilities{direct_source, extractor, storage},
            options, config.worker_threads, &event_bus);

        std::uint64_t next_id = 0;
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            const auto command = relay::bot::parse_command(line);
            switch (command.kind) {
                case relay::bot::CommandKind::Start:
                    print_message("", relay::bot::welcome_text());
                    continue;
                case relay::bot::CommandKind::Help:
                    print_message("", relay::bot::help_text());
                    continue;
                case relay::bot::CommandKind::Unknown:
                    print_message("", relay::bot::unknown_command_text());
                    continue;
                default:
                    break;
            }

            auto request = relay::bot::to_request(command);
            if (!request) {
                continue;
            }
            const std::string id = "req-" + std::to_string(++next_id);
            request->request_id = id;
            print_message(id, relay::bot::downloading_text());
            dispatcher.submit(
                std::move(*request),
                [id](const std::string& text) {
                    print_message(id, text);
                    return relay::Ok();
                },
                [&results](const relay::transfer::TransferResult& result) { results.push(result); });
        }

        dispatcher.wait();
    }

    results.shutdown();
    printer.join();

    metrics.print_stats();
    return 0;
}

#pragma once

#include "relay/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace relay {

/**
 * @brief Process-wide settings, resolved once at startup
 *
 * Layers, lowest precedence first: built-in defaults, JSON file, .env file,
 * process environment. Every value is trimmed before it is interpreted.
 */
struct Config {
    // Chat platform credentials
    std::int64_t app_id = 0;
    std::string api_hash;
    std::string bot_token;

    // Storage credentials and destination
    std::string service_account_json;
    std::filesystem::path service_account_file = "sa.json";
    std::optional<std::string> drive_folder_id;
    std::filesystem::path storage_root = "relay_storage";

    // Pipeline
    std::filesystem::path staging_root = std::filesystem::temp_directory_path();
    std::string ytdlp_path = "yt-dlp";
    std::optional<std::string> ffmpeg_location;
    int quality_ceiling = 1080;
    std::chrono::milliseconds progress_cooldown{3000};
    std::chrono::milliseconds progress_tick{1000};
    std::size_t upload_chunk_size = 8 * 1024 * 1024;
    std::size_t title_max_length = 60;
    std::size_t worker_threads = 4;

    std::string log_level = "info";
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

struct ConfigSources {
    std::optional<std::filesystem::path> json_file;
    std::optional<std::filesystem::path> env_file;
    EnvLookup environment;
};

/// Reads variables from the real process environment.
EnvLookup process_environment();

/// Parses KEY=VALUE lines; blank lines and '#' comments are skipped.
Result<std::map<std::string, std::string>> read_env_file(const std::filesystem::path& path);

Result<Config> load_config(const ConfigSources& sources);

/// Fails with ConfigurationError listing every missing required key.
Result<void> validate(const Config& config);

/**
 * @brief Ensures the storage service-account key exists on disk
 *
 * Writes the inline SA_JSON value to service_account_file when the file is
 * absent. Returns the path of the key file.
 */
Result<std::filesystem::path> materialize_service_account(const Config& config);

} // namespace relay

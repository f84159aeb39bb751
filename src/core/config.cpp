#include "relay/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace relay {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2) {
        const char first = value.front();
        const char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

Result<long long> parse_integer(const std::string& key, const std::string& text) {
    try {
        std::size_t consumed = 0;
        const long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            return Fail<long long>(ErrorKind::Configuration, key + " must be an integer, got '" + text + "'");
        }
        return Ok(value);
    } catch (const std::exception&) {
        return Fail<long long>(ErrorKind::Configuration, key + " must be an integer, got '" + text + "'");
    }
}

Result<std::size_t> parse_positive(const std::string& key, const std::string& text) {
    auto parsed = parse_integer(key, text);
    if (parsed.is_error()) {
        return Err<std::size_t>(parsed.error());
    }
    if (parsed.value() <= 0) {
        return Fail<std::size_t>(ErrorKind::Configuration, key + " must be positive");
    }
    return Ok(static_cast<std::size_t>(parsed.value()));
}

using Setter = std::function<Result<void>(Config&, const std::string&)>;

struct ConfigKey {
    const char* env_name;
    const char* json_key;
    Setter apply;
};

const std::vector<ConfigKey>& config_keys() {
    static const std::vector<ConfigKey> keys {
        {"APP_ID", "app_id", [](Config& c, const std::string& v) -> Result<void> {
            auto parsed = parse_integer("APP_ID", v);
            if (parsed.is_error()) {
                return Err<void>(parsed.error());
            }
            c.app_id = parsed.value();
            return Ok();
        }},
        {"API_HASH", "api_hash", [](Config& c, const std::string& v) -> Result<void> {
            c.api_hash = v;
            return Ok();
        }},
        {"BOT_TOKEN", "bot_token", [](Config& c, const std::string& v) -> Result<void> {
            c.bot_token = v;
            return Ok();
        }},
        {"SA_JSON", "sa_json", [](Config& c, const std::string& v) -> Result<void> {
            c.service_account_json = v;
            return Ok();
        }},
        {"SERVICE_ACCOUNT_FILE", "service_account_file", [](Config& c, const std::string& v) -> Result<void> {
            if (!v.empty()) {
                c.service_account_file = v;
            }
            return Ok();
        }},
        {"DRIVE_FOLDER_ID", "drive_folder_id", [](Config& c, const std::string& v) -> Result<void> {
            c.drive_folder_id = v.empty() ? std::nullopt : std::optional<std::string>(v);
            return Ok();
        }},
        {"STORAGE_ROOT", "storage_root", [](Config& c, const std::string& v) -> Result<void> {
            if (!v.empty()) {
                c.storage_root = v;
            }
            return Ok();
        }},
        {"STAGING_ROOT", "staging_root", [](Config& c, const std::string& v) -> Result<void> {
            if (!v.empty()) {
                c.staging_root = v;
            }
            return Ok();
        }},
        {"YTDLP_PATH", "ytdlp_path", [](Config& c, const std::string& v) -> Result<void> {
            if (!v.empty()) {
                c.ytdlp_path = v;
            }
            return Ok();
        }},
        {"FFMPEG_LOCATION", "ffmpeg_location", [](Config& c, const std::string& v) -> Result<void> {
            c.ffmpeg_location = v.empty() ? std::nullopt : std::optional<std::string>(v);
            return Ok();
        }},
        {"QUALITY_CEILING", "quality_ceiling", [](Config& c, const std::string& v) -> Result<void> {
            auto parsed = parse_positive("QUALITY_CEILING", v);
            if (parsed.is_error()) {
                return Err<void>(parsed.error());
            }
            c.quality_ceiling = static_cast<int>(parsed.value());
            return Ok();
        }},
        {"PROGRESS_COOLDOWN_MS", "progress_cooldown_ms", [](Config& c, const std::string& v) -> Result<void> {
            auto parsed = parse_positive("PROGRESS_COOLDOWN_MS", v);
            if (parsed.is_error()) {
                return Err<void>(parsed.error());
            }
            c.progress_cooldown = std::chrono::milliseconds(parsed.value());
            return Ok();
        }},
        {"PROGRESS_TICK_MS", "progress_tick_ms", [](Config& c, const std::string& v) -> Result<void> {
            auto parsed = parse_positive("PROGRESS_TICK_MS", v);
            if (parsed.is_error()) {
                return Err<void>(parsed.error());
            }
            c.progress_tick = std::chrono::milliseconds(parsed.value());
            return Ok();
        }},
        {"UPLOAD_CHUNK_SIZE", "upload_chunk_size", [](Config& c, const std::string& v) -> Result<void> {
            auto parsed = parse_positive("UPLOAD_CHUNK_SIZE", v);
            if (parsed.is_error()) {
                return Err<void>(parsed.error());
            }
            c.upload_chunk_size = parsed.value();
            return Ok();
        }},
        {"TITLE_MAX_LENGTH", "title_max_length", [](Config& c, const std::string& v) -> Result<void> {
            auto parsed = parse_positive("TITLE_MAX_LENGTH", v);
            if (parsed.is_error()) {
                return Err<void>(parsed.error());
            }
            c.title_max_length = parsed.value();
            return Ok();
        }},
        {"WORKER_THREADS", "worker_threads", [](Config& c, const std::string& v) -> Result<void> {
            auto parsed = parse_positive("WORKER_THREADS", v);
            if (parsed.is_error()) {
                return Err<void>(parsed.error());
            }
            c.worker_threads = parsed.value();
            return Ok();
        }},
        {"LOG_LEVEL", "log_level", [](Config& c, const std::string& v) -> Result<void> {
            if (v.empty()) {
                return Ok();
            }
            // spdlog maps unknown names to "off", which would silence every log line
            if (v != "off" && spdlog::level::from_str(v) == spdlog::level::off) {
                return Fail<void>(ErrorKind::Configuration, "LOG_LEVEL must be one of trace, debug, info, "
                                                            "warn, error, critical or off, got '" + v + "'");
            }
            c.log_level = v;
            return Ok();
        }},
    };
    return keys;
}

Result<void> apply_json_file(Config& config, const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<void>(Error{ErrorKind::Configuration, "Cannot open config file: " + path.string()});
    }

    json document = json::parse(input, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return Err<void>(Error{ErrorKind::Configuration, "Config file is not a JSON object: " + path.string()});
    }

    for (const auto& key : config_keys()) {
        if (!document.contains(key.json_key)) {
            continue;
        }
        const auto& node = document.at(key.json_key);
        std::string text;
        if (node.is_string()) {
            text = node.get<std::string>();
        } else if (node.is_object()) {
            // An inline service-account key may be embedded as an object
            text = node.dump();
        } else if (node.is_null()) {
            continue;
        } else {
            text = node.dump();
        }
        if (auto res = key.apply(config, trim(text)); res.is_error()) {
            return res;
        }
    }
    return Ok();
}

Result<void> apply_lookup(Config& config, const EnvLookup& lookup) {
    for (const auto& key : config_keys()) {
        auto value = lookup(key.env_name);
        if (!value) {
            continue;
        }
        if (auto res = key.apply(config, trim(*value)); res.is_error()) {
            return res;
        }
    }
    return Ok();
}

} // namespace

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

Result<std::map<std::string, std::string>> read_env_file(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<std::map<std::string, std::string>>(
            Error{ErrorKind::Configuration, "Cannot open env file: " + path.string()});
    }

    std::map<std::string, std::string> values;
    std::string line;
    while (std::getline(input, line)) {
        const auto text = trim(line);
        if (text.empty() || text.front() == '#') {
            continue;
        }
        const auto separator = text.find('=');
        if (separator == std::string::npos) {
            spdlog::warn("Ignoring malformed line in {}: {}", path.string(), text);
            continue;
        }
        auto key = trim(text.substr(0, separator));
        if (key.rfind("export ", 0) == 0) {
            key = trim(key.substr(7));
        }
        values[key] = unquote(trim(text.substr(separator + 1)));
    }
    return Ok(values);
}

Result<Config> load_config(const ConfigSources& sources) {
    Config config;

    if (sources.json_file) {
        if (auto res = apply_json_file(config, *sources.json_file); res.is_error()) {
            return Err<Config>(res.error());
        }
    }

    if (sources.env_file && fs::exists(*sources.env_file)) {
        auto values = read_env_file(*sources.env_file);
        if (values.is_error()) {
            return Err<Config>(values.error());
        }
        const auto& map = values.value();
        auto lookup = [&map](const std::string& name) -> std::optional<std::string> {
            auto it = map.find(name);
            if (it == map.end()) {
                return std::nullopt;
            }
            return it->second;
        };
        if (auto res = apply_lookup(config, lookup); res.is_error()) {
            return Err<Config>(res.error());
        }
        spdlog::debug("Loaded {} entries from {}", map.size(), sources.env_file->string());
    }

    if (sources.environment) {
        if (auto res = apply_lookup(config, sources.environment); res.is_error()) {
            return Err<Config>(res.error());
        }
    }

    return Ok(config);
}

Result<void> validate(const Config& config) {
    std::vector<std::string> missing;
    if (config.app_id == 0) {
        missing.emplace_back("APP_ID");
    }
    if (config.api_hash.empty()) {
        missing.emplace_back("API_HASH");
    }
    if (config.bot_token.empty()) {
        missing.emplace_back("BOT_TOKEN");
    }

    if (!missing.empty()) {
        std::ostringstream oss;
        oss << "Missing required env vars: ";
        for (std::size_t i = 0; i < missing.size(); ++i) {
            if (i > 0) {
                oss << ", ";
            }
            oss << missing[i];
        }
        return Err<void>(Error{ErrorKind::Configuration, oss.str()});
    }

    if (config.storage_root.empty()) {
        return Err<void>(Error{ErrorKind::Configuration, "STORAGE_ROOT must not be empty"});
    }

    std::error_code ec;
    if (!fs::exists(config.service_account_file, ec) && config.service_account_json.empty()) {
        return Err<void>(Error{ErrorKind::Configuration,
                               "Service-account file " + config.service_account_file.string() +
                                   " not found and SA_JSON is empty"});
    }
    return Ok();
}

Result<fs::path> materialize_service_account(const Config& config) {
    const auto& key_path = config.service_account_file;
    if (fs::exists(key_path)) {
        return Ok(key_path);
    }

    if (config.service_account_json.empty()) {
        return Fail<fs::path>(ErrorKind::Configuration,
                              "Service-account file not found AND SA_JSON env var is empty. "
                              "Provide one of them so the relay can authenticate with storage.");
    }

    json parsed = json::parse(config.service_account_json, nullptr, false);
    if (parsed.is_discarded()) {
        return Fail<fs::path>(ErrorKind::Configuration, "SA_JSON does not contain valid JSON");
    }

    std::error_code ec;
    if (key_path.has_parent_path()) {
        fs::create_directories(key_path.parent_path(), ec);
    }
    std::ofstream out(key_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Fail<fs::path>(ErrorKind::Configuration,
                              "Cannot write service-account key to " + key_path.string());
    }
    out << config.service_account_json;
    out.close();

    const auto resolved = fs::absolute(key_path, ec);
    spdlog::info("Wrote service-account key to {}", ec ? key_path.string() : resolved.string());
    return Ok(key_path);
}

} // namespace relay

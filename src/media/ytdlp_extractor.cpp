#include "relay/media/ytdlp_extractor.hpp"
#include "relay/media/subprocess.hpp"
#include "relay/transfer/quality.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <sstream>
#include <vector>

namespace relay::media {

using json = nlohmann::json;

namespace {

std::string last_line(const std::string& text) {
    std::istringstream stream(text);
    std::string line;
    std::string last;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.find_first_not_of(" \t\r") != std::string::npos) {
            last = line;
        }
    }
    return last;
}

std::string failure_detail(const ProcessOutcome& outcome) {
    auto detail = last_line(outcome.stderr_text);
    if (detail.empty()) {
        detail = last_line(outcome.stdout_text);
    }
    if (detail.empty()) {
        detail = "yt-dlp exited with status " + std::to_string(outcome.exit_code);
    }
    return detail;
}

// yt-dlp prints "NA" (or "None") for fields it does not know
std::optional<double> parse_number(const std::string& field) {
    if (field.empty() || field == "NA" || field == "None") {
        return std::nullopt;
    }
    try {
        std::size_t used = 0;
        const double value = std::stod(field, &used);
        if (used == 0 || !std::isfinite(value) || value < 0) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string string_field(const json& doc, const char* key) {
    const auto it = doc.find(key);
    return it != doc.end() && it->is_string() ? it->get<std::string>() : std::string();
}

std::optional<std::uint64_t> number_field(const json& doc, const char* key) {
    const auto it = doc.find(key);
    if (it == doc.end() || !it->is_number()) {
        return std::nullopt;
    }
    const double value = it->get<double>();
    if (value < 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(value);
}

} // namespace

YtDlpExtractor::YtDlpExtractor(std::string executable, std::optional<std::string> ffmpeg_location)
    : executable_(std::move(executable)), ffmpeg_location_(std::move(ffmpeg_location)) {}

Result<transfer::QualityCatalog> YtDlpExtractor::parse_catalog(const std::string& json_text) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return Fail<transfer::QualityCatalog>(ErrorKind::Acquisition,
                                              std::string("Unreadable extractor metadata: ") + e.what());
    }
    if (!doc.is_object()) {
        return Fail<transfer::QualityCatalog>(ErrorKind::Acquisition, "Extractor metadata is not an object");
    }

    transfer::QualityCatalog catalog;
    catalog.title = string_field(doc, "title");
    if (catalog.title.empty()) {
        catalog.title = "untitled";
    }
    catalog.uploader = string_field(doc, "uploader");
    if (auto it = doc.find("duration"); it != doc.end() && it->is_number()) {
        catalog.duration_seconds = it->get<double>();
    }
    catalog.total_bytes = number_field(doc, "filesize");
    if (!catalog.total_bytes) {
        catalog.total_bytes = number_field(doc, "filesize_approx");
    }

    std::vector<int> heights;
    if (auto it = doc.find("formats"); it != doc.end() && it->is_array()) {
        for (const auto& format : *it) {
            if (!format.is_object()) {
                continue;
            }
            const auto height = format.find("height");
            if (height != format.end() && height->is_number_integer()) {
                heights.push_back(height->get<int>());
            }
        }
    } else if (auto height = doc.find("height"); height != doc.end() && height->is_number_integer()) {
        heights.push_back(height->get<int>());
    }
    catalog.qualities = transfer::rank_qualities(heights);
    return Ok(std::move(catalog));
}

std::optional<ExtractorProgress> YtDlpExtractor::parse_progress_line(const std::string& line) {
    const std::string prefix(kProgressPrefix);
    const auto start = line.find(prefix);
    if (start == std::string::npos) {
        return std::nullopt;
    }

    // downloaded|total|total_estimate|speed|height|filename (filename may contain '|')
    std::vector<std::string> fields;
    std::size_t pos = start + prefix.size();
    for (int i = 0; i < 5; ++i) {
        const auto bar = line.find('|', pos);
        if (bar == std::string::npos) {
            return std::nullopt;
        }
        fields.push_back(line.substr(pos, bar - pos));
        pos = bar + 1;
    }
    fields.push_back(line.substr(pos));

    const auto downloaded = parse_number(fields[0]);
    if (!downloaded) {
        return std::nullopt;
    }

    ExtractorProgress progress;
    progress.downloaded = static_cast<std::uint64_t>(*downloaded);
    if (auto total = parse_number(fields[1])) {
        progress.total = static_cast<std::uint64_t>(*total);
    } else if (auto estimate = parse_number(fields[2])) {
        progress.total = static_cast<std::uint64_t>(*estimate);
    }
    progress.speed = parse_number(fields[3]);
    if (auto height = parse_number(fields[4]); height && *height > 0) {
        progress.height = static_cast<int>(*height);
    }
    if (fields[5] != "NA") {
        progress.filename = fields[5];
    }
    return progress;
}

Result<transfer::QualityCatalog> YtDlpExtractor::resolve_catalog(const std::string& url) {
    const std::vector<std::string> args = {executable_, "-J", "--no-warnings", "--no-playlist", url};

    auto run = run_process(args);
    if (run.is_error()) {
        return Fail<transfer::QualityCatalog>(ErrorKind::Acquisition, run.error());
    }
    const auto& outcome = run.value();
    if (outcome.exit_code != 0) {
        return Fail<transfer::QualityCatalog>(ErrorKind::Acquisition, failure_detail(outcome));
    }

    auto catalog = parse_catalog(outcome.stdout_text);
    if (catalog.is_ok()) {
        spdlog::debug("Resolved '{}' with {} quality rung(s)", catalog.value().title,
                      catalog.value().qualities.size());
    }
    return catalog;
}

Result<std::filesystem::path> YtDlpExtractor::download(const std::string& url,
                                                       const transfer::QualitySelection& selection,
                                                       const std::filesystem::path& dest_dir,
                                                       const ExtractorCallback& on_progress) {
    std::vector<std::string> args = {
        executable_,
        "--no-color",
        "--newline",
        "--no-playlist",
        "--no-warnings",
        "--progress",
        "--no-simulate",
        "-f", selection.selector,
        "-o", (dest_dir / "%(title).200B [%(id)s]%(height& {}p|)s.%(ext)s").string(),
        "--progress-template",
        std::string("download:") + kProgressPrefix +
            "%(progress.downloaded_bytes)s|%(progress.total_bytes)s|"
            "%(progress.total_bytes_estimate)s|%(progress.speed)s|%(info.height)s|%(progress.filename)s",
        "--print", std::string("after_move:") + kFilePrefix + "%(filepath)s",
    };
    if (selection.merge_container) {
        args.push_back("--merge-output-format");
        args.push_back(*selection.merge_container);
    }
    if (ffmpeg_location_) {
        args.push_back("--ffmpeg-location");
        args.push_back(*ffmpeg_location_);
    }
    args.push_back(url);

    std::optional<std::filesystem::path> final_path;
    const std::string file_prefix(kFilePrefix);
    auto run = run_process(args, [&](const std::string& line) {
        if (line.rfind(file_prefix, 0) == 0) {
            final_path = std::filesystem::path(line.substr(file_prefix.size()));
            return true;
        }
        auto progress = parse_progress_line(line);
        if (!progress) {
            return false;
        }
        if (on_progress) {
            on_progress(*progress);
        }
        return true;
    });
    if (run.is_error()) {
        return Fail<std::filesystem::path>(ErrorKind::Acquisition, run.error());
    }
    if (run.value().exit_code != 0) {
        return Fail<std::filesystem::path>(ErrorKind::Acquisition, failure_detail(run.value()));
    }

    // The orchestrator scans the staging directory when no path was printed
    return Ok(final_path.value_or(dest_dir));
}

} // namespace relay::media

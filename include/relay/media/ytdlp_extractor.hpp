#pragma once

#include "relay/media/media_source.hpp"

#include <optional>
#include <string>

namespace relay::media {

/**
 * @brief MediaExtractor backed by the yt-dlp executable
 *
 * Catalog resolution runs `yt-dlp -J`; downloads run with a machine-readable
 * progress template so each stdout line maps to one ExtractorProgress.
 */
class YtDlpExtractor : public MediaExtractor {
public:
    explicit YtDlpExtractor(std::string executable = "yt-dlp",
                            std::optional<std::string> ffmpeg_location = std::nullopt);

    Result<transfer::QualityCatalog> resolve_catalog(const std::string& url) override;

    Result<std::filesystem::path> download(const std::string& url,
                                           const transfer::QualitySelection& selection,
                                           const std::filesystem::path& dest_dir,
                                           const ExtractorCallback& on_progress) override;

    /// Builds a catalog from `yt-dlp -J` output.
    static Result<transfer::QualityCatalog> parse_catalog(const std::string& json_text);

    /// Parses one progress-template line; nullopt for any other output.
    static std::optional<ExtractorProgress> parse_progress_line(const std::string& line);

    static constexpr const char* kProgressPrefix = "[relay-progress]";
    static constexpr const char* kFilePrefix = "[relay-file]";

private:
    std::string executable_;
    std::optional<std::string> ffmpeg_location_;
};

} // namespace relay::media

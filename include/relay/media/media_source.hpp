#pragma once

#include "relay/core/result.hpp"
#include "relay/transfer/types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace relay::media {

/// Cumulative byte count reported while the platform delivers a file.
using ByteCallback = std::function<void(std::uint64_t downloaded)>;

/**
 * @brief Chat-platform download capability for media handed to the bot
 *
 * The returned path is either the downloaded file or a directory holding
 * several variants of the same media (e.g. photo sizes).
 */
class DirectMediaSource {
public:
    virtual ~DirectMediaSource() = default;

    virtual Result<std::filesystem::path> download(const std::string& media_handle,
                                                   const std::filesystem::path& dest_dir,
                                                   const ByteCallback& on_bytes) = 0;
};

struct ExtractorProgress {
    std::uint64_t downloaded = 0;
    std::optional<std::uint64_t> total;
    std::optional<double> speed;
    std::optional<int> height;   ///< Height of the format being fetched, absent for audio
    std::string filename;
};

using ExtractorCallback = std::function<void(const ExtractorProgress&)>;

/**
 * @brief Remote-media extraction capability (metadata and download)
 */
class MediaExtractor {
public:
    virtual ~MediaExtractor() = default;

    virtual Result<transfer::QualityCatalog> resolve_catalog(const std::string& url) = 0;

    virtual Result<std::filesystem::path> download(const std::string& url,
                                                   const transfer::QualitySelection& selection,
                                                   const std::filesystem::path& dest_dir,
                                                   const ExtractorCallback& on_progress) = 0;
};

} // namespace relay::media

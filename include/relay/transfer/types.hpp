#pragma once

#include "relay/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace relay::transfer {

enum class SourceKind {
    Direct,   ///< Bytes handed to the bot by the chat platform
    Remote    ///< URL resolved through the extraction service
};

/**
 * @brief Immutable input of one pipeline run
 */
struct TransferRequest {
    std::string request_id;
    SourceKind kind = SourceKind::Direct;
    std::string locator;                       ///< Media handle or URL
    std::optional<std::string> quality_hint;   ///< Remote only
    std::optional<std::string> folder_hint;    ///< Destination parent folder
    std::optional<std::string> file_name;      ///< Name supplied with direct media
};

/**
 * @brief What the extractor knows about a remote source before downloading
 */
struct QualityCatalog {
    std::string title;
    std::optional<double> duration_seconds;
    std::string uploader;
    std::optional<std::uint64_t> total_bytes;
    std::vector<std::string> qualities;   ///< Rung labels, highest first, unique
};

/**
 * @brief Concrete format choice derived from a quality hint
 */
struct QualitySelection {
    std::string label;                    ///< "best", "audio" or a rung label
    std::string selector;                 ///< Extractor format expression
    std::optional<int> max_height;
    bool audio_only = false;
    std::optional<std::string> merge_container;
};

/**
 * @brief Local copy of the source media, owned by one orchestrator
 */
struct StagedFile {
    std::filesystem::path path;
    std::uint64_t size = 0;
    std::string content_type = "application/octet-stream";
};

/**
 * @brief Acquisition output plus the metadata needed to name the upload
 */
struct AcquiredMedia {
    StagedFile file;
    SourceKind kind = SourceKind::Direct;
    std::string original_name;                 ///< Direct transfers
    std::string title;                         ///< Remote resolutions
    std::optional<std::string> quality_label;  ///< Remote video rung
    bool audio_only = false;
};

enum class ProgressPhase {
    Downloading,
    Uploading
};

/**
 * @brief Subset of progress fields reported by the active stage
 */
struct ProgressUpdate {
    std::optional<ProgressPhase> phase;
    std::optional<std::uint64_t> bytes;
    std::optional<std::uint64_t> total;
    std::optional<double> speed;          ///< Bytes per second
    std::optional<std::string> quality;
};

/**
 * @brief Mutable progress record of one transfer
 */
struct ProgressState {
    ProgressPhase phase = ProgressPhase::Downloading;
    std::uint64_t bytes = 0;
    std::optional<std::uint64_t> total;
    std::optional<double> speed;
    std::optional<std::string> quality;
    std::optional<std::chrono::steady_clock::time_point> last_emitted;
};

enum class TransferState {
    Created,
    Acquiring,
    Staged,
    Uploading,
    Completed,
    Failed
};

/**
 * @brief Terminal value of a pipeline run: a link or a failure
 */
struct TransferResult {
    std::string request_id;
    std::string destination_name;
    std::optional<std::string> link;
    std::optional<Error> failure;
    std::uint64_t bytes = 0;

    bool succeeded() const { return link.has_value() && !failure.has_value(); }

    static TransferResult success(std::string id, std::string name, std::string link, std::uint64_t bytes) {
        TransferResult result;
        result.request_id = std::move(id);
        result.destination_name = std::move(name);
        result.link = std::move(link);
        result.bytes = bytes;
        return result;
    }

    static TransferResult failed(std::string id, Error error) {
        TransferResult result;
        result.request_id = std::move(id);
        result.failure = std::move(error);
        return result;
    }
};

inline const char* to_string(SourceKind kind) {
    return kind == SourceKind::Direct ? "direct" : "remote";
}

inline const char* to_string(ProgressPhase phase) {
    return phase == ProgressPhase::Downloading ? "downloading" : "uploading";
}

inline const char* to_string(TransferState state) {
    switch (state) {
        case TransferState::Created: return "created";
        case TransferState::Acquiring: return "acquiring";
        case TransferState::Staged: return "staged";
        case TransferState::Uploading: return "uploading";
        case TransferState::Completed: return "completed";
        case TransferState::Failed: return "failed";
    }
    return "unknown";
}

} // namespace relay::transfer

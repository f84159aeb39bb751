#pragma once

#include "relay/core/result.hpp"
#include "relay/media/media_source.hpp"
#include "relay/transfer/progress.hpp"
#include "relay/transfer/types.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace relay::transfer {

/**
 * @brief Produces a staged file from one kind of source
 *
 * Implementations write only below `dest_dir` and report bytes to
 * `progress` as they arrive. Failures carry ErrorKind::Acquisition.
 */
class SourceAcquirer {
public:
    virtual ~SourceAcquirer() = default;

    virtual Result<AcquiredMedia> acquire(const std::filesystem::path& dest_dir,
                                          ProgressReporter& progress) = 0;
};

/**
 * @brief Media the requester already handed to the platform
 *
 * When the platform returns several variants, the largest regular file is
 * staged (ties broken by path order).
 */
class DirectAcquirer : public SourceAcquirer {
public:
    DirectAcquirer(media::DirectMediaSource& source,
                   std::string media_handle,
                   std::optional<std::string> file_name);

    Result<AcquiredMedia> acquire(const std::filesystem::path& dest_dir,
                                  ProgressReporter& progress) override;

private:
    media::DirectMediaSource& source_;
    std::string media_handle_;
    std::optional<std::string> file_name_;
};

/**
 * @brief Remote video resolved through quality negotiation
 *
 * 1. resolve the catalog (metadata only)
 * 2. map the hint to a format selector
 * 3. download into `dest_dir`, forwarding extractor progress
 */
class RemoteAcquirer : public SourceAcquirer {
public:
    RemoteAcquirer(media::MediaExtractor& extractor,
                   std::string url,
                   std::optional<std::string> quality_hint,
                   int quality_ceiling);

    Result<AcquiredMedia> acquire(const std::filesystem::path& dest_dir,
                                  ProgressReporter& progress) override;

private:
    media::MediaExtractor& extractor_;
    std::string url_;
    std::optional<std::string> quality_hint_;
    int quality_ceiling_;
};

std::unique_ptr<SourceAcquirer> make_acquirer(const TransferRequest& request,
                                              media::DirectMediaSource& direct,
                                              media::MediaExtractor& extractor,
                                              int quality_ceiling);

/// Largest regular file below `dir`; fails when there is none.
Result<std::filesystem::path> select_largest_file(const std::filesystem::path& dir);

/// Largest finished media file (by container extension) below `dir`.
Result<std::filesystem::path> find_media_output(const std::filesystem::path& dir);

} // namespace relay::transfer

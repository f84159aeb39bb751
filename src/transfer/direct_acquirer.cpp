#include "relay/transfer/acquirer.hpp"
#include "relay/transfer/naming.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace relay::transfer {
namespace fs = std::filesystem;

namespace {

std::string handle_stem(const std::string& handle) {
    std::string stem = fs::path(handle).filename().string();
    if (stem.empty()) {
        stem = handle;
    }
    std::replace_if(stem.begin(), stem.end(),
                    [](char c) { return c == '/' || c == '\\' || c == ':'; }, '_');
    return stem;
}

} // namespace

DirectAcquirer::DirectAcquirer(media::DirectMediaSource& source,
                               std::string media_handle,
                               std::optional<std::string> file_name)
    : source_(source),
      media_handle_(std::move(media_handle)),
      file_name_(std::move(file_name)) {}

Result<AcquiredMedia> DirectAcquirer::acquire(const fs::path& dest_dir, ProgressReporter& progress) {
    spdlog::debug("Direct acquisition of {} into {}", media_handle_, dest_dir.string());

    auto downloaded = source_.download(media_handle_, dest_dir, [&progress](std::uint64_t bytes) {
        ProgressUpdate update;
        update.phase = ProgressPhase::Downloading;
        update.bytes = bytes;
        progress.record(update);
    });
    if (downloaded.is_error()) {
        return Fail<AcquiredMedia>(ErrorKind::Acquisition, downloaded.error().message);
    }

    const fs::path result_path = downloaded.value();
    std::error_code ec;
    if (!fs::exists(result_path, ec)) {
        return Fail<AcquiredMedia>(ErrorKind::Acquisition, "Downloaded media not found: " + result_path.string());
    }

    const bool container = fs::is_directory(result_path, ec);
    fs::path staged_path = result_path;
    if (container) {
        auto largest = select_largest_file(result_path);
        if (largest.is_error()) {
            return Err<AcquiredMedia>(largest.error());
        }
        staged_path = largest.value();
    }

    AcquiredMedia media;
    media.kind = SourceKind::Direct;
    media.file.path = staged_path;
    media.file.size = fs::file_size(staged_path, ec);
    if (ec) {
        return Fail<AcquiredMedia>(ErrorKind::Acquisition, "Cannot stat staged file: " + ec.message());
    }

    if (file_name_ && !file_name_->empty()) {
        media.original_name = *file_name_;
    } else if (container) {
        const auto ext = staged_path.extension().string();
        media.original_name = "photo_" + handle_stem(media_handle_) + (ext.empty() ? ".jpg" : ext);
    } else {
        media.original_name = staged_path.filename().string();
    }
    media.file.content_type = guess_mime_type(media.original_name);

    ProgressUpdate done;
    done.phase = ProgressPhase::Downloading;
    done.bytes = media.file.size;
    done.total = media.file.size;
    progress.record(done);

    spdlog::info("Staged {} ({} bytes)", staged_path.filename().string(), media.file.size);
    return Ok(media);
}

Result<fs::path> select_largest_file(const fs::path& dir) {
    std::vector<std::pair<std::uint64_t, fs::path>> candidates;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }
        const auto size = it->file_size(entry_ec);
        if (!entry_ec) {
            candidates.emplace_back(size, it->path());
        }
    }
    if (ec) {
        return Fail<fs::path>(ErrorKind::Acquisition, "Cannot list " + dir.string() + ": " + ec.message());
    }
    if (candidates.empty()) {
        return Fail<fs::path>(ErrorKind::Acquisition, "Downloaded container is empty: " + dir.string());
    }

    const auto best = std::min_element(candidates.begin(), candidates.end(),
                                       [](const auto& lhs, const auto& rhs) {
                                           if (lhs.first != rhs.first) {
                                               return lhs.first > rhs.first;
                                           }
                                           return lhs.second < rhs.second;
                                       });
    return Ok(best->second);
}

std::unique_ptr<SourceAcquirer> make_acquirer(const TransferRequest& request,
                                              media::DirectMediaSource& direct,
                                              media::MediaExtractor& extractor,
                                              int quality_ceiling) {
    if (request.kind == SourceKind::Remote) {
        return std::make_unique<RemoteAcquirer>(extractor, request.locator, request.quality_hint, quality_ceiling);
    }
    return std::make_unique<DirectAcquirer>(direct, request.locator, request.file_name);
}

} // namespace relay::transfer

#include "relay/transfer/acquirer.hpp"
#include "relay/transfer/naming.hpp"
#include "relay/transfer/quality.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace relay::transfer {
namespace fs = std::filesystem;

namespace {

bool is_media_container(const fs::path& path) {
    static const std::unordered_set<std::string> extensions {
        ".mp4", ".mkv", ".webm", ".mov", ".m4v",
        ".m4a", ".mp3", ".opus", ".ogg", ".aac", ".flac", ".wav",
    };
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extensions.count(ext) > 0;
}

// Rung hint from a file name, ignoring any rung words inside the video title
std::optional<std::string> filename_rung(const std::string& path, const std::string& title) {
    std::string name = fs::path(path).filename().string();
    if (!title.empty() && name.compare(0, title.size(), title) == 0) {
        name.erase(0, title.size());
    }
    return infer_rung(name);
}

std::optional<std::string> reported_rung(const media::ExtractorProgress& event, const std::string& title) {
    if (event.height) {
        if (auto rung = rung_for_height(*event.height)) {
            return rung->label;
        }
        return std::nullopt;
    }
    return filename_rung(event.filename, title);
}

} // namespace

RemoteAcquirer::RemoteAcquirer(media::MediaExtractor& extractor,
                               std::string url,
                               std::optional<std::string> quality_hint,
                               int quality_ceiling)
    : extractor_(extractor),
      url_(std::move(url)),
      quality_hint_(std::move(quality_hint)),
      quality_ceiling_(quality_ceiling) {}

Result<AcquiredMedia> RemoteAcquirer::acquire(const fs::path& dest_dir, ProgressReporter& progress) {
    std::string scheme = url_.substr(0, url_.find("://") + 3);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != "http://" && scheme != "https://") {
        return Fail<AcquiredMedia>(ErrorKind::Acquisition, "Unsupported URL: " + url_);
    }

    auto catalog = extractor_.resolve_catalog(url_);
    if (catalog.is_error()) {
        return Fail<AcquiredMedia>(ErrorKind::Acquisition, catalog.error().message);
    }

    const auto selection = resolve_quality(quality_hint_, catalog.value(), quality_ceiling_);
    spdlog::info("Resolved '{}' for \"{}\": {} -> {}",
                 quality_hint_.value_or("best"), catalog.value().title, selection.label, selection.selector);

    ProgressUpdate initial;
    initial.phase = ProgressPhase::Downloading;
    initial.total = catalog.value().total_bytes;
    if (selection.label != "best") {
        initial.quality = selection.label;
    }
    progress.record(initial);

    const bool audio_only = selection.audio_only;
    const std::string& title = catalog.value().title;
    std::optional<std::string> observed_rung;
    auto downloaded = extractor_.download(url_, selection, dest_dir,
        [&progress, &observed_rung, &title, audio_only](const media::ExtractorProgress& event) {
            ProgressUpdate update;
            update.phase = ProgressPhase::Downloading;
            update.bytes = event.downloaded;
            update.total = event.total;
            update.speed = event.speed;
            if (!audio_only) {
                update.quality = reported_rung(event, title);
                if (update.quality) {
                    observed_rung = update.quality;
                }
            }
            progress.record(update);
        });
    if (downloaded.is_error()) {
        return Fail<AcquiredMedia>(ErrorKind::Acquisition, downloaded.error().message);
    }

    fs::path output = downloaded.value();
    std::error_code ec;
    if (!fs::is_regular_file(output, ec) || !is_media_container(output)) {
        auto found = find_media_output(dest_dir);
        if (found.is_error()) {
            return Err<AcquiredMedia>(found.error());
        }
        output = found.value();
    }

    AcquiredMedia media;
    media.kind = SourceKind::Remote;
    media.title = catalog.value().title;
    media.audio_only = audio_only;
    media.file.path = output;
    media.file.size = fs::file_size(output, ec);
    if (ec) {
        return Fail<AcquiredMedia>(ErrorKind::Acquisition, "Cannot stat downloaded file: " + ec.message());
    }
    media.file.content_type = guess_mime_type(output.filename().string());

    // A named rung was checked against the catalog; "best" relies on what the download reported
    if (!audio_only) {
        if (selection.label != "best") {
            media.quality_label = selection.label;
        } else if (observed_rung) {
            media.quality_label = observed_rung;
        } else {
            media.quality_label = filename_rung(output.string(), title);
        }
    }

    ProgressUpdate done;
    done.phase = ProgressPhase::Downloading;
    done.bytes = media.file.size;
    done.total = media.file.size;
    progress.record(done);

    spdlog::info("Downloaded {} ({} bytes)", output.filename().string(), media.file.size);
    return Ok(media);
}

Result<fs::path> find_media_output(const fs::path& dir) {
    std::optional<std::pair<std::uint64_t, fs::path>> best;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || !is_media_container(it->path())) {
            continue;
        }
        const auto size = it->file_size(entry_ec);
        if (entry_ec) {
            continue;
        }
        if (!best || size > best->first || (size == best->first && it->path() < best->second)) {
            best = std::make_pair(size, it->path());
        }
    }
    if (!best) {
        return Fail<fs::path>(ErrorKind::Acquisition, "No media file was produced in " + dir.string());
    }
    return Ok(best->second);
}

} // namespace relay::transfer

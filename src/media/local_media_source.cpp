#include "relay/media/local_media_source.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <vector>

namespace relay::media {
namespace fs = std::filesystem;

LocalMediaSource::LocalMediaSource(std::size_t block_size)
    : block_size_(block_size == 0 ? 64 * 1024 : block_size) {}

Result<void> LocalMediaSource::copy_file(const fs::path& from,
                                         const fs::path& to,
                                         std::uint64_t& copied,
                                         const ByteCallback& on_bytes) {
    std::ifstream in(from, std::ios::binary);
    if (!in) {
        return Err<void>(Error{ErrorKind::Acquisition, "Cannot open media: " + from.string()});
    }
    std::ofstream out(to, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Err<void>(Error{ErrorKind::Acquisition, "Cannot write staged copy: " + to.string()});
    }

    std::vector<char> buffer(block_size_);
    while (in.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || in.gcount() > 0) {
        out.write(buffer.data(), in.gcount());
        if (!out) {
            return Err<void>(Error{ErrorKind::Acquisition, "Write failed for " + to.string()});
        }
        copied += static_cast<std::uint64_t>(in.gcount());
        if (on_bytes) {
            on_bytes(copied);
        }
    }
    if (in.bad()) {
        return Err<void>(Error{ErrorKind::Acquisition, "Read failed for " + from.string()});
    }
    return Ok();
}

Result<fs::path> LocalMediaSource::download(const std::string& media_handle,
                                            const fs::path& dest_dir,
                                            const ByteCallback& on_bytes) {
    const fs::path source(media_handle);
    std::error_code ec;
    const auto status = fs::status(source, ec);
    if (ec || !fs::exists(status)) {
        return Fail<fs::path>(ErrorKind::Acquisition, "Media not found: " + media_handle);
    }

    std::uint64_t copied = 0;
    if (fs::is_regular_file(status)) {
        const fs::path target = dest_dir / source.filename();
        if (auto res = copy_file(source, target, copied, on_bytes); res.is_error()) {
            return Err<fs::path>(res.error());
        }
        spdlog::debug("Fetched {} ({} bytes)", media_handle, copied);
        return Ok(target);
    }

    if (!fs::is_directory(status)) {
        return Fail<fs::path>(ErrorKind::Acquisition, "Unsupported media handle: " + media_handle);
    }

    fs::path name = source.filename();
    if (name.empty()) {
        name = source.parent_path().filename();
    }
    const fs::path container = dest_dir / name;
    fs::create_directories(container, ec);
    if (ec) {
        return Fail<fs::path>(ErrorKind::Acquisition, "Cannot create " + container.string() + ": " + ec.message());
    }

    for (fs::recursive_directory_iterator it(source, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        const fs::path relative = fs::relative(it->path(), source, entry_ec);
        if (entry_ec) {
            continue;
        }
        if (it->is_directory(entry_ec)) {
            fs::create_directories(container / relative, entry_ec);
        } else if (it->is_regular_file(entry_ec)) {
            if (auto res = copy_file(it->path(), container / relative, copied, on_bytes); res.is_error()) {
                return Err<fs::path>(res.error());
            }
        }
    }
    if (ec) {
        return Fail<fs::path>(ErrorKind::Acquisition, "Cannot list " + media_handle + ": " + ec.message());
    }
    spdlog::debug("Fetched container {} ({} bytes)", media_handle, copied);
    return Ok(container);
}

} // namespace relay::media

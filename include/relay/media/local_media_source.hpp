#pragma once

#include "relay/media/media_source.hpp"

#include <cstddef>

namespace relay::media {

/**
 * @brief DirectMediaSource that resolves media handles to local paths
 *
 * A file handle is copied into the destination directory; a directory handle
 * is copied as a container of variants into dest_dir/<directory name>/.
 */
class LocalMediaSource : public DirectMediaSource {
public:
    explicit LocalMediaSource(std::size_t block_size = 64 * 1024);

    Result<std::filesystem::path> download(const std::string& media_handle,
                                           const std::filesystem::path& dest_dir,
                                           const ByteCallback& on_bytes) override;

private:
    Result<void> copy_file(const std::filesystem::path& from,
                           const std::filesystem::path& to,
                           std::uint64_t& copied,
                           const ByteCallback& on_bytes);

    std::size_t block_size_;
};

} // namespace relay::media

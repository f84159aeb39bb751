#pragma once

#include "relay/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace relay::storage {

/**
 * @brief Remote object record requested when an upload starts
 */
struct UploadTarget {
    std::string name;
    std::optional<std::string> parent_folder;
    std::string mime_type = "application/octet-stream";
    std::filesystem::path local_path;
};

/**
 * @brief Acknowledgement returned by storage after each chunk
 */
struct ChunkStatus {
    std::uint64_t bytes_so_far = 0;
    bool is_final = false;
    std::optional<std::string> link;   ///< Present once the object is finalized
};

/**
 * @brief One in-flight resumable upload; each call sends the next chunk
 */
class UploadSession {
public:
    virtual ~UploadSession() = default;

    virtual Result<ChunkStatus> next_chunk() = 0;
};

/**
 * @brief Already-authorized storage capability
 */
class StorageClient {
public:
    virtual ~StorageClient() = default;

    virtual Result<std::unique_ptr<UploadSession>> create_resumable_upload(const UploadTarget& target,
                                                                           std::size_t chunk_size) = 0;
};

} // namespace relay::storage

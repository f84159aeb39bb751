#pragma once

#include "relay/storage/storage_client.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace relay::storage {

/**
 * @brief Storage capability backed by a local directory tree
 *
 * Objects land in <root>/<parent folder>/<name>; in-flight uploads are
 * assembled under <root>/.uploads/<upload id>/ and moved into place once
 * the last chunk and the whole-file hash check succeed. Links use the
 * file:// scheme.
 */
class LocalStorageClient : public StorageClient {
public:
    explicit LocalStorageClient(std::filesystem::path root);

    Result<std::unique_ptr<UploadSession>> create_resumable_upload(const UploadTarget& target,
                                                                   std::size_t chunk_size) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
    std::atomic<std::uint64_t> upload_counter_{0};
};

/**
 * @brief One chunked copy from a staged file into the local store
 */
class LocalUploadSession : public UploadSession {
public:
    LocalUploadSession(std::ifstream source,
                       std::uint64_t total_bytes,
                       std::size_t chunk_size,
                       std::filesystem::path partial_path,
                       std::filesystem::path destination_dir,
                       std::string name);

    ~LocalUploadSession() override;

    Result<ChunkStatus> next_chunk() override;

private:
    Result<void> write_chunk(const std::vector<std::uint8_t>& data, const std::string& chunk_hash);
    Result<std::string> finalize();

    std::ifstream source_;
    std::uint64_t total_bytes_;
    std::size_t chunk_size_;
    std::filesystem::path partial_path_;
    std::filesystem::path destination_dir_;
    std::string name_;

    std::uint64_t offset_ = 0;
    std::uint64_t source_hash_;
    bool finalized_ = false;
};

/// 64-bit FNV-1a digest rendered as 16 hex characters.
std::string fnv1a_hex(const std::vector<std::uint8_t>& data);

/// file:// URI with RFC 3986 percent-encoding of the path.
std::string file_uri(const std::filesystem::path& path);

} // namespace relay::storage

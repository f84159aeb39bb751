#pragma once

#include "relay/core/result.hpp"
#include "relay/events/event_bus.hpp"
#include "relay/storage/storage_client.hpp"
#include "relay/transfer/progress.hpp"
#include "relay/transfer/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relay::transfer {

/**
 * @brief Offsets acknowledged by storage during one upload attempt
 */
class UploadCursor {
public:
    /**
     * @brief Record a cumulative acknowledged offset
     *
     * RETURNS: true if the cursor moved forward, false if it stayed put,
     * UploadError if storage reported a smaller offset than before.
     */
    Result<bool> advance(std::uint64_t offset);

    [[nodiscard]] std::uint64_t position() const noexcept { return position_; }
    [[nodiscard]] const std::vector<std::uint64_t>& acknowledged() const noexcept { return acknowledged_; }

private:
    std::uint64_t position_ = 0;
    std::vector<std::uint64_t> acknowledged_;
};

/**
 * @brief Drives a chunked upload and returns the shareable link
 *
 * Chunks are never retried here: the first failing chunk ends the upload
 * with UploadError.
 */
class ResumableUploader {
public:
    ResumableUploader(storage::StorageClient& storage,
                      std::size_t chunk_size,
                      events::EventBus* bus = nullptr);

    Result<std::string> upload(const StagedFile& file,
                               const std::string& destination_name,
                               const std::optional<std::string>& folder_hint,
                               ProgressReporter& progress,
                               const std::string& request_id = {});

private:
    storage::StorageClient& storage_;
    std::size_t chunk_size_;
    events::EventBus* bus_;
};

} // namespace relay::transfer

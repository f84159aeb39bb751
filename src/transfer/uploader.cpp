#include "relay/transfer/uploader.hpp"
#include "relay/events/events.hpp"

#include <spdlog/spdlog.h>

namespace relay::transfer {

Result<bool> UploadCursor::advance(std::uint64_t offset) {
    if (offset < position_) {
        return Fail<bool>(ErrorKind::Upload,
                          "Storage acknowledged offset " + std::to_string(offset) +
                          " after " + std::to_string(position_));
    }
    const bool moved = offset > position_ || acknowledged_.empty();
    if (moved) {
        position_ = offset;
        acknowledged_.push_back(offset);
    }
    return Ok(moved);
}

ResumableUploader::ResumableUploader(storage::StorageClient& storage,
                                     std::size_t chunk_size,
                                     events::EventBus* bus)
    : storage_(storage),
      chunk_size_(chunk_size),
      bus_(bus) {}

Result<std::string> ResumableUploader::upload(const StagedFile& file,
                                              const std::string& destination_name,
                                              const std::optional<std::string>& folder_hint,
                                              ProgressReporter& progress,
                                              const std::string& request_id) {
    storage::UploadTarget target;
    target.name = destination_name;
    target.parent_folder = folder_hint;
    target.mime_type = file.content_type;
    target.local_path = file.path;

    auto session = storage_.create_resumable_upload(target, chunk_size_);
    if (session.is_error()) {
        return Fail<std::string>(ErrorKind::Upload, session.error().message);
    }
    spdlog::info("Uploading {} as '{}' ({} bytes, {})",
                 file.path.filename().string(), destination_name, file.size, file.content_type);

    ProgressUpdate start;
    start.phase = ProgressPhase::Uploading;
    start.total = file.size;
    progress.record(start);

    UploadCursor cursor;
    std::uint32_t chunk_index = 0;
    while (true) {
        auto status = session.value()->next_chunk();
        if (status.is_error()) {
            return Fail<std::string>(ErrorKind::Upload, status.error().message);
        }
        const auto& ack = status.value();

        auto moved = cursor.advance(ack.bytes_so_far);
        if (moved.is_error()) {
            return Err<std::string>(moved.error());
        }

        ProgressUpdate update;
        update.phase = ProgressPhase::Uploading;
        update.bytes = ack.bytes_so_far;
        update.total = file.size;
        progress.record(update);

        if (bus_ != nullptr) {
            bus_->emit(events::UploadChunkAckedEvent{request_id, destination_name, chunk_index,
                                                     ack.bytes_so_far, file.size});
        }
        ++chunk_index;

        if (ack.is_final) {
            if (!ack.link || ack.link->empty()) {
                return Fail<std::string>(ErrorKind::Upload,
                                         "Storage finalized '" + destination_name + "' without a shareable link");
            }
            spdlog::debug("Upload of '{}' finalized after {} chunk(s)", destination_name, chunk_index);
            return Ok(*ack.link);
        }

        if (!moved.value()) {
            return Fail<std::string>(ErrorKind::Upload,
                                     "Upload stalled at offset " + std::to_string(cursor.position()));
        }
    }
}

} // namespace relay::transfer

#pragma once

#include "relay/core/result.hpp"
#include "relay/events/event_bus.hpp"
#include "relay/media/media_source.hpp"
#include "relay/storage/storage_client.hpp"
#include "relay/transfer/progress.hpp"
#include "relay/transfer/types.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace relay::transfer {

/**
 * @brief External services the pipeline talks to, injected per process
 */
struct Capabilities {
    media::DirectMediaSource& direct;
    media::MediaExtractor& extractor;
    storage::StorageClient& storage;
};

struct PipelineOptions {
    std::filesystem::path staging_root = std::filesystem::temp_directory_path();
    int quality_ceiling = 1080;
    ProgressOptions progress;
    std::chrono::milliseconds emit_interval{1000};
    std::size_t chunk_size = 8 * 1024 * 1024;
    std::size_t title_max_length = 60;
    std::optional<std::string> default_folder;   ///< Used when the request has no folder hint
};

/**
 * @brief Runs one request through Acquisition -> Staging -> Upload
 *
 * STATE MACHINE:
 * Created -> Acquiring -> Staged -> Uploading -> Completed
 * any non-terminal state -> Failed
 *
 * The staging directory is removed exactly once before run() returns,
 * whichever state the machine stopped in. Per-request errors never escape
 * run(); they become TransferResult failures.
 */
class TransferOrchestrator {
public:
    TransferOrchestrator(TransferRequest request,
                         Capabilities capabilities,
                         PipelineOptions options,
                         ProgressSink sink,
                         events::EventBus* bus = nullptr);

    TransferOrchestrator(const TransferOrchestrator&) = delete;
    TransferOrchestrator& operator=(const TransferOrchestrator&) = delete;

    TransferResult run();

    [[nodiscard]] TransferState state() const noexcept { return state_; }
    [[nodiscard]] const TransferRequest& request() const noexcept { return request_; }
    [[nodiscard]] const ProgressReporter& progress() const noexcept { return progress_; }

private:
    TransferResult execute();
    Result<void> transition_to(TransferState next);
    TransferResult fail(Error error);

    [[nodiscard]] bool can_transition(TransferState target) const noexcept;

    TransferRequest request_;
    Capabilities capabilities_;
    PipelineOptions options_;
    ProgressSink sink_;
    events::EventBus* bus_;

    ProgressReporter progress_;
    TransferState state_ = TransferState::Created;
    std::chrono::steady_clock::time_point started_at_{};
};

} // namespace relay::transfer

#include "relay/transfer/orchestrator.hpp"
#include "relay/events/events.hpp"
#include "relay/transfer/acquirer.hpp"
#include "relay/transfer/naming.hpp"
#include "relay/transfer/staging.hpp"
#include "relay/transfer/ticker.hpp"
#include "relay/transfer/uploader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace relay::transfer {
namespace {

bool is_progressive(TransferState current, TransferState target) {
    static const std::unordered_map<TransferState, std::vector<TransferState>> transitions {
        {TransferState::Created, {TransferState::Acquiring}},
        {TransferState::Acquiring, {TransferState::Staged}},
        {TransferState::Staged, {TransferState::Uploading}},
        {TransferState::Uploading, {TransferState::Completed}},
    };

    if (target == TransferState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

ErrorKind kind_for_state(TransferState state) {
    switch (state) {
        case TransferState::Staged:
        case TransferState::Uploading:
            return ErrorKind::Upload;
        default:
            return ErrorKind::Acquisition;
    }
}

} // namespace

TransferOrchestrator::TransferOrchestrator(TransferRequest request,
                                           Capabilities capabilities,
                                           PipelineOptions options,
                                           ProgressSink sink,
                                           events::EventBus* bus)
    : request_(std::move(request)),
      capabilities_(capabilities),
      options_(std::move(options)),
      sink_(std::move(sink)),
      bus_(bus),
      progress_(options_.progress) {}

TransferResult TransferOrchestrator::run() {
    if (state_ != TransferState::Created) {
        return TransferResult::failed(request_.request_id,
                                      Error{ErrorKind::Acquisition, "Transfer was already run"});
    }
    started_at_ = std::chrono::steady_clock::now();
    if (bus_ != nullptr) {
        bus_->emit(events::TransferStartedEvent{request_.request_id, request_.kind, request_.locator});
    }

    try {
        return execute();
    } catch (const std::exception& e) {
        return fail(Error{kind_for_state(state_), e.what()});
    }
}

TransferResult TransferOrchestrator::execute() {
    auto staging = StagingArea::create(options_.staging_root, request_.request_id);
    if (staging.is_error()) {
        return fail(staging.error());
    }
    // Removes the directory on every return path below
    auto area = std::move(staging.value());

    auto finish = [&area](TransferResult result) {
        auto cleanup = area->destroy();
        if (cleanup.is_error()) {
            spdlog::warn("{}", cleanup.error().message);
        }
        return result;
    };

    if (auto res = transition_to(TransferState::Acquiring); res.is_error()) {
        return finish(fail(res.error()));
    }

    auto acquirer = make_acquirer(request_, capabilities_.direct, capabilities_.extractor,
                                  options_.quality_ceiling);
    auto acquired = [&] {
        PeriodicEmitter emitter(options_.emit_interval, [this] { progress_.maybe_emit(sink_); });
        auto result = acquirer->acquire(area->path(), progress_);
        emitter.stop();
        return result;
    }();
    if (acquired.is_error()) {
        return finish(fail(acquired.error()));
    }

    const auto& media = acquired.value();
    if (bus_ != nullptr) {
        bus_->emit(events::SourceStagedEvent{request_.request_id, media.file.path.filename().string(),
                                             media.file.size});
    }
    if (auto res = transition_to(TransferState::Staged); res.is_error()) {
        return finish(fail(res.error()));
    }

    const std::string name = destination_name(media, options_.title_max_length);
    const auto folder = request_.folder_hint ? request_.folder_hint : options_.default_folder;

    if (auto res = transition_to(TransferState::Uploading); res.is_error()) {
        return finish(fail(res.error()));
    }

    ResumableUploader uploader(capabilities_.storage, options_.chunk_size, bus_);
    auto link = [&] {
        PeriodicEmitter emitter(options_.emit_interval, [this] { progress_.maybe_emit(sink_); });
        auto result = uploader.upload(media.file, name, folder, progress_, request_.request_id);
        emitter.stop();
        return result;
    }();
    if (link.is_error()) {
        return finish(fail(link.error()));
    }

    if (auto res = transition_to(TransferState::Completed); res.is_error()) {
        return finish(fail(res.error()));
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_);
    if (bus_ != nullptr) {
        bus_->emit(events::TransferCompletedEvent{request_.request_id, name, link.value(),
                                                  media.file.size, duration});
    }
    return finish(TransferResult::success(request_.request_id, name, link.value(), media.file.size));
}

Result<void> TransferOrchestrator::transition_to(TransferState next) {
    if (state_ == next) {
        return Ok();
    }
    if (!can_transition(next)) {
        return Err<void>(Error{kind_for_state(state_),
                               std::string("Illegal transfer state transition ") +
                               to_string(state_) + " -> " + to_string(next)});
    }

    const auto previous = state_;
    state_ = next;
    if (bus_ != nullptr) {
        bus_->emit(events::TransferStateChangedEvent{request_.request_id, previous, next});
    }
    return Ok();
}

TransferResult TransferOrchestrator::fail(Error error) {
    const auto failed_in = state_;
    if (can_transition(TransferState::Failed)) {
        state_ = TransferState::Failed;
        if (bus_ != nullptr) {
            bus_->emit(events::TransferStateChangedEvent{request_.request_id, failed_in, state_});
        }
    }
    if (bus_ != nullptr) {
        bus_->emit(events::TransferFailedEvent{request_.request_id, error, failed_in});
    }
    spdlog::debug("Transfer {} failed in state {}: {}", request_.request_id, to_string(failed_in), describe(error));
    return TransferResult::failed(request_.request_id, std::move(error));
}

bool TransferOrchestrator::can_transition(TransferState target) const noexcept {
    if (state_ == target) {
        return true;
    }
    if (state_ == TransferState::Failed || state_ == TransferState::Completed) {
        return false;
    }
    return is_progressive(state_, target);
}

} // namespace relay::transfer

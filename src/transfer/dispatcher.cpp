#include "relay/transfer/dispatcher.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>

namespace relay::transfer {

TransferDispatcher::TransferDispatcher(Capabilities capabilities,
                                       PipelineOptions options,
                                       std::size_t worker_threads,
                                       events::EventBus* bus)
    : capabilities_(capabilities),
      options_(std::move(options)),
      bus_(bus),
      pool_(worker_threads == 0 ? 1 : worker_threads) {}

TransferDispatcher::~TransferDispatcher() {
    wait();
}

std::string TransferDispatcher::submit(TransferRequest request, ProgressSink sink, CompletionHandler on_complete) {
    if (request.request_id.empty()) {
        request.request_id = "transfer-" + std::to_string(++request_counter_);
    }
    const std::string id = request.request_id;

    std::unique_lock lock(lifecycle_mutex_);
    if (joined_) {
        lock.unlock();
        spdlog::error("Rejecting {}: dispatcher already stopped", id);
        if (on_complete) {
            on_complete(TransferResult::failed(id, Error{ErrorKind::Staging, "Relay is shutting down"}));
        }
        return id;
    }

    // Posting under the lock keeps wait() from joining between the check and the post
    ++in_flight_;
    asio::post(pool_, [this, request = std::move(request), sink = std::move(sink),
                       on_complete = std::move(on_complete)]() mutable {
        TransferOrchestrator orchestrator(std::move(request), capabilities_, options_, sink, bus_);
        const TransferResult result = orchestrator.run();
        if (on_complete) {
            try {
                on_complete(result);
            } catch (const std::exception& e) {
                spdlog::error("Completion handler for {} threw: {}", result.request_id, e.what());
            }
        }
        --in_flight_;
    });
    lock.unlock();
    spdlog::debug("Queued {}", id);
    return id;
}

void TransferDispatcher::wait() {
    {
        std::lock_guard lock(lifecycle_mutex_);
        if (joined_) {
            return;
        }
        joined_ = true;
    }
    pool_.join();
}

} // namespace relay::transfer

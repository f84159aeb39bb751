#pragma once

#include "relay/events/event_bus.hpp"
#include "relay/transfer/orchestrator.hpp"
#include "relay/transfer/types.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace relay::transfer {

namespace asio = boost::asio;

using CompletionHandler = std::function<void(const TransferResult&)>;

/**
 * @brief Schedules independent orchestrator runs on a worker pool
 *
 * submit() never blocks the caller; each request gets its own
 * orchestrator, progress reporter and staging area. Results travel back
 * only through the completion handler.
 *
 * Usage:
 * ```cpp
 * TransferDispatcher dispatcher(capabilities, options, 4, &bus);
 * dispatcher.submit(request, sink, [](const TransferResult& r) { ... });
 * dispatcher.wait();
 * ```
 */
class TransferDispatcher {
public:
    TransferDispatcher(Capabilities capabilities,
                       PipelineOptions options,
                       std::size_t worker_threads,
                       events::EventBus* bus = nullptr);

    ~TransferDispatcher();

    TransferDispatcher(const TransferDispatcher&) = delete;
    TransferDispatcher& operator=(const TransferDispatcher&) = delete;

    /**
     * @brief Queue one request
     *
     * RETURNS: the request id (generated when the request has none)
     */
    std::string submit(TransferRequest request, ProgressSink sink, CompletionHandler on_complete);

    /// Blocks until every submitted transfer finished; no submits afterwards.
    void wait();

    [[nodiscard]] std::size_t in_flight() const noexcept { return in_flight_.load(); }

private:
    Capabilities capabilities_;
    PipelineOptions options_;
    events::EventBus* bus_;

    asio::thread_pool pool_;
    std::atomic<std::uint64_t> request_counter_{0};
    std::atomic<std::size_t> in_flight_{0};
    std::mutex lifecycle_mutex_;
    bool joined_ = false;   ///< Guarded by lifecycle_mutex_
};

} // namespace relay::transfer

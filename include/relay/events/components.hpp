/**
 * @file components.hpp
 * @brief Observers that react to pipeline events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Every transfer is now logged and counted.
 */

#pragma once

#include "relay/events/event_bus.hpp"
#include "relay/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace relay::events {

/**
 * @brief Logs every lifecycle event with spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent& e) {
            on_started(e);
        });

        bus_.subscribe<TransferStateChangedEvent>([this](const TransferStateChangedEvent& e) {
            on_state_changed(e);
        });

        bus_.subscribe<SourceStagedEvent>([this](const SourceStagedEvent& e) {
            on_staged(e);
        });

        bus_.subscribe<UploadChunkAckedEvent>([this](const UploadChunkAckedEvent& e) {
            on_chunk_acked(e);
        });

        bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            on_completed(e);
        });

        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent& e) {
            on_failed(e);
        });
    }

private:
    void on_started(const TransferStartedEvent& e) {
        spdlog::info("[TransferStarted] id={} kind={} locator={}",
                     e.request_id, transfer::to_string(e.kind), e.locator);
    }

    void on_state_changed(const TransferStateChangedEvent& e) {
        spdlog::debug("[StateChanged] id={} {} -> {}",
                      e.request_id, transfer::to_string(e.from), transfer::to_string(e.to));
    }

    void on_staged(const SourceStagedEvent& e) {
        spdlog::info("[Staged] id={} file={} bytes={}", e.request_id, e.file_name, e.bytes);
    }

    void on_chunk_acked(const UploadChunkAckedEvent& e) {
        spdlog::debug("[ChunkAcked] id={} name={} chunk={} bytes={}/{}",
                      e.request_id, e.destination_name, e.chunk_index + 1, e.bytes_so_far, e.total_bytes);
    }

    void on_completed(const TransferCompletedEvent& e) {
        spdlog::info("[TransferCompleted] id={} name={} bytes={} duration={}ms link={}",
                     e.request_id, e.destination_name, e.bytes, e.duration.count(), e.link);
    }

    void on_failed(const TransferFailedEvent& e) {
        spdlog::warn("[TransferFailed] id={} state={} {}",
                     e.request_id, transfer::to_string(e.failed_in), describe(e.error));
    }

    EventBus& bus_;
};

/**
 * @brief Counts transfers and bytes for the shutdown summary
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> transfers_started{0};
        std::atomic<uint64_t> transfers_completed{0};
        std::atomic<uint64_t> transfers_failed{0};
        std::atomic<uint64_t> bytes_staged{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> chunks_acked{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent&) {
            stats_.transfers_started++;
        });

        bus_.subscribe<SourceStagedEvent>([this](const SourceStagedEvent& e) {
            stats_.bytes_staged += e.bytes;
        });

        bus_.subscribe<UploadChunkAckedEvent>([this](const UploadChunkAckedEvent&) {
            stats_.chunks_acked++;
        });

        bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            stats_.transfers_completed++;
            stats_.bytes_uploaded += e.bytes;
        });

        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent&) {
            stats_.transfers_failed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Relay Statistics:");
        spdlog::info("  Transfers started:   {}", stats_.transfers_started.load());
        spdlog::info("  Transfers completed: {}", stats_.transfers_completed.load());
        spdlog::info("  Transfers failed:    {}", stats_.transfers_failed.load());
        spdlog::info("  Bytes staged:        {}", stats_.bytes_staged.load());
        spdlog::info("  Bytes uploaded:      {}", stats_.bytes_uploaded.load());
        spdlog::info("  Chunks acknowledged: {}", stats_.chunks_acked.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace relay::events

/**
 * @file events.hpp
 * @brief Lifecycle events published by the transfer pipeline
 *
 * NAMING CONVENTION:
 * Events are past-tense facts: TransferStartedEvent, UploadChunkAckedEvent.
 */

#pragma once

#include "relay/core/error.hpp"
#include "relay/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace relay::events {

// ════════════════════════════════════════════════════════
// Transfer lifecycle
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when an orchestrator accepts a request
 *
 * WHO EMITS: TransferOrchestrator::run()
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct TransferStartedEvent {
    std::string request_id;
    transfer::SourceKind kind;
    std::string locator;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted on every state machine transition
 */
struct TransferStateChangedEvent {
    std::string request_id;
    transfer::TransferState from;
    transfer::TransferState to;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferCompletedEvent {
    std::string request_id;
    std::string destination_name;
    std::string link;
    std::uint64_t bytes;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferFailedEvent {
    std::string request_id;
    Error error;
    transfer::TransferState failed_in;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Stage events
// ════════════════════════════════════════════════════════

struct SourceStagedEvent {
    std::string request_id;
    std::string file_name;
    std::uint64_t bytes;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadChunkAckedEvent {
    std::string request_id;
    std::string destination_name;
    std::uint32_t chunk_index;
    std::uint64_t bytes_so_far;
    std::uint64_t total_bytes;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace relay::events

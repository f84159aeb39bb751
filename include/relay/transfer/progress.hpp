#pragma once

#include "relay/core/result.hpp"
#include "relay/transfer/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace relay::transfer {

/// Delivers one rendered snapshot to the UI (e.g. edits the status message).
using ProgressSink = std::function<Result<void>(const std::string&)>;

using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

struct ProgressOptions {
    std::chrono::milliseconds cooldown{3000};
    std::size_t bar_width = 20;
};

/**
 * @brief Rate-limited, thread-safe progress accumulator for one transfer
 *
 * THREAD SAFETY:
 * - record() may be called from extractor/upload threads while maybe_emit()
 *   runs on the periodic emitter thread
 * - record() only touches in-memory state and never waits on the sink
 *
 * INVARIANTS:
 * - bytes never decrease within a phase
 * - phase moves Downloading -> Uploading at most once, never back
 * - nothing is emitted while zero bytes have been recorded
 */
class ProgressReporter {
public:
    explicit ProgressReporter(ProgressOptions options = {}, SteadyClock clock = {});

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    /**
     * @brief Merge a partial update into the current state
     *
     * RETURNS: false when the update was rejected (phase regression)
     */
    bool record(const ProgressUpdate& update);

    /**
     * @brief Send a snapshot if the cooldown elapsed and the state changed
     *
     * Sink failures are logged and swallowed. RETURNS: true if a snapshot
     * was handed to the sink.
     */
    bool maybe_emit(const ProgressSink& sink);

    [[nodiscard]] ProgressState snapshot() const;
    [[nodiscard]] std::size_t emission_count() const;

private:
    ProgressOptions options_;
    SteadyClock clock_;

    mutable std::mutex mutex_;
    ProgressState state_;
    std::chrono::steady_clock::time_point phase_started_;
    bool dirty_ = false;
    std::size_t emissions_ = 0;
};

// Formatting helpers (base-1024 units)
std::string format_bytes(std::uint64_t bytes);
std::string format_speed(double bytes_per_second);
std::string format_duration(std::chrono::seconds duration);
std::string render_bar(double fraction, std::size_t width);

/// Renders the multi-line status text shown to the user.
std::string render_snapshot(const ProgressState& state, std::size_t bar_width);

} // namespace relay::transfer

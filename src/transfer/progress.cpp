#include "relay/transfer/progress.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace relay::transfer {

ProgressReporter::ProgressReporter(ProgressOptions options, SteadyClock clock)
    : options_(options),
      clock_(clock ? std::move(clock) : SteadyClock([] { return std::chrono::steady_clock::now(); })) {
    phase_started_ = clock_();
}

bool ProgressReporter::record(const ProgressUpdate& update) {
    std::lock_guard lock(mutex_);
    const auto now = clock_();

    if (update.phase && *update.phase != state_.phase) {
        if (state_.phase == ProgressPhase::Uploading) {
            spdlog::debug("Ignoring progress update that moves back to {}", to_string(*update.phase));
            return false;
        }
        state_.phase = ProgressPhase::Uploading;
        state_.bytes = 0;
        state_.total.reset();
        state_.speed.reset();
        phase_started_ = now;
        dirty_ = true;
    }

    bool advanced = false;
    if (update.bytes && *update.bytes > state_.bytes) {
        state_.bytes = *update.bytes;
        advanced = true;
        dirty_ = true;
    }

    if (update.total && state_.total != update.total) {
        state_.total = update.total;
        dirty_ = true;
    }

    if (update.speed) {
        state_.speed = std::max(0.0, *update.speed);
        dirty_ = true;
    } else if (advanced) {
        const auto elapsed = std::chrono::duration<double>(now - phase_started_).count();
        if (elapsed > 0.0) {
            state_.speed = static_cast<double>(state_.bytes) / elapsed;
        }
    }

    if (update.quality && state_.quality != update.quality) {
        state_.quality = update.quality;
        dirty_ = true;
    }
    return true;
}

bool ProgressReporter::maybe_emit(const ProgressSink& sink) {
    std::string text;
    {
        std::lock_guard lock(mutex_);
        if (state_.bytes == 0 || !dirty_) {
            return false;
        }
        const auto now = clock_();
        if (state_.last_emitted && now - *state_.last_emitted < options_.cooldown) {
            return false;
        }
        text = render_snapshot(state_, options_.bar_width);
        state_.last_emitted = now;
        dirty_ = false;
        ++emissions_;
    }

    if (!sink) {
        return true;
    }

    try {
        auto result = sink(text);
        if (result.is_error()) {
            spdlog::debug("Progress sink rejected update: {}", result.error().message);
        }
    } catch (const std::exception& e) {
        spdlog::debug("Progress sink threw: {}", e.what());
    }
    return true;
}

ProgressState ProgressReporter::snapshot() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::size_t ProgressReporter::emission_count() const {
    std::lock_guard lock(mutex_);
    return emissions_;
}

std::string format_bytes(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit < 3) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << ' ' << units[unit];
    return oss.str();
}

std::string format_speed(double bytes_per_second) {
    const auto rounded = static_cast<std::uint64_t>(std::llround(std::max(0.0, bytes_per_second)));
    return format_bytes(rounded) + "/s";
}

std::string format_duration(std::chrono::seconds duration) {
    const auto total = std::max<long long>(0, duration.count());
    const auto hours = total / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto seconds = total % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << "h " << std::setw(2) << std::setfill('0') << minutes << 'm';
    } else if (minutes > 0) {
        oss << minutes << "m " << std::setw(2) << std::setfill('0') << seconds << 's';
    } else {
        oss << seconds << 's';
    }
    return oss.str();
}

std::string render_bar(double fraction, std::size_t width) {
    const double clamped = std::clamp(fraction, 0.0, 1.0);
    const auto filled = static_cast<std::size_t>(clamped * static_cast<double>(width));
    std::string bar = "[";
    for (std::size_t i = 0; i < width; ++i) {
        bar += i < filled ? "█" : "░";
    }
    bar += "]";
    return bar;
}

std::string render_snapshot(const ProgressState& state, std::size_t bar_width) {
    std::ostringstream oss;
    if (state.phase == ProgressPhase::Downloading) {
        oss << "⬇️ Downloading";
    } else {
        oss << "⬆️ Uploading";
    }
    if (state.quality) {
        oss << " (" << *state.quality << ')';
    }
    oss << '\n';

    const bool total_known = state.total && *state.total > 0;
    if (total_known) {
        const double fraction = std::min(1.0, static_cast<double>(state.bytes) / static_cast<double>(*state.total));
        oss << render_bar(fraction, bar_width) << ' '
            << std::fixed << std::setprecision(1) << fraction * 100.0 << "%\n";
        oss << format_bytes(state.bytes) << " / " << format_bytes(*state.total);
    } else {
        oss << format_bytes(state.bytes)
            << (state.phase == ProgressPhase::Downloading ? " downloaded" : " uploaded");
    }

    if (state.speed && *state.speed > 0.0) {
        oss << "\nSpeed: " << format_speed(*state.speed);
        if (total_known && *state.total >= state.bytes) {
            const auto remaining = static_cast<double>(*state.total - state.bytes);
            const auto eta = std::chrono::seconds(static_cast<long long>(std::ceil(remaining / *state.speed)));
            oss << " | ETA: " << format_duration(eta);
        }
    }
    return oss.str();
}

} // namespace relay::transfer

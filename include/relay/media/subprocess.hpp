#pragma once

#include "relay/core/result.hpp"

#include <functional>
#include <string>
#include <vector>

namespace relay::media {

struct ProcessOutcome {
    int exit_code = -1;
    std::string stdout_text;   ///< Only lines not consumed by the line callback
    std::string stderr_text;
};

/// Receives each stdout line; returns true when the line was consumed.
using LineCallback = std::function<bool(const std::string& line)>;

/**
 * @brief Runs a program with an argument vector, no shell involved
 *
 * stdout is split into lines as it arrives so long-running tools can report
 * progress. Fails only when the process cannot be started.
 */
Result<ProcessOutcome, std::string> run_process(const std::vector<std::string>& argv,
                                                const LineCallback& on_line = nullptr);

} // namespace relay::media

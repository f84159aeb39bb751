#pragma once

#include "relay/transfer/types.hpp"

#include <optional>
#include <string>

namespace relay::bot {

enum class CommandKind {
    Start,
    Help,
    Video,    ///< /yt, /video or a bare URL
    File,     ///< /file: media already handed to the bot
    Unknown
};

struct Command {
    CommandKind kind = CommandKind::Unknown;
    std::string argument;                  ///< URL or media handle
    std::optional<std::string> option;     ///< Quality hint or file name
};

/**
 * @brief Parses one chat message
 *
 * FORMS:
 * - /start, /help
 * - /yt <url> [quality] and /video <url> [quality]
 * - /file <handle> [name...]
 * - a bare http(s) URL, treated as /yt <url>
 *
 * A "@botname" suffix on the command word is ignored. Commands missing
 * their argument parse as Unknown.
 */
Command parse_command(const std::string& text);

/// Builds the pipeline request for Video and File commands; nullopt otherwise.
std::optional<transfer::TransferRequest> to_request(const Command& command,
                                                    const std::optional<std::string>& folder = std::nullopt);

const char* to_string(CommandKind kind);

} // namespace relay::bot

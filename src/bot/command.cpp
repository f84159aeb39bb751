#include "relay/bot/command.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace relay::bot {

namespace {

std::vector<std::string> split_words(const std::string& text) {
    std::istringstream stream(text);
    std::vector<std::string> words;
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_url(const std::string& word) {
    const auto lower = to_lower(word);
    return lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0;
}

// Everything after the first `skip` words, with original spacing collapsed
std::string join_from(const std::vector<std::string>& words, std::size_t skip) {
    std::string out;
    for (std::size_t i = skip; i < words.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += words[i];
    }
    return out;
}

} // namespace

Command parse_command(const std::string& text) {
    const auto words = split_words(text);
    Command command;
    if (words.empty()) {
        return command;
    }

    const std::string& head = words.front();
    if (head.front() != '/') {
        if (is_url(head)) {
            command.kind = CommandKind::Video;
            command.argument = head;
            if (words.size() > 1) {
                command.option = words[1];
            }
        }
        return command;
    }

    const auto at = head.find('@');
    const std::string name = to_lower(head.substr(1, at == std::string::npos ? at : at - 1));
    if (name == "start") {
        command.kind = CommandKind::Start;
    } else if (name == "help") {
        command.kind = CommandKind::Help;
    } else if (name == "yt" || name == "video") {
        if (words.size() < 2) {
            return command;
        }
        command.kind = CommandKind::Video;
        command.argument = words[1];
        if (words.size() > 2) {
            command.option = words[2];
        }
    } else if (name == "file") {
        if (words.size() < 2) {
            return command;
        }
        command.kind = CommandKind::File;
        command.argument = words[1];
        if (words.size() > 2) {
            command.option = join_from(words, 2);
        }
    }
    return command;
}

std::optional<transfer::TransferRequest> to_request(const Command& command,
                                                    const std::optional<std::string>& folder) {
    transfer::TransferRequest request;
    request.locator = command.argument;
    request.folder_hint = folder;

    switch (command.kind) {
        case CommandKind::Video:
            request.kind = transfer::SourceKind::Remote;
            request.quality_hint = command.option;
            return request;
        case CommandKind::File:
            request.kind = transfer::SourceKind::Direct;
            request.file_name = command.option;
            return request;
        default:
            return std::nullopt;
    }
}

const char* to_string(CommandKind kind) {
    switch (kind) {
        case CommandKind::Start: return "start";
        case CommandKind::Help: return "help";
        case CommandKind::Video: return "video";
        case CommandKind::File: return "file";
        case CommandKind::Unknown: return "unknown";
    }
    return "unknown";
}

} // namespace relay::bot

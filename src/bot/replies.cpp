#include "relay/bot/replies.hpp"

namespace relay::bot {

std::string welcome_text() {
    return "👋 Hi! Send me any document / photo / audio / video and I'll upload it "
           "to cloud storage and send you a link back.\n"
           "Send a video URL (or /yt <url> [quality]) to fetch it first.";
}

std::string help_text() {
    return "Commands:\n"
           "/yt <url> [quality] - download a video and upload it\n"
           "    quality: best (default), audio, 2160p/4K, 1440p/2K, 1080p, 720p, 480p, 360p\n"
           "/file <path> [name] - upload media you already have\n"
           "/help - show this message";
}

std::string downloading_text() {
    return "⬇️ Downloading…";
}

std::string unknown_command_text() {
    return "🤔 Unknown command. Try /help";
}

std::string format_result(const transfer::TransferResult& result) {
    if (result.succeeded()) {
        return "✅ Uploaded!\n" + result.destination_name + "\n" + *result.link;
    }
    if (result.failure) {
        return "❌ Error: " + describe(*result.failure);
    }
    return "❌ Error: transfer finished without a link";
}

} // namespace relay::bot

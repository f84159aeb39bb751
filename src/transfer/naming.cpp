#include "relay/transfer/naming.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace relay::transfer {
namespace {

std::string lower_extension(const std::string& file_name) {
    std::string ext = std::filesystem::path(file_name).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

std::string guess_mime_type(const std::string& file_name) {
    static const std::unordered_map<std::string, std::string> types {
        {".mp4", "video/mp4"},
        {".m4v", "video/mp4"},
        {".mkv", "video/x-matroska"},
        {".webm", "video/webm"},
        {".mov", "video/quicktime"},
        {".avi", "video/x-msvideo"},
        {".mp3", "audio/mpeg"},
        {".m4a", "audio/mp4"},
        {".aac", "audio/aac"},
        {".ogg", "audio/ogg"},
        {".opus", "audio/ogg"},
        {".flac", "audio/flac"},
        {".wav", "audio/x-wav"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".txt", "text/plain"},
        {".json", "application/json"},
        {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    };
    auto it = types.find(lower_extension(file_name));
    return it != types.end() ? it->second : "application/octet-stream";
}

std::string sanitize_title(const std::string& title, std::size_t max_length) {
    static const std::string reserved = "/\\:*?\"<>|";

    std::string clean;
    clean.reserve(title.size());
    for (char c : title) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte == 0x7f || reserved.find(c) != std::string::npos) {
            clean.push_back('_');
        } else {
            clean.push_back(c);
        }
    }

    const auto start = clean.find_first_not_of(" .");
    if (start == std::string::npos) {
        return "untitled";
    }
    const auto end = clean.find_last_not_of(" .");
    clean = clean.substr(start, end - start + 1);

    if (clean.size() <= max_length) {
        return clean;
    }

    std::size_t cut = max_length;
    while (cut > 0 && (static_cast<unsigned char>(clean[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    std::string prefix = clean.substr(0, cut);
    while (!prefix.empty() && prefix.back() == ' ') {
        prefix.pop_back();
    }
    return prefix + "...";
}

std::string destination_name(const AcquiredMedia& media, std::size_t title_max_length) {
    if (media.kind == SourceKind::Direct) {
        if (!media.original_name.empty()) {
            return media.original_name;
        }
        return media.file.path.filename().string();
    }

    std::string name = sanitize_title(media.title, title_max_length);
    if (!media.audio_only && media.quality_label) {
        name += " [" + *media.quality_label + "]";
    }
    name += media.file.path.extension().string();
    return name;
}

} // namespace relay::transfer

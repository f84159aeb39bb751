#include "relay/storage/local_storage.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace relay::storage {
namespace fs = std::filesystem;

namespace {

constexpr std::uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
constexpr std::uint64_t kFnvPrime = 0x100000001b3ULL;

std::uint64_t fnv1a_update(std::uint64_t hash, const std::uint8_t* data, std::size_t size) {
    for (std::size_t i = 0; i < size; ++i) {
        hash ^= static_cast<std::uint64_t>(data[i]);
        hash *= kFnvPrime;
    }
    return hash;
}

std::string to_hex(std::uint64_t hash) {
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(hash) * 2) << std::setfill('0') << hash;
    return oss.str();
}

std::string hash_file(const fs::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return {};
    }
    std::uint64_t hash = kFnvOffset;
    char buffer[4096];
    while (stream.read(buffer, sizeof(buffer)) || stream.gcount() > 0) {
        hash = fnv1a_update(hash, reinterpret_cast<const std::uint8_t*>(buffer),
                            static_cast<std::size_t>(stream.gcount()));
    }
    return to_hex(hash);
}

std::string safe_component(const std::string& text) {
    std::string out;
    for (char c : text) {
        out.push_back((c == '/' || c == '\\' || c == '\0') ? '_' : c);
    }
    if (out.empty() || out == "." || out == "..") {
        return "_";
    }
    return out;
}

// Links the finished object under the first free name. Linking fails on an
// existing name, so concurrent uploads can never claim the same object.
Result<fs::path> claim_destination(const fs::path& partial, const fs::path& dir, const std::string& name) {
    const fs::path as_path(name);
    const std::string stem = as_path.stem().string();
    const std::string ext = as_path.extension().string();
    for (int n = 0;; ++n) {
        const fs::path candidate = n == 0 ? dir / name : dir / (stem + " (" + std::to_string(n) + ")" + ext);
        std::error_code ec;
        fs::create_hard_link(partial, candidate, ec);
        if (!ec) {
            return Ok(candidate);
        }
        if (ec != std::errc::file_exists) {
            return Fail<fs::path>(ErrorKind::Upload,
                                  "Failed to move object into place: " + candidate.string() + ": " + ec.message());
        }
    }
}

} // namespace

std::string fnv1a_hex(const std::vector<std::uint8_t>& data) {
    return to_hex(fnv1a_update(kFnvOffset, data.data(), data.size()));
}

std::string file_uri(const fs::path& path) {
    static const char* hex = "0123456789ABCDEF";
    std::string uri = "file://";
    for (unsigned char c : path.generic_string()) {
        if (std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' || c == '~') {
            uri.push_back(static_cast<char>(c));
        } else {
            uri.push_back('%');
            uri.push_back(hex[c >> 4]);
            uri.push_back(hex[c & 0x0F]);
        }
    }
    return uri;
}

LocalStorageClient::LocalStorageClient(fs::path root) : root_(std::move(root)) {}

Result<std::unique_ptr<UploadSession>> LocalStorageClient::create_resumable_upload(const UploadTarget& target,
                                                                                   std::size_t chunk_size) {
    using SessionPtr = std::unique_ptr<UploadSession>;
    if (chunk_size == 0) {
        return Fail<SessionPtr>(ErrorKind::Upload, "chunk_size must be > 0");
    }
    if (target.name.empty()) {
        return Fail<SessionPtr>(ErrorKind::Upload, "Object name must not be empty");
    }

    std::error_code ec;
    const auto total = fs::file_size(target.local_path, ec);
    if (ec) {
        return Fail<SessionPtr>(ErrorKind::Upload, "Cannot stat " + target.local_path.string() + ": " + ec.message());
    }
    std::ifstream source(target.local_path, std::ios::binary);
    if (!source) {
        return Fail<SessionPtr>(ErrorKind::Upload, "Failed to open source file: " + target.local_path.string());
    }

    fs::path destination_dir = root_;
    if (target.parent_folder && !target.parent_folder->empty()) {
        destination_dir /= safe_component(*target.parent_folder);
    }

    const auto upload_id = "upload-" + std::to_string(++upload_counter_) + "-" +
                           std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    const fs::path partial_dir = root_ / ".uploads" / upload_id;
    fs::create_directories(partial_dir, ec);
    if (ec) {
        return Fail<SessionPtr>(ErrorKind::Upload, "Failed to create directory: " + partial_dir.string());
    }
    fs::create_directories(destination_dir, ec);
    if (ec) {
        return Fail<SessionPtr>(ErrorKind::Upload, "Failed to create directory: " + destination_dir.string());
    }

    const fs::path partial_path = partial_dir / safe_component(target.name);
    {
        std::ofstream create(partial_path, std::ios::binary | std::ios::trunc);
        if (!create) {
            return Fail<SessionPtr>(ErrorKind::Upload, "Failed to create partial object: " + partial_path.string());
        }
    }

    spdlog::debug("Opened local upload {} for '{}' ({} bytes, {})", upload_id, target.name, total, target.mime_type);
    return Ok(SessionPtr(new LocalUploadSession(std::move(source), total, chunk_size, partial_path,
                                                destination_dir, safe_component(target.name))));
}

LocalUploadSession::LocalUploadSession(std::ifstream source,
                                       std::uint64_t total_bytes,
                                       std::size_t chunk_size,
                                       fs::path partial_path,
                                       fs::path destination_dir,
                                       std::string name)
    : source_(std::move(source)),
      total_bytes_(total_bytes),
      chunk_size_(chunk_size),
      partial_path_(std::move(partial_path)),
      destination_dir_(std::move(destination_dir)),
      name_(std::move(name)),
      source_hash_(kFnvOffset) {}

LocalUploadSession::~LocalUploadSession() {
    // Abandoned uploads leave nothing behind
    std::error_code ec;
    fs::remove_all(partial_path_.parent_path(), ec);
}

Result<ChunkStatus> LocalUploadSession::next_chunk() {
    if (finalized_) {
        return Fail<ChunkStatus>(ErrorKind::Upload, "Upload of '" + name_ + "' is already finalized");
    }

    std::vector<std::uint8_t> buffer(chunk_size_);
    source_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(chunk_size_));
    const auto bytes_read = static_cast<std::size_t>(source_.gcount());
    if (source_.bad()) {
        return Fail<ChunkStatus>(ErrorKind::Upload, "Read error on staged file for '" + name_ + "'");
    }
    buffer.resize(bytes_read);

    if (!buffer.empty()) {
        const auto chunk_hash = fnv1a_update(kFnvOffset, buffer.data(), buffer.size());
        if (auto res = write_chunk(buffer, to_hex(chunk_hash)); res.is_error()) {
            return Err<ChunkStatus>(res.error());
        }
        source_hash_ = fnv1a_update(source_hash_, buffer.data(), buffer.size());
        offset_ += buffer.size();
    }

    ChunkStatus status;
    status.bytes_so_far = offset_;

    if (offset_ >= total_bytes_ || buffer.empty()) {
        if (offset_ != total_bytes_) {
            return Fail<ChunkStatus>(ErrorKind::Upload,
                                     "Staged file for '" + name_ + "' changed size during upload");
        }
        auto link = finalize();
        if (link.is_error()) {
            return Err<ChunkStatus>(link.error());
        }
        status.is_final = true;
        status.link = link.value();
    }
    return Ok(status);
}

// Writes the chunk at the current offset, then reads it back and checks it
// against the hash taken when the chunk left the staged file.
Result<void> LocalUploadSession::write_chunk(const std::vector<std::uint8_t>& data, const std::string& chunk_hash) {
    std::fstream file(partial_path_, std::ios::in | std::ios::out | std::ios::binary);
    if (!file) {
        return Err<void>(Error{ErrorKind::Upload, "Failed to open partial object: " + partial_path_.string()});
    }

    file.seekp(static_cast<std::streamoff>(offset_));
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
        return Err<void>(Error{ErrorKind::Upload, "Failed to write chunk for " + name_});
    }

    std::vector<std::uint8_t> stored(data.size());
    file.seekg(static_cast<std::streamoff>(offset_));
    file.read(reinterpret_cast<char*>(stored.data()), static_cast<std::streamsize>(stored.size()));
    if (static_cast<std::size_t>(file.gcount()) != stored.size() || fnv1a_hex(stored) != chunk_hash) {
        return Err<void>(Error{ErrorKind::Upload,
                               "Chunk hash mismatch for " + name_ + " at offset " + std::to_string(offset_)});
    }
    return Ok();
}

Result<std::string> LocalUploadSession::finalize() {
    if (to_hex(source_hash_) != hash_file(partial_path_)) {
        return Fail<std::string>(ErrorKind::Upload, "Final hash mismatch for " + name_);
    }

    auto claimed = claim_destination(partial_path_, destination_dir_, name_);
    if (claimed.is_error()) {
        return Err<std::string>(claimed.error());
    }
    const fs::path destination = claimed.value();
    std::error_code ec;
    fs::remove(partial_path_, ec);
    finalized_ = true;

    const auto absolute = fs::absolute(destination, ec);
    spdlog::debug("Stored '{}' at {}", name_, destination.string());
    return Ok(file_uri(ec ? destination : absolute));
}

} // namespace relay::storage

#include "relay/transfer/staging.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <random>
#include <sstream>

namespace relay::transfer {
namespace fs = std::filesystem;

namespace {

std::string sanitize_component(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        const bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                          (c >= '0' && c <= '9') || c == '-' || c == '_';
        out.push_back(safe ? c : '_');
    }
    return out.empty() ? std::string("transfer") : out;
}

std::string unique_suffix() {
    static std::atomic<std::uint64_t> counter{0};
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << counter.fetch_add(1) << '-' << (rng() & 0xffffffULL);
    return oss.str();
}

} // namespace

Result<std::unique_ptr<StagingArea>> StagingArea::create(const fs::path& root, const std::string& request_id) {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec || !fs::is_directory(root)) {
        return Fail<std::unique_ptr<StagingArea>>(
            ErrorKind::Staging, "Staging root is unusable: " + root.string() + (ec ? " (" + ec.message() + ")" : ""));
    }

    for (int attempt = 0; attempt < 8; ++attempt) {
        const fs::path candidate = root / ("relay-" + sanitize_component(request_id) + "-" + unique_suffix());
        if (fs::create_directory(candidate, ec)) {
            spdlog::debug("Created staging area {}", candidate.string());
            return Ok(std::unique_ptr<StagingArea>(new StagingArea(candidate)));
        }
        if (ec) {
            return Fail<std::unique_ptr<StagingArea>>(
                ErrorKind::Staging, "Failed to create staging directory " + candidate.string() + ": " + ec.message());
        }
    }
    return Fail<std::unique_ptr<StagingArea>>(ErrorKind::Staging, "Could not allocate a unique staging directory");
}

StagingArea::StagingArea(fs::path path) : path_(std::move(path)) {}

StagingArea::~StagingArea() {
    auto result = destroy();
    if (result.is_error()) {
        spdlog::warn("{}", result.error().message);
    }
}

Result<void> StagingArea::destroy() {
    if (destroyed_) {
        return Ok();
    }
    destroyed_ = true;

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        return Err<void>(Error{ErrorKind::Staging, "Failed to remove staging area " + path_.string() + ": " + ec.message()});
    }
    spdlog::debug("Removed staging area {}", path_.string());
    return Ok();
}

} // namespace relay::transfer

#pragma once

#include "relay/core/result.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace relay::transfer {

/**
 * @brief Exclusively owned temporary directory of one transfer
 *
 * The directory and everything written into it (partial downloads, merge
 * leftovers) is removed recursively exactly once: by destroy() or, failing
 * that, by the destructor.
 */
class StagingArea {
public:
    static Result<std::unique_ptr<StagingArea>> create(const std::filesystem::path& root,
                                                       const std::string& request_id);

    ~StagingArea();

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool destroyed() const noexcept { return destroyed_; }

    /// Removes the directory tree. Later calls are no-ops.
    Result<void> destroy();

private:
    explicit StagingArea(std::filesystem::path path);

    std::filesystem::path path_;
    bool destroyed_ = false;
};

} // namespace relay::transfer

#pragma once

#include "relay/transfer/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace relay::transfer {

struct QualityRung {
    int height;
    std::string label;   ///< Canonical label, e.g. "2160p"
    std::string alias;   ///< Marketing name, e.g. "4K" (may be empty)
};

/// Fixed rung table, highest first.
const std::vector<QualityRung>& quality_rungs();

/// Highest rung whose height does not exceed `height`; nullopt below 360p.
std::optional<QualityRung> rung_for_height(int height);

/// Maps raw format heights to unique rung labels ordered highest first.
std::vector<std::string> rank_qualities(const std::vector<int>& heights);

/**
 * @brief Resolve a user hint to a concrete extractor format selector
 *
 * PRECEDENCE:
 * - "audio"            -> best audio-only stream
 * - named rung         -> exact rung if offered, else next lower offered rung
 * - "best"/unknown     -> best video capped at `ceiling` + best audio
 */
QualitySelection resolve_quality(const std::optional<std::string>& hint,
                                 const QualityCatalog& catalog,
                                 int ceiling);

/// First rung token found in a file name, e.g. "clip.1080p.mp4" -> "1080p".
std::optional<std::string> infer_rung(const std::string& filename);

} // namespace relay::transfer

#include "relay/transfer/quality.hpp"

#include <algorithm>
#include <cctype>

namespace relay::transfer {
namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string normalize_hint(const std::optional<std::string>& hint) {
    if (!hint) {
        return "best";
    }
    std::string text = lowercase(*hint);
    const auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "best";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    text = text.substr(start, end - start + 1);

    if (!text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        text += "p";
    }
    return text;
}

std::optional<QualityRung> find_rung(const std::string& normalized) {
    for (const auto& rung : quality_rungs()) {
        if (normalized == lowercase(rung.label) || (!rung.alias.empty() && normalized == lowercase(rung.alias))) {
            return rung;
        }
    }
    return std::nullopt;
}

std::optional<QualityRung> rung_by_label(const std::string& label) {
    for (const auto& rung : quality_rungs()) {
        if (rung.label == label) {
            return rung;
        }
    }
    return std::nullopt;
}

// Token must not touch other letters or digits, so ids like "x4kq" do not match
bool contains_token(const std::string& text, const std::string& token) {
    for (auto pos = text.find(token); pos != std::string::npos; pos = text.find(token, pos + 1)) {
        const auto end = pos + token.size();
        const bool left = pos == 0 || !std::isalnum(static_cast<unsigned char>(text[pos - 1]));
        const bool right = end == text.size() || !std::isalnum(static_cast<unsigned char>(text[end]));
        if (left && right) {
            return true;
        }
    }
    return false;
}

std::string video_selector(int max_height) {
    const std::string cap = "[height<=" + std::to_string(max_height) + "]";
    return "bestvideo" + cap + "+bestaudio/best" + cap + "/best";
}

QualitySelection best_selection(const QualityCatalog& catalog, int ceiling) {
    QualitySelection selection;
    selection.label = "best";
    selection.max_height = ceiling;
    selection.selector = video_selector(ceiling);
    selection.merge_container = "mp4";
    for (const auto& label : catalog.qualities) {
        auto rung = rung_by_label(label);
        if (rung && rung->height <= ceiling) {
            selection.label = rung->label;
            break;
        }
    }
    return selection;
}

} // namespace

const std::vector<QualityRung>& quality_rungs() {
    static const std::vector<QualityRung> rungs {
        {2160, "2160p", "4K"},
        {1440, "1440p", "2K"},
        {1080, "1080p", ""},
        {720, "720p", ""},
        {480, "480p", ""},
        {360, "360p", ""},
    };
    return rungs;
}

std::optional<QualityRung> rung_for_height(int height) {
    for (const auto& rung : quality_rungs()) {
        if (height >= rung.height) {
            return rung;
        }
    }
    return std::nullopt;
}

std::vector<std::string> rank_qualities(const std::vector<int>& heights) {
    std::vector<std::string> labels;
    for (const auto& rung : quality_rungs()) {
        const bool offered = std::any_of(heights.begin(), heights.end(), [&rung](int height) {
            auto mapped = rung_for_height(height);
            return mapped && mapped->height == rung.height;
        });
        if (offered) {
            labels.push_back(rung.label);
        }
    }
    return labels;
}

QualitySelection resolve_quality(const std::optional<std::string>& hint,
                                 const QualityCatalog& catalog,
                                 int ceiling) {
    const std::string normalized = normalize_hint(hint);

    if (normalized == "audio") {
        QualitySelection selection;
        selection.label = "audio";
        selection.selector = "bestaudio";
        selection.audio_only = true;
        return selection;
    }

    auto requested = find_rung(normalized);
    if (!requested) {
        return best_selection(catalog, ceiling);
    }

    std::optional<QualityRung> chosen;
    if (catalog.qualities.empty()) {
        chosen = requested;
    } else {
        for (const auto& label : catalog.qualities) {
            auto offered = rung_by_label(label);
            if (offered && offered->height <= requested->height) {
                chosen = offered;
                break;
            }
        }
    }

    if (!chosen) {
        return best_selection(catalog, ceiling);
    }

    QualitySelection selection;
    selection.label = chosen->label;
    selection.max_height = chosen->height;
    selection.selector = video_selector(chosen->height);
    selection.merge_container = "mp4";
    return selection;
}

std::optional<std::string> infer_rung(const std::string& filename) {
    const std::string lower = lowercase(filename);
    for (const auto& rung : quality_rungs()) {
        if (contains_token(lower, lowercase(rung.label)) ||
            (!rung.alias.empty() && contains_token(lower, lowercase(rung.alias)))) {
            return rung.label;
        }
    }
    return std::nullopt;
}

} // namespace relay::transfer

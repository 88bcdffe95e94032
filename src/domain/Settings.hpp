#pragma once

#include <array>
#include <chrono>
#include <cstddef>

#include "domain/Models.hpp"

namespace domain {

struct StalenessThresholds {
    std::chrono::seconds soft{std::chrono::hours(48)};
    std::chrono::seconds hard{std::chrono::hours(24 * 7)};
};

// Per-source freshness windows. Past `soft` a view or level is flagged stale
// but still scored; past `hard` it is ignored by confluence entirely.
class StalenessPolicy {
public:
    StalenessPolicy();

    [[nodiscard]] const StalenessThresholds& thresholds(Source source) const noexcept {
        return thresholds_[static_cast<std::size_t>(source)];
    }

    void set(Source source, StalenessThresholds thresholds) noexcept {
        thresholds_[static_cast<std::size_t>(source)] = thresholds;
    }

private:
    std::array<StalenessThresholds, kAllSources.size()> thresholds_{};
};

inline StalenessPolicy::StalenessPolicy() {
    using std::chrono::hours;
    constexpr auto kDay = hours(24);
    set(Source::KtTechnical, {kDay * 14, kDay * 28});
    set(Source::Discord, {hours(48), kDay * 7});
    set(Source::Macro42, {kDay * 10, kDay * 21});
    set(Source::Substack, {kDay * 10, kDay * 21});
    set(Source::Youtube, {kDay * 7, kDay * 14});
    set(Source::Twitter, {hours(48), kDay * 7});
}

enum class ConfidenceMerge {
    KeepMax,
    KeepMin,
};

struct LevelSettings {
    // Relative price band (fraction of the stored price) inside which two
    // levels of the same (symbol, source, type) are the same level.
    double mergeTolerance{0.015};
    double lowConfidenceFloor{0.5};
    ConfidenceMerge confidenceMerge{ConfidenceMerge::KeepMax};
    std::size_t maxContextLength{200};
};

struct ScoringSettings {
    double biasWeight{0.6};
    double proximityWeight{0.25};
    double recencyWeight{0.15};
    double softStalePenalty{0.5};
    double singleSourceCap{0.39};
    double highThreshold{0.7};
    double mediumThreshold{0.4};
    double lowThreshold{0.15};
};

struct EngineSettings {
    StalenessPolicy staleness;
    LevelSettings levels;
    ScoringSettings scoring;
    // Records observed further than this past the wall clock are rejected.
    std::chrono::seconds maxFutureSkew{std::chrono::hours(24)};
};

}  // namespace domain

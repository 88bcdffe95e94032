#include <chrono>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "core/ConfluenceScorer.hpp"

namespace {

using namespace std::chrono_literals;

const auto kNow = domain::fromEpochMs(1'700'000'000'000LL);

domain::SourceView makeView(domain::Source source, domain::Bias bias, domain::Timestamp at, double confidence = 0.8) {
    domain::SourceView view;
    view.symbol = "SPX";
    view.source = source;
    view.bias = bias;
    view.confidence = confidence;
    view.lastUpdatedAt = at;
    return view;
}

domain::PriceLevel makeLevel(std::uint64_t id, domain::Source source, domain::LevelType type, double price) {
    domain::PriceLevel level;
    level.id = id;
    level.symbol = "SPX";
    level.source = source;
    level.type = type;
    level.price = price;
    level.confidence = 0.8;
    level.createdAt = kNow - 1h;
    level.lastConfirmedAt = kNow - 1h;
    return level;
}

bool near(double lhs, double rhs) { return std::fabs(lhs - rhs) < 1e-9; }

}  // namespace

int main() {
    const core::ConfluenceScorer scorer{core::StalenessEvaluator{domain::StalenessPolicy{}},
                                        domain::ScoringSettings{}, 0.015};

    const std::vector<domain::PriceLevel> proximateSupports{
        makeLevel(1, domain::Source::KtTechnical, domain::LevelType::Support, 5000.0),
        makeLevel(2, domain::Source::Discord, domain::LevelType::Support, 5010.0),
    };

    // Two agreeing fresh sources with nearby levels: high and aligned.
    {
        const std::vector<domain::SourceView> views{
            makeView(domain::Source::KtTechnical, domain::Bias::Bullish, kNow - 2h),
            makeView(domain::Source::Discord, domain::Bias::Bullish, kNow - 1h),
        };
        const auto state = scorer.score("SPX", views, proximateSupports, kNow);
        if (state.classification != domain::Classification::High || !state.aligned) {
            std::cerr << "Expected high aligned confluence, got " << state.score << '\n';
            return 1;
        }
        if (!near(state.score, 1.0) || !near(state.biasAgreement, 1.0) || !near(state.proximityBonus, 1.0)
            || !near(state.recencyFactor, 1.0)) {
            std::cerr << "Unexpected component values\n";
            return 1;
        }
        if (!state.direction || *state.direction != domain::Bias::Bullish) {
            std::cerr << "Expected bullish direction\n";
            return 1;
        }
        if (state.summary != "2/2 sources aligned bullish (kt_technical, discord)") {
            std::cerr << "Unexpected summary: " << state.summary << '\n';
            return 1;
        }

        // Same inputs, same output.
        const auto again = scorer.score("SPX", views, proximateSupports, kNow);
        if (again.score != state.score || again.summary != state.summary
            || again.contributingSources != state.contributingSources) {
            std::cerr << "Scoring is not deterministic\n";
            return 1;
        }
    }

    // Agreement without nearby levels still scores high: 0.6 + 0.15.
    {
        const std::vector<domain::SourceView> views{
            makeView(domain::Source::KtTechnical, domain::Bias::Bullish, kNow - 2h),
            makeView(domain::Source::Discord, domain::Bias::Bullish, kNow - 1h),
        };
        const std::vector<domain::PriceLevel> farApart{
            makeLevel(1, domain::Source::KtTechnical, domain::LevelType::Support, 5000.0),
            makeLevel(2, domain::Source::Discord, domain::LevelType::Support, 5200.0),
            makeLevel(3, domain::Source::Discord, domain::LevelType::Resistance, 5001.0),
        };
        const auto state = scorer.score("SPX", views, farApart, kNow);
        if (!near(state.score, 0.75) || !near(state.proximityBonus, 0.0) || !state.aligned) {
            std::cerr << "Levels of different type or too far apart must not count, got " << state.score << '\n';
            return 1;
        }
    }

    // Opposite biases: low and not aligned.
    {
        const std::vector<domain::SourceView> views{
            makeView(domain::Source::KtTechnical, domain::Bias::Bullish, kNow - 2h),
            makeView(domain::Source::Discord, domain::Bias::Bearish, kNow - 1h),
        };
        const auto state = scorer.score("SPX", views, proximateSupports, kNow);
        if (state.aligned || state.classification != domain::Classification::Low || !near(state.score, 0.15)) {
            std::cerr << "Expected low non-aligned conflict, got " << state.score << '\n';
            return 1;
        }
        if (state.direction) {
            std::cerr << "Conflicting views must not have a direction\n";
            return 1;
        }
        if (state.summary != "CONFLICT: kt_technical bullish vs discord bearish") {
            std::cerr << "Unexpected summary: " << state.summary << '\n';
            return 1;
        }
    }

    // Neutral views never agree with anything.
    {
        const std::vector<domain::SourceView> views{
            makeView(domain::Source::KtTechnical, domain::Bias::Neutral, kNow - 2h),
            makeView(domain::Source::Discord, domain::Bias::Neutral, kNow - 1h),
            makeView(domain::Source::Youtube, domain::Bias::Bullish, kNow - 1h),
        };
        const auto state = scorer.score("SPX", views, {}, kNow);
        if (!near(state.biasAgreement, 0.0) || state.aligned) {
            std::cerr << "Neutral pairs must not count as agreement\n";
            return 1;
        }
        if (state.summary != "Mixed: 1 bullish, 0 bearish, 2 neutral") {
            std::cerr << "Unexpected summary: " << state.summary << '\n';
            return 1;
        }
    }

    // A single source is capped below medium and never aligned.
    {
        const std::vector<domain::SourceView> views{
            makeView(domain::Source::KtTechnical, domain::Bias::Bullish, kNow - 2h, 0.95),
        };
        const auto state = scorer.score("SPX", views, proximateSupports, kNow);
        if (state.aligned || state.score > 0.39 || state.classification != domain::Classification::Low) {
            std::cerr << "Single source must be capped, got " << state.score << '\n';
            return 1;
        }
        if (state.summary != "Single source: kt_technical bullish (no corroboration)") {
            std::cerr << "Unexpected summary: " << state.summary << '\n';
            return 1;
        }

        const std::vector<domain::SourceView> weak{
            makeView(domain::Source::Twitter, domain::Bias::Bearish, kNow - 72h, 0.2),
        };
        const auto stale = scorer.score("SPX", weak, {}, kNow);
        if (!near(stale.score, 0.1) || stale.classification != domain::Classification::None) {
            std::cerr << "Soft-stale single source should be halved, got " << stale.score << '\n';
            return 1;
        }
    }

    // The corroborating view ages past its hard threshold.
    {
        const std::vector<domain::SourceView> views{
            makeView(domain::Source::KtTechnical, domain::Bias::Bullish, kNow - 2h, 0.1),
            makeView(domain::Source::Discord, domain::Bias::Bullish, kNow - 24h * 7 - 1s),
        };
        const auto state = scorer.score("SPX", views, proximateSupports, kNow);
        if (state.aligned || state.classification != domain::Classification::None) {
            std::cerr << "Expired corroboration must not keep confluence, got " << state.score << '\n';
            return 1;
        }
        if (state.excludedSources != std::vector<domain::Source>{domain::Source::Discord}
            || state.contributingSources != std::vector<domain::Source>{domain::Source::KtTechnical}) {
            std::cerr << "Expired view should be excluded\n";
            return 1;
        }
        if (state.summary != "Single source: kt_technical bullish (no corroboration); expired: discord") {
            std::cerr << "Unexpected summary: " << state.summary << '\n';
            return 1;
        }
    }

    // One soft-stale source lowers recency but keeps agreement.
    {
        const std::vector<domain::SourceView> views{
            makeView(domain::Source::KtTechnical, domain::Bias::Bearish, kNow - 2h),
            makeView(domain::Source::Discord, domain::Bias::Bearish, kNow - 72h),
        };
        const auto state = scorer.score("SPX", views, {}, kNow);
        if (!near(state.recencyFactor, 0.75) || !near(state.score, 0.7125) || !state.aligned) {
            std::cerr << "Unexpected soft-stale scoring: " << state.score << '\n';
            return 1;
        }
        if (state.staleSources != std::vector<domain::Source>{domain::Source::Discord}) {
            std::cerr << "Discord should be listed as stale\n";
            return 1;
        }
    }

    // No views at all.
    {
        const auto state = scorer.score("SPX", {}, {}, kNow);
        if (state.score != 0.0 || state.classification != domain::Classification::None
            || state.summary != "No active views") {
            std::cerr << "Empty symbol should have no confluence\n";
            return 1;
        }
    }

    if (scorer.classify(0.7) != domain::Classification::High || scorer.classify(0.4) != domain::Classification::Medium
        || scorer.classify(0.399) != domain::Classification::Low || scorer.classify(0.1) != domain::Classification::None) {
        std::cerr << "Classification thresholds are inclusive lower bounds\n";
        return 1;
    }

    return 0;
}

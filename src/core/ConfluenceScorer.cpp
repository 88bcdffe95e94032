#include "core/ConfluenceScorer.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>

#include "core/LevelStore.hpp"

namespace core {
namespace {

void appendSources(std::ostringstream& oss, const std::vector<domain::Source>& sources) {
    for (std::size_t i = 0; i < sources.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << domain::sourceToString(sources[i]);
    }
}

std::vector<domain::Source> sourcesWithSignal(const std::vector<domain::SourceView>& views,
                                              const std::vector<domain::Source>& contributing,
                                              int signal) {
    std::vector<domain::Source> out;
    for (const auto& view : views) {
        if (domain::biasSignal(view.bias) != signal) {
            continue;
        }
        if (std::find(contributing.begin(), contributing.end(), view.source) != contributing.end()) {
            out.push_back(view.source);
        }
    }
    return out;
}

}  // namespace

ConfluenceScorer::ConfluenceScorer(StalenessEvaluator evaluator,
                                   domain::ScoringSettings scoring,
                                   double mergeTolerance)
    : evaluator_(std::move(evaluator)), scoring_(scoring), mergeTolerance_(mergeTolerance) {}

domain::Classification ConfluenceScorer::classify(double score) const noexcept {
    if (score >= scoring_.highThreshold) {
        return domain::Classification::High;
    }
    if (score >= scoring_.mediumThreshold) {
        return domain::Classification::Medium;
    }
    if (score >= scoring_.lowThreshold) {
        return domain::Classification::Low;
    }
    return domain::Classification::None;
}

bool ConfluenceScorer::levelsProximate(domain::Source lhs,
                                       domain::Source rhs,
                                       const std::vector<domain::PriceLevel>& levels,
                                       domain::Timestamp now) const {
    for (const auto& a : levels) {
        if (a.source != lhs || !a.active || evaluator_.evaluate(a, now) == domain::Staleness::Expired) {
            continue;
        }
        for (const auto& b : levels) {
            if (b.source != rhs || b.type != a.type || !b.active
                || evaluator_.evaluate(b, now) == domain::Staleness::Expired) {
                continue;
            }
            if (LevelStore::withinTolerance(a.price, b.price, mergeTolerance_)
                || LevelStore::withinTolerance(b.price, a.price, mergeTolerance_)) {
                return true;
            }
        }
    }
    return false;
}

domain::ConfluenceState ConfluenceScorer::score(const domain::Symbol& symbol,
                                                const std::vector<domain::SourceView>& views,
                                                const std::vector<domain::PriceLevel>& levels,
                                                domain::Timestamp now) const {
    domain::ConfluenceState state;
    state.symbol = symbol;

    // Views arrive in source order; everything below preserves it so the
    // summary text is reproducible.
    std::vector<Scored> scored;
    scored.reserve(views.size());
    for (const auto& view : views) {
        const auto staleness = evaluator_.evaluate(view, now);
        if (staleness == domain::Staleness::Expired) {
            state.excludedSources.push_back(view.source);
            continue;
        }
        if (staleness == domain::Staleness::Stale) {
            state.staleSources.push_back(view.source);
        }
        state.contributingSources.push_back(view.source);
        scored.push_back(Scored{&view, staleness, domain::biasSignal(view.bias)});
    }

    std::ostringstream summary;

    if (scored.empty()) {
        summary << "No active views";
    } else if (scored.size() == 1) {
        const auto& only = scored.front();
        double value = std::min(only.view->confidence, scoring_.singleSourceCap);
        if (only.staleness == domain::Staleness::Stale) {
            value *= scoring_.softStalePenalty;
        }
        state.score = std::clamp(value, 0.0, 1.0);
        state.recencyFactor = only.staleness == domain::Staleness::Fresh ? 1.0 : scoring_.softStalePenalty;
        if (only.signal != 0) {
            state.direction = only.view->bias;
        }
        summary << "Single source: " << domain::sourceToString(only.view->source) << ' '
                << domain::biasToString(only.view->bias) << " (no corroboration)";
    } else {
        std::size_t pairs = 0;
        std::size_t agreeing = 0;
        std::size_t proximate = 0;
        for (std::size_t i = 0; i < scored.size(); ++i) {
            for (std::size_t j = i + 1; j < scored.size(); ++j) {
                ++pairs;
                if (scored[i].signal == 0 || scored[i].signal != scored[j].signal) {
                    continue;
                }
                ++agreeing;
                if (levelsProximate(scored[i].view->source, scored[j].view->source, levels, now)) {
                    ++proximate;
                }
            }
        }

        double recency = 0.0;
        for (const auto& entry : scored) {
            recency += entry.staleness == domain::Staleness::Fresh ? 1.0 : scoring_.softStalePenalty;
        }

        state.biasAgreement = static_cast<double>(agreeing) / static_cast<double>(pairs);
        state.proximityBonus = static_cast<double>(proximate) / static_cast<double>(pairs);
        state.recencyFactor = recency / static_cast<double>(scored.size());

        const double value = scoring_.biasWeight * state.biasAgreement
                             + scoring_.proximityWeight * state.proximityBonus
                             + scoring_.recencyWeight * state.recencyFactor;
        state.score = std::clamp(value, 0.0, 1.0);

        const auto bullish = sourcesWithSignal(views, state.contributingSources, 1);
        const auto bearish = sourcesWithSignal(views, state.contributingSources, -1);

        if (agreeing == pairs) {
            state.direction = scored.front().view->bias;
            summary << scored.size() << '/' << scored.size() << " sources aligned "
                    << domain::biasToString(*state.direction) << " (";
            appendSources(summary, state.contributingSources);
            summary << ')';
        } else if (!bullish.empty() && !bearish.empty()) {
            summary << "CONFLICT: ";
            appendSources(summary, bullish);
            summary << " bullish vs ";
            appendSources(summary, bearish);
            summary << " bearish";
        } else {
            const std::size_t neutral = scored.size() - bullish.size() - bearish.size();
            summary << "Mixed: " << bullish.size() << " bullish, " << bearish.size() << " bearish, "
                    << neutral << " neutral";
        }
    }

    state.classification = classify(state.score);
    state.aligned = (state.classification == domain::Classification::High
                     || state.classification == domain::Classification::Medium)
                    && scored.size() >= 2 && state.biasAgreement >= 1.0;

    if (!state.staleSources.empty()) {
        summary << "; stale: ";
        appendSources(summary, state.staleSources);
    }
    if (!state.excludedSources.empty()) {
        summary << "; expired: ";
        appendSources(summary, state.excludedSources);
    }
    state.summary = summary.str();
    return state;
}

}  // namespace core

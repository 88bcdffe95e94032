#pragma once

#include <vector>

#include "core/StalenessEvaluator.hpp"
#include "domain/Models.hpp"
#include "domain/Settings.hpp"

namespace core {

// Turns a snapshot of one symbol's views and levels into its confluence
// state. Pure: no stored state, safe to call from any thread.
class ConfluenceScorer {
public:
    ConfluenceScorer(StalenessEvaluator evaluator, domain::ScoringSettings scoring, double mergeTolerance);

    [[nodiscard]] domain::ConfluenceState score(const domain::Symbol& symbol,
                                                const std::vector<domain::SourceView>& views,
                                                const std::vector<domain::PriceLevel>& levels,
                                                domain::Timestamp now) const;

    [[nodiscard]] domain::Classification classify(double score) const noexcept;

    [[nodiscard]] const domain::ScoringSettings& settings() const noexcept { return scoring_; }

private:
    struct Scored {
        const domain::SourceView* view;
        domain::Staleness staleness;
        int signal;
    };

    bool levelsProximate(domain::Source lhs,
                         domain::Source rhs,
                         const std::vector<domain::PriceLevel>& levels,
                         domain::Timestamp now) const;

    StalenessEvaluator evaluator_;
    domain::ScoringSettings scoring_;
    double mergeTolerance_;
};

}  // namespace core

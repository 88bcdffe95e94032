#include "core/StalenessEvaluator.hpp"

#include <utility>

namespace core {

StalenessEvaluator::StalenessEvaluator(domain::StalenessPolicy policy) noexcept
    : policy_(std::move(policy)) {}

domain::Staleness StalenessEvaluator::evaluate(domain::Source source,
                                               domain::Timestamp lastUpdate,
                                               domain::Timestamp now) const noexcept {
    // Clock skew: a timestamp from the future is as fresh as it gets.
    const auto age = now > lastUpdate ? now - lastUpdate : domain::Clock::duration::zero();
    const auto& thresholds = policy_.thresholds(source);

    if (age > thresholds.hard) {
        return domain::Staleness::Expired;
    }
    if (age >= thresholds.soft) {
        return domain::Staleness::Stale;
    }
    return domain::Staleness::Fresh;
}

domain::Staleness StalenessEvaluator::evaluate(const domain::SourceView& view,
                                               domain::Timestamp now) const noexcept {
    return evaluate(view.source, view.lastUpdatedAt, now);
}

domain::Staleness StalenessEvaluator::evaluate(const domain::PriceLevel& level,
                                               domain::Timestamp now) const noexcept {
    return evaluate(level.source, level.lastConfirmedAt, now);
}

bool StalenessEvaluator::isStale(const domain::SourceView& view, domain::Timestamp now) const noexcept {
    return evaluate(view, now) != domain::Staleness::Fresh;
}

bool StalenessEvaluator::isStale(const domain::PriceLevel& level, domain::Timestamp now) const noexcept {
    return evaluate(level, now) != domain::Staleness::Fresh;
}

}  // namespace core

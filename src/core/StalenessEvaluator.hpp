#pragma once

#include "domain/Models.hpp"
#include "domain/Settings.hpp"

namespace core {

// Pure, read-time freshness classification. Nothing is cached: the same
// inputs always give the same answer, so a view ages out without any write.
class StalenessEvaluator {
public:
    explicit StalenessEvaluator(domain::StalenessPolicy policy) noexcept;

    [[nodiscard]] domain::Staleness evaluate(domain::Source source,
                                             domain::Timestamp lastUpdate,
                                             domain::Timestamp now) const noexcept;

    [[nodiscard]] domain::Staleness evaluate(const domain::SourceView& view,
                                             domain::Timestamp now) const noexcept;
    [[nodiscard]] domain::Staleness evaluate(const domain::PriceLevel& level,
                                             domain::Timestamp now) const noexcept;

    [[nodiscard]] bool isStale(const domain::SourceView& view, domain::Timestamp now) const noexcept;
    [[nodiscard]] bool isStale(const domain::PriceLevel& level, domain::Timestamp now) const noexcept;

    [[nodiscard]] const domain::StalenessPolicy& policy() const noexcept { return policy_; }

private:
    domain::StalenessPolicy policy_;
};

}  // namespace core

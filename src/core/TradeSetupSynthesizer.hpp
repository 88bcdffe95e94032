#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/StalenessEvaluator.hpp"
#include "domain/Models.hpp"

namespace core {

// Renders the textual setup for a symbol whose sources are aligned with high
// confluence. Template based, so equal inputs give byte-identical text.
class TradeSetupSynthesizer {
public:
    explicit TradeSetupSynthesizer(StalenessEvaluator evaluator);

    [[nodiscard]] std::optional<std::string> synthesize(const domain::ConfluenceState& state,
                                                        const std::vector<domain::SourceView>& views,
                                                        const std::vector<domain::PriceLevel>& levels,
                                                        domain::Timestamp now) const;

private:
    const domain::PriceLevel* strongest(domain::Source source,
                                        domain::LevelType type,
                                        const std::vector<domain::PriceLevel>& levels,
                                        domain::Timestamp now) const;

    StalenessEvaluator evaluator_;
};

}  // namespace core

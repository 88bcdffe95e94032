#include "core/SourceViewStore.hpp"

#include <cmath>
#include <cstddef>
#include <sstream>
#include <utility>

namespace core {

SourceViewStore::SourceViewStore(const std::vector<domain::Symbol>& catalog) {
    slots_.reserve(catalog.size());
    for (const auto& symbol : catalog) {
        slots_.emplace(symbol, Slots{});
    }
}

SourceViewStore::Slots* SourceViewStore::slots(const domain::Symbol& symbol) {
    const auto it = slots_.find(symbol);
    return it != slots_.end() ? &it->second : nullptr;
}

const SourceViewStore::Slots* SourceViewStore::slots(const domain::Symbol& symbol) const {
    const auto it = slots_.find(symbol);
    return it != slots_.end() ? &it->second : nullptr;
}

ViewWriteResult SourceViewStore::upsert(const domain::Symbol& symbol,
                                        domain::Source source,
                                        const domain::ViewFields& fields,
                                        const std::string& contentId,
                                        domain::Timestamp observedAt) {
    ViewWriteResult result;

    auto* table = slots(symbol);
    if (table == nullptr) {
        result.outcome = WriteOutcome::Rejected;
        result.reason = "symbol not tracked: " + symbol;
        return result;
    }
    if (!std::isfinite(fields.confidence) || fields.confidence < 0.0 || fields.confidence > 1.0) {
        std::ostringstream oss;
        oss << "confidence outside [0,1] (got " << fields.confidence << ')';
        result.outcome = WriteOutcome::Rejected;
        result.reason = oss.str();
        return result;
    }

    auto& slot = (*table)[static_cast<std::size_t>(source)];
    if (slot && slot->lastUpdatedAt >= observedAt) {
        result.outcome = WriteOutcome::StaleWriteIgnored;
        result.reason = "stored view is as new or newer";
        return result;
    }

    domain::SourceView view;
    view.symbol = symbol;
    view.source = source;
    if (fields.bias) {
        view.bias = *fields.bias;
    } else if (fields.quadrant) {
        view.bias = domain::quadrantBias(*fields.quadrant);
    } else {
        view.bias = domain::Bias::Neutral;
    }
    view.quadrant = fields.quadrant;
    view.ivRegime = fields.ivRegime;
    view.wavePosition = fields.wavePosition;
    view.wavePhase = fields.wavePhase;
    view.strategy = fields.strategy;
    view.notes = fields.notes;
    view.confidence = fields.confidence;
    view.contentId = contentId;
    view.lastUpdatedAt = observedAt;

    slot = view;
    result.outcome = WriteOutcome::Upserted;
    result.stored = std::move(view);
    return result;
}

std::vector<domain::SourceView> SourceViewStore::views(const domain::Symbol& symbol) const {
    std::vector<domain::SourceView> out;
    const auto* table = slots(symbol);
    if (table == nullptr) {
        return out;
    }
    for (const auto& slot : *table) {
        if (slot) {
            out.push_back(*slot);
        }
    }
    return out;
}

std::optional<domain::SourceView> SourceViewStore::view(const domain::Symbol& symbol,
                                                        domain::Source source) const {
    const auto* table = slots(symbol);
    if (table == nullptr) {
        return std::nullopt;
    }
    return (*table)[static_cast<std::size_t>(source)];
}

void SourceViewStore::restore(const domain::SourceView& view) {
    auto* table = slots(view.symbol);
    if (table == nullptr) {
        return;
    }
    auto& slot = (*table)[static_cast<std::size_t>(view.source)];
    if (!slot || slot->lastUpdatedAt < view.lastUpdatedAt) {
        slot = view;
    }
}

}  // namespace core

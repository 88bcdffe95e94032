#include "http/StateJson.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "domain/Models.hpp"

namespace cfe::http {
namespace {

boost::json::string_view sv(std::string_view value) {
    return boost::json::string_view(value.data(), value.size());
}

boost::json::value text(const std::string& value) {
    return boost::json::value(sv(value));
}

boost::json::value optionalText(const std::optional<std::string>& value) {
    if (!value) {
        return nullptr;
    }
    return text(*value);
}

boost::json::value optionalNumber(const std::optional<double>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

boost::json::array sources(const std::vector<domain::Source>& list) {
    boost::json::array out;
    out.reserve(list.size());
    for (const auto source : list) {
        out.emplace_back(sv(domain::sourceToString(source)));
    }
    return out;
}

}  // namespace

boost::json::object level_json(const domain::PriceLevel& level) {
    boost::json::object out;
    out["id"] = level.id;
    out["symbol"] = text(level.symbol);
    out["source"] = sv(domain::sourceToString(level.source));
    out["type"] = sv(domain::levelTypeToString(level.type));
    out["price"] = level.price;
    out["price_upper"] = optionalNumber(level.priceUpper);
    out["direction"] = sv(domain::levelDirectionToString(level.direction));
    out["fib"] = optionalText(level.fib);
    out["confidence"] = level.confidence;
    out["context"] = text(level.context);
    out["invalidation_price"] = optionalNumber(level.invalidationPrice);
    out["content_id"] = text(level.contentId);
    out["created_at"] = domain::toEpochMs(level.createdAt);
    out["last_confirmed_at"] = domain::toEpochMs(level.lastConfirmedAt);
    out["active"] = level.active;
    return out;
}

boost::json::object to_json(const app::AnnotatedLevel& annotated) {
    auto out = level_json(annotated.level);
    out["staleness"] = sv(domain::stalenessToString(annotated.staleness));
    out["is_stale"] = annotated.staleness != domain::Staleness::Fresh;
    out["low_confidence"] = annotated.lowConfidence;
    return out;
}

boost::json::object to_json(const app::AnnotatedView& annotated) {
    const auto& view = annotated.view;
    boost::json::object out;
    out["source"] = sv(domain::sourceToString(view.source));
    out["bias"] = sv(domain::biasToString(view.bias));
    out["quadrant"] = view.quadrant ? boost::json::value(sv(domain::quadrantToString(*view.quadrant)))
                                    : boost::json::value(nullptr);
    out["iv_regime"] = view.ivRegime ? boost::json::value(sv(domain::ivRegimeToString(*view.ivRegime)))
                                     : boost::json::value(nullptr);
    out["wave_position"] = optionalText(view.wavePosition);
    out["wave_phase"] = optionalText(view.wavePhase);
    out["strategy"] = optionalText(view.strategy);
    out["notes"] = text(view.notes);
    out["confidence"] = view.confidence;
    out["content_id"] = text(view.contentId);
    out["last_updated"] = domain::toEpochMs(view.lastUpdatedAt);
    out["staleness"] = sv(domain::stalenessToString(annotated.staleness));
    out["is_stale"] = annotated.staleness != domain::Staleness::Fresh;
    return out;
}

boost::json::object to_json(const domain::ConfluenceState& state) {
    boost::json::object out;
    out["symbol"] = text(state.symbol);
    out["score"] = state.score;
    out["aligned"] = state.aligned;
    out["classification"] = sv(domain::classificationToString(state.classification));
    out["direction"] = state.direction ? boost::json::value(sv(domain::biasToString(*state.direction)))
                                       : boost::json::value(nullptr);
    out["bias_agreement"] = state.biasAgreement;
    out["proximity_bonus"] = state.proximityBonus;
    out["recency_factor"] = state.recencyFactor;
    out["contributing_sources"] = sources(state.contributingSources);
    out["stale_sources"] = sources(state.staleSources);
    out["excluded_sources"] = sources(state.excludedSources);
    out["summary"] = text(state.summary);
    out["trade_setup"] = optionalText(state.tradeSetup);
    return out;
}

boost::json::object to_json(const app::SymbolSummary& summary) {
    boost::json::object views;
    for (const auto& annotated : summary.views) {
        boost::json::object brief;
        brief["bias"] = sv(domain::biasToString(annotated.view.bias));
        brief["quadrant"] = annotated.view.quadrant
                                ? boost::json::value(sv(domain::quadrantToString(*annotated.view.quadrant)))
                                : boost::json::value(nullptr);
        brief["last_updated"] = domain::toEpochMs(annotated.view.lastUpdatedAt);
        brief["staleness"] = sv(domain::stalenessToString(annotated.staleness));
        views[sv(domain::sourceToString(annotated.view.source))] = std::move(brief);
    }

    boost::json::object confluence;
    confluence["classification"] = sv(domain::classificationToString(summary.confluence.classification));
    confluence["score"] = summary.confluence.score;
    confluence["aligned"] = summary.confluence.aligned;

    boost::json::object out;
    out["symbol"] = text(summary.symbol);
    out["sources"] = std::move(views);
    out["confluence"] = std::move(confluence);
    out["active_level_count"] = summary.activeLevelCount;
    return out;
}

boost::json::object to_json(const app::SymbolDetail& detail) {
    boost::json::object views;
    for (const auto& annotated : detail.views) {
        views[sv(domain::sourceToString(annotated.view.source))] = to_json(annotated);
    }

    boost::json::array levels;
    levels.reserve(detail.levels.size());
    for (const auto& level : detail.levels) {
        levels.emplace_back(to_json(level));
    }

    boost::json::object out;
    out["symbol"] = text(detail.symbol);
    out["views"] = std::move(views);
    out["levels"] = std::move(levels);
    out["confluence"] = to_json(detail.confluence);
    out["trade_setup"] = optionalText(detail.confluence.tradeSetup);
    return out;
}

boost::json::object to_json(const app::BatchSummary& summary) {
    boost::json::object out;
    out["inserted"] = summary.inserted;
    out["merged"] = summary.merged;
    out["upserted"] = summary.upserted;
    out["stale_write_ignored"] = summary.staleIgnored;
    out["rejected"] = summary.rejected;

    boost::json::array errors;
    for (const auto& error : summary.errors) {
        errors.emplace_back(text(error));
    }
    out["errors"] = std::move(errors);
    return out;
}

}  // namespace cfe::http

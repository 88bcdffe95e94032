#include "core/TradeSetupSynthesizer.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <utility>

namespace core {
namespace {

constexpr domain::LevelType kSetupLevels[] = {
    domain::LevelType::Support,
    domain::LevelType::Target,
    domain::LevelType::Invalidation,
};

// Free text from a source is folded onto the setup's single line.
std::string singleLine(const std::string& text) {
    std::string out(text);
    std::replace_if(out.begin(), out.end(), [](unsigned char ch) { return std::iscntrl(ch) != 0; }, ' ');
    return out;
}

}  // namespace

TradeSetupSynthesizer::TradeSetupSynthesizer(StalenessEvaluator evaluator) : evaluator_(std::move(evaluator)) {}

const domain::PriceLevel* TradeSetupSynthesizer::strongest(domain::Source source,
                                                           domain::LevelType type,
                                                           const std::vector<domain::PriceLevel>& levels,
                                                           domain::Timestamp now) const {
    const domain::PriceLevel* best = nullptr;
    for (const auto& level : levels) {
        if (level.source != source || level.type != type || !level.active) {
            continue;
        }
        if (evaluator_.evaluate(level, now) == domain::Staleness::Expired) {
            continue;
        }
        if (best == nullptr) {
            best = &level;
            continue;
        }
        if (level.confidence != best->confidence) {
            if (level.confidence > best->confidence) {
                best = &level;
            }
            continue;
        }
        if (level.lastConfirmedAt != best->lastConfirmedAt) {
            if (level.lastConfirmedAt > best->lastConfirmedAt) {
                best = &level;
            }
            continue;
        }
        if (level.id < best->id) {
            best = &level;
        }
    }
    return best;
}

std::optional<std::string> TradeSetupSynthesizer::synthesize(const domain::ConfluenceState& state,
                                                             const std::vector<domain::SourceView>& views,
                                                             const std::vector<domain::PriceLevel>& levels,
                                                             domain::Timestamp now) const {
    if (!state.aligned || state.classification != domain::Classification::High || !state.direction) {
        return std::nullopt;
    }
    const int signal = domain::biasSignal(*state.direction);
    if (signal == 0) {
        return std::nullopt;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << (signal > 0 ? "LONG" : "SHORT") << ' ' << state.symbol << ": "
        << domain::biasToString(*state.direction) << " confluence (score " << state.score << ") from ";
    for (std::size_t i = 0; i < state.contributingSources.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << domain::sourceToString(state.contributingSources[i]);
    }

    oss << '.';

    bool first = true;
    for (const auto source : domain::kAllSources) {
        const auto contributes = std::find(state.contributingSources.begin(), state.contributingSources.end(), source)
                                 != state.contributingSources.end();
        if (!contributes) {
            continue;
        }

        oss << (first ? " " : "; ") << domain::sourceToString(source) << ':';
        first = false;
        bool any = false;
        for (const auto type : kSetupLevels) {
            const auto* level = strongest(source, type, levels, now);
            if (level == nullptr) {
                continue;
            }
            oss << (any ? ", " : " ") << domain::levelTypeToString(type) << ' ' << level->price;
            if (level->priceUpper) {
                oss << '-' << *level->priceUpper;
            }
            any = true;
        }
        if (!any) {
            oss << " no levels";
        }

        const auto view = std::find_if(views.begin(), views.end(), [source](const domain::SourceView& v) {
            return v.source == source;
        });
        if (view != views.end() && view->strategy && !view->strategy->empty()) {
            oss << " (strategy: " << singleLine(*view->strategy) << ')';
        }
    }
    return oss.str();
}

}  // namespace core

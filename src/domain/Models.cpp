#include "domain/Models.hpp"

#include <cctype>
#include <string>

namespace domain {
namespace {

std::string normalizeToken(std::string_view value) {
    const auto isSpace = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };
    while (!value.empty() && isSpace(value.front())) {
        value.remove_prefix(1);
    }
    while (!value.empty() && isSpace(value.back())) {
        value.remove_suffix(1);
    }

    std::string normalized;
    normalized.reserve(value.size());
    for (char ch : value) {
        if (ch == '-' || ch == ' ') {
            ch = '_';
        }
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return normalized;
}

}  // namespace

std::string_view sourceToString(Source source) noexcept {
    switch (source) {
    case Source::KtTechnical:
        return "kt_technical";
    case Source::Discord:
        return "discord";
    case Source::Macro42:
        return "macro42";
    case Source::Substack:
        return "substack";
    case Source::Youtube:
        return "youtube";
    case Source::Twitter:
        return "twitter";
    }
    return "unknown";
}

std::optional<Source> sourceFromString(std::string_view value) {
    const auto normalized = normalizeToken(value);
    if (normalized == "kt_technical" || normalized == "kt") {
        return Source::KtTechnical;
    }
    if (normalized == "discord") {
        return Source::Discord;
    }
    if (normalized == "macro42" || normalized == "42macro") {
        return Source::Macro42;
    }
    if (normalized == "substack") {
        return Source::Substack;
    }
    if (normalized == "youtube") {
        return Source::Youtube;
    }
    if (normalized == "twitter") {
        return Source::Twitter;
    }
    return std::nullopt;
}

std::string_view levelTypeToString(LevelType type) noexcept {
    switch (type) {
    case LevelType::Support:
        return "support";
    case LevelType::Resistance:
        return "resistance";
    case LevelType::Target:
        return "target";
    case LevelType::Invalidation:
        return "invalidation";
    }
    return "support";
}

std::optional<LevelType> levelTypeFromString(std::string_view value) {
    const auto normalized = normalizeToken(value);
    if (normalized == "support") {
        return LevelType::Support;
    }
    if (normalized == "resistance") {
        return LevelType::Resistance;
    }
    if (normalized == "target") {
        return LevelType::Target;
    }
    if (normalized == "invalidation") {
        return LevelType::Invalidation;
    }
    return std::nullopt;
}

std::string_view levelDirectionToString(LevelDirection direction) noexcept {
    switch (direction) {
    case LevelDirection::BullishReversal:
        return "bullish_reversal";
    case LevelDirection::BearishReversal:
        return "bearish_reversal";
    case LevelDirection::BullishBreakout:
        return "bullish_breakout";
    case LevelDirection::BearishBreakdown:
        return "bearish_breakdown";
    case LevelDirection::Neutral:
        return "neutral";
    }
    return "neutral";
}

std::optional<LevelDirection> levelDirectionFromString(std::string_view value) {
    const auto normalized = normalizeToken(value);
    if (normalized == "bullish_reversal") {
        return LevelDirection::BullishReversal;
    }
    if (normalized == "bearish_reversal") {
        return LevelDirection::BearishReversal;
    }
    if (normalized == "bullish_breakout") {
        return LevelDirection::BullishBreakout;
    }
    if (normalized == "bearish_breakdown") {
        return LevelDirection::BearishBreakdown;
    }
    if (normalized == "neutral") {
        return LevelDirection::Neutral;
    }
    return std::nullopt;
}

std::string_view biasToString(Bias bias) noexcept {
    switch (bias) {
    case Bias::Bullish:
        return "bullish";
    case Bias::Bearish:
        return "bearish";
    case Bias::Neutral:
        return "neutral";
    }
    return "neutral";
}

std::optional<Bias> biasFromString(std::string_view value) {
    const auto normalized = normalizeToken(value);
    if (normalized == "bullish" || normalized == "long") {
        return Bias::Bullish;
    }
    if (normalized == "bearish" || normalized == "short") {
        return Bias::Bearish;
    }
    if (normalized == "neutral") {
        return Bias::Neutral;
    }
    return std::nullopt;
}

std::string_view quadrantToString(Quadrant quadrant) noexcept {
    switch (quadrant) {
    case Quadrant::BuyCall:
        return "buy_call";
    case Quadrant::SellPut:
        return "sell_put";
    case Quadrant::BuyPut:
        return "buy_put";
    case Quadrant::SellCall:
        return "sell_call";
    case Quadrant::Neutral:
        return "neutral";
    }
    return "neutral";
}

std::optional<Quadrant> quadrantFromString(std::string_view value) {
    const auto normalized = normalizeToken(value);
    if (normalized == "buy_call") {
        return Quadrant::BuyCall;
    }
    if (normalized == "sell_put") {
        return Quadrant::SellPut;
    }
    if (normalized == "buy_put") {
        return Quadrant::BuyPut;
    }
    if (normalized == "sell_call") {
        return Quadrant::SellCall;
    }
    if (normalized == "neutral") {
        return Quadrant::Neutral;
    }
    return std::nullopt;
}

std::string_view ivRegimeToString(IvRegime regime) noexcept {
    switch (regime) {
    case IvRegime::Cheap:
        return "cheap";
    case IvRegime::Neutral:
        return "neutral";
    case IvRegime::Expensive:
        return "expensive";
    }
    return "neutral";
}

std::optional<IvRegime> ivRegimeFromString(std::string_view value) {
    const auto normalized = normalizeToken(value);
    if (normalized == "cheap" || normalized == "low") {
        return IvRegime::Cheap;
    }
    if (normalized == "neutral") {
        return IvRegime::Neutral;
    }
    if (normalized == "expensive" || normalized == "high") {
        return IvRegime::Expensive;
    }
    return std::nullopt;
}

std::string_view stalenessToString(Staleness staleness) noexcept {
    switch (staleness) {
    case Staleness::Fresh:
        return "fresh";
    case Staleness::Stale:
        return "stale";
    case Staleness::Expired:
        return "expired";
    }
    return "fresh";
}

std::string_view classificationToString(Classification classification) noexcept {
    switch (classification) {
    case Classification::None:
        return "none";
    case Classification::Low:
        return "low";
    case Classification::Medium:
        return "medium";
    case Classification::High:
        return "high";
    }
    return "none";
}

Bias quadrantBias(Quadrant quadrant) noexcept {
    switch (quadrant) {
    case Quadrant::BuyCall:
    case Quadrant::SellPut:
        return Bias::Bullish;
    case Quadrant::BuyPut:
    case Quadrant::SellCall:
        return Bias::Bearish;
    case Quadrant::Neutral:
        break;
    }
    return Bias::Neutral;
}

int biasSignal(Bias bias) noexcept {
    switch (bias) {
    case Bias::Bullish:
        return 1;
    case Bias::Bearish:
        return -1;
    case Bias::Neutral:
        break;
    }
    return 0;
}

std::int64_t toEpochMs(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp fromEpochMs(std::int64_t ms) noexcept {
    return Timestamp{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{ms})};
}

}  // namespace domain

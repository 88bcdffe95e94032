#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domain {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;
using Symbol = std::string;

enum class Source {
    KtTechnical,
    Discord,
    Macro42,
    Substack,
    Youtube,
    Twitter,
};

inline constexpr std::array<Source, 6> kAllSources{
    Source::KtTechnical,
    Source::Discord,
    Source::Macro42,
    Source::Substack,
    Source::Youtube,
    Source::Twitter,
};

enum class LevelType {
    Support,
    Resistance,
    Target,
    Invalidation,
};

// How a level is meant to be traded: "support at 313" (bullish_reversal) and
// "breakdown below 313" (bearish_breakdown) share a price but not a meaning.
enum class LevelDirection {
    BullishReversal,
    BearishReversal,
    BullishBreakout,
    BearishBreakdown,
    Neutral,
};

enum class Bias {
    Bullish,
    Bearish,
    Neutral,
};

// Stock-compass quadrant: direction on one axis, implied volatility on the other.
enum class Quadrant {
    BuyCall,
    SellPut,
    BuyPut,
    SellCall,
    Neutral,
};

enum class IvRegime {
    Cheap,
    Neutral,
    Expensive,
};

enum class Staleness {
    Fresh,
    Stale,
    Expired,
};

enum class Classification {
    None,
    Low,
    Medium,
    High,
};

enum class RecordKind {
    Level,
    View,
};

struct LevelFields {
    LevelType type{LevelType::Support};
    double price{0.0};
    std::optional<double> priceUpper;
    LevelDirection direction{LevelDirection::Neutral};
    std::optional<std::string> fib;
    double confidence{0.8};
    std::string context;
    std::optional<double> invalidationPrice;
};

struct ViewFields {
    std::optional<Bias> bias;
    std::optional<Quadrant> quadrant;
    std::optional<IvRegime> ivRegime;
    std::optional<std::string> wavePosition;
    std::optional<std::string> wavePhase;
    std::optional<std::string> strategy;
    std::string notes;
    double confidence{0.8};
};

struct ExtractionRecord {
    std::string symbolText;
    Source source{Source::KtTechnical};
    RecordKind kind{RecordKind::Level};
    std::optional<LevelFields> level;
    std::optional<ViewFields> view;
    std::string contentId;
    Timestamp observedAt{};
};

struct PriceLevel {
    std::uint64_t id{0};
    Symbol symbol;
    Source source{Source::KtTechnical};
    LevelType type{LevelType::Support};
    double price{0.0};
    std::optional<double> priceUpper;
    LevelDirection direction{LevelDirection::Neutral};
    std::optional<std::string> fib;
    double confidence{0.0};
    std::string context;
    std::optional<double> invalidationPrice;
    std::string contentId;
    Timestamp createdAt{};
    Timestamp lastConfirmedAt{};
    bool active{true};
};

struct SourceView {
    Symbol symbol;
    Source source{Source::KtTechnical};
    Bias bias{Bias::Neutral};
    std::optional<Quadrant> quadrant;
    std::optional<IvRegime> ivRegime;
    std::optional<std::string> wavePosition;
    std::optional<std::string> wavePhase;
    std::optional<std::string> strategy;
    std::string notes;
    double confidence{0.8};
    std::string contentId;
    Timestamp lastUpdatedAt{};
};

struct ConfluenceState {
    Symbol symbol;
    double score{0.0};
    bool aligned{false};
    Classification classification{Classification::None};
    std::optional<Bias> direction;
    double biasAgreement{0.0};
    double proximityBonus{0.0};
    double recencyFactor{0.0};
    std::vector<Source> contributingSources;
    std::vector<Source> staleSources;
    std::vector<Source> excludedSources;
    std::string summary;
    std::optional<std::string> tradeSetup;
};

std::string_view sourceToString(Source source) noexcept;
std::optional<Source> sourceFromString(std::string_view value);

std::string_view levelTypeToString(LevelType type) noexcept;
std::optional<LevelType> levelTypeFromString(std::string_view value);

std::string_view levelDirectionToString(LevelDirection direction) noexcept;
std::optional<LevelDirection> levelDirectionFromString(std::string_view value);

std::string_view biasToString(Bias bias) noexcept;
std::optional<Bias> biasFromString(std::string_view value);

std::string_view quadrantToString(Quadrant quadrant) noexcept;
std::optional<Quadrant> quadrantFromString(std::string_view value);

std::string_view ivRegimeToString(IvRegime regime) noexcept;
std::optional<IvRegime> ivRegimeFromString(std::string_view value);

std::string_view stalenessToString(Staleness staleness) noexcept;
std::string_view classificationToString(Classification classification) noexcept;

Bias quadrantBias(Quadrant quadrant) noexcept;
// -1 bearish, 0 neutral, +1 bullish.
int biasSignal(Bias bias) noexcept;

std::int64_t toEpochMs(Timestamp ts) noexcept;
Timestamp fromEpochMs(std::int64_t ms) noexcept;

}  // namespace domain

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/ConfluenceScorer.hpp"
#include "core/LevelStore.hpp"
#include "core/SourceViewStore.hpp"
#include "core/StalenessEvaluator.hpp"
#include "core/TradeSetupSynthesizer.hpp"
#include "core/WriteOutcome.hpp"
#include "domain/Models.hpp"
#include "domain/Ports.hpp"
#include "domain/Settings.hpp"
#include "domain/SymbolNormalizer.hpp"

namespace app {

struct AnnotatedView {
    domain::SourceView view;
    domain::Staleness staleness{domain::Staleness::Fresh};
};

struct AnnotatedLevel {
    domain::PriceLevel level;
    domain::Staleness staleness{domain::Staleness::Fresh};
    bool lowConfidence{false};
};

struct SymbolSummary {
    domain::Symbol symbol;
    std::vector<AnnotatedView> views;
    domain::ConfluenceState confluence;
    std::size_t activeLevelCount{0};
};

struct SymbolDetail {
    domain::Symbol symbol;
    std::vector<AnnotatedView> views;
    std::vector<AnnotatedLevel> levels;
    // tradeSetup is filled in when the symbol qualifies.
    domain::ConfluenceState confluence;
};

struct BatchSummary {
    std::size_t inserted{0};
    std::size_t merged{0};
    std::size_t upserted{0};
    std::size_t staleIgnored{0};
    std::size_t rejected{0};
    std::vector<std::string> errors;

    void add(const core::WriteResult& result);
    std::size_t total() const noexcept { return inserted + merged + upserted + staleIgnored + rejected; }
};

// Owns all stored state and serializes writes per symbol. Every catalog
// symbol gets its own mutex at construction; reads copy a snapshot under that
// mutex and score it outside.
class ConfluenceEngine {
public:
    explicit ConfluenceEngine(domain::EngineSettings settings = {},
                              std::shared_ptr<domain::contracts::IStateRepository> repository = nullptr);

    ConfluenceEngine(const ConfluenceEngine&) = delete;
    ConfluenceEngine& operator=(const ConfluenceEngine&) = delete;

    core::WriteResult ingest(const domain::ExtractionRecord& record);
    BatchSummary ingestBatch(const std::vector<domain::ExtractionRecord>& records);

    std::vector<SymbolSummary> listSymbols(domain::Timestamp now) const;
    std::optional<SymbolDetail> getSymbol(std::string_view symbol, domain::Timestamp now) const;

    // nullopt when the symbol is outside the catalog.
    std::optional<std::vector<AnnotatedLevel>> levels(std::string_view symbol,
                                                      std::optional<domain::Source> source,
                                                      domain::Timestamp now) const;

    // Aligned, high-confluence symbols, best score first.
    std::vector<domain::ConfluenceState> opportunities(domain::Timestamp now) const;

    std::optional<domain::PriceLevel> dismissLevel(std::string_view symbol, std::uint64_t id);

    // Manual correction of one level. NotFound covers symbols outside the catalog.
    core::LevelEditResult updateLevel(std::string_view symbol, std::uint64_t id, const core::LevelEdit& edit);

    // Loads persisted state from the repository. Returns the number of rows applied.
    std::size_t restore();

    const domain::SymbolNormalizer& normalizer() const noexcept { return normalizer_; }
    const domain::EngineSettings& settings() const noexcept { return settings_; }

private:
    struct Snapshot {
        std::vector<domain::SourceView> views;
        std::vector<domain::PriceLevel> levels;
    };

    std::mutex& lockFor(const domain::Symbol& symbol) const;
    Snapshot snapshot(const domain::Symbol& symbol) const;
    domain::ConfluenceState evaluate(const domain::Symbol& symbol,
                                     const Snapshot& snapshot,
                                     domain::Timestamp now) const;
    std::vector<AnnotatedView> annotate(const std::vector<domain::SourceView>& views, domain::Timestamp now) const;

    core::WriteResult ingestLocked(const domain::Symbol& symbol, const domain::ExtractionRecord& record);
    void persist(const std::vector<domain::PriceLevel>& levels);
    void persist(const domain::SourceView& view);

    domain::SymbolNormalizer normalizer_;
    domain::EngineSettings settings_;
    core::StalenessEvaluator evaluator_;
    core::LevelStore levels_;
    core::SourceViewStore views_;
    core::ConfluenceScorer scorer_;
    core::TradeSetupSynthesizer synthesizer_;
    std::shared_ptr<domain::contracts::IStateRepository> repository_;
    std::unordered_map<domain::Symbol, std::unique_ptr<std::mutex>> locks_;
};

}  // namespace app

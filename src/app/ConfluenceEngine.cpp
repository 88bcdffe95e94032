#include "app/ConfluenceEngine.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace app {
namespace {

constexpr std::size_t kMaxBatchErrors = 20;

core::WriteResult rejected(std::string reason) {
    core::WriteResult result;
    result.outcome = core::WriteOutcome::Rejected;
    result.reason = std::move(reason);
    return result;
}

void countOutcome(core::WriteOutcome outcome) {
    cfe::common::metrics::Registry::instance().incrementCounter(
        "ingest." + std::string(core::writeOutcomeToString(outcome)));
}

}  // namespace

void BatchSummary::add(const core::WriteResult& result) {
    switch (result.outcome) {
    case core::WriteOutcome::Inserted:
        ++inserted;
        break;
    case core::WriteOutcome::Merged:
        ++merged;
        break;
    case core::WriteOutcome::Upserted:
        ++upserted;
        break;
    case core::WriteOutcome::StaleWriteIgnored:
        ++staleIgnored;
        break;
    case core::WriteOutcome::Rejected:
        ++rejected;
        if (errors.size() < kMaxBatchErrors) {
            errors.push_back(result.reason);
        }
        break;
    }
}

ConfluenceEngine::ConfluenceEngine(domain::EngineSettings settings,
                                   std::shared_ptr<domain::contracts::IStateRepository> repository)
    : settings_(settings),
      evaluator_(settings_.staleness),
      levels_(normalizer_.catalog(), settings_.levels),
      views_(normalizer_.catalog()),
      scorer_(evaluator_, settings_.scoring, settings_.levels.mergeTolerance),
      synthesizer_(evaluator_),
      repository_(std::move(repository)) {
    locks_.reserve(normalizer_.catalog().size());
    for (const auto& symbol : normalizer_.catalog()) {
        locks_.emplace(symbol, std::make_unique<std::mutex>());
    }
}

std::mutex& ConfluenceEngine::lockFor(const domain::Symbol& symbol) const {
    const auto it = locks_.find(symbol);
    if (it == locks_.end()) {
        throw std::out_of_range("no lock for symbol " + symbol);
    }
    return *it->second;
}

core::WriteResult ConfluenceEngine::ingest(const domain::ExtractionRecord& record) {
    const auto symbol = normalizer_.normalize(record.symbolText);
    core::WriteResult result;
    if (!symbol) {
        result = rejected("unrecognized symbol '" + record.symbolText + "'");
    } else if (record.observedAt > domain::Clock::now() + settings_.maxFutureSkew) {
        result = rejected("observed_at too far in the future (" + std::to_string(domain::toEpochMs(record.observedAt))
                          + " ms)");
    } else {
        std::lock_guard<std::mutex> lock(lockFor(*symbol));
        result = ingestLocked(*symbol, record);
    }

    countOutcome(result.outcome);
    if (result.outcome == core::WriteOutcome::Rejected) {
        LOG_WARN("Rejected " << domain::sourceToString(record.source) << " record content_id="
                             << record.contentId << ": " << result.reason);
    } else if (result.outcome == core::WriteOutcome::StaleWriteIgnored) {
        LOG_DEBUG("Ignored stale " << domain::sourceToString(record.source) << " record for "
                                   << record.symbolText << " content_id=" << record.contentId);
    }
    return result;
}

core::WriteResult ConfluenceEngine::ingestLocked(const domain::Symbol& symbol,
                                                 const domain::ExtractionRecord& record) {
    if (record.kind == domain::RecordKind::Level) {
        if (!record.level) {
            return rejected("level record without level_fields");
        }
        auto written = levels_.ingest(symbol, record.source, *record.level, record.contentId, record.observedAt);
        persist(written.changed);
        return written;
    }

    if (!record.view) {
        return rejected("view record without view_fields");
    }
    auto written = views_.upsert(symbol, record.source, *record.view, record.contentId, record.observedAt);
    if (written.stored) {
        persist(*written.stored);
        // Fresh commentary from a source re-confirms the levels it already gave.
        persist(levels_.confirmSource(symbol, record.source, record.observedAt));
    }
    return written;
}

BatchSummary ConfluenceEngine::ingestBatch(const std::vector<domain::ExtractionRecord>& records) {
    BatchSummary summary;
    for (const auto& record : records) {
        summary.add(ingest(record));
    }
    LOG_INFO("Ingested batch of " << records.size() << " records: inserted=" << summary.inserted
                                  << " merged=" << summary.merged << " upserted=" << summary.upserted
                                  << " stale=" << summary.staleIgnored << " rejected=" << summary.rejected);
    return summary;
}

void ConfluenceEngine::persist(const std::vector<domain::PriceLevel>& levels) {
    if (!repository_) {
        return;
    }
    for (const auto& level : levels) {
        try {
            repository_->saveLevel(level);
        } catch (const std::exception& ex) {
            cfe::common::metrics::Registry::instance().incrementCounter("storage.errors");
            LOG_ERR("Failed to persist level id=" << level.id << " symbol=" << level.symbol << ": " << ex.what());
        }
    }
}

void ConfluenceEngine::persist(const domain::SourceView& view) {
    if (!repository_) {
        return;
    }
    try {
        repository_->saveView(view);
    } catch (const std::exception& ex) {
        cfe::common::metrics::Registry::instance().incrementCounter("storage.errors");
        LOG_ERR("Failed to persist " << domain::sourceToString(view.source) << " view for " << view.symbol
                                     << ": " << ex.what());
    }
}

ConfluenceEngine::Snapshot ConfluenceEngine::snapshot(const domain::Symbol& symbol) const {
    std::lock_guard<std::mutex> lock(lockFor(symbol));
    return Snapshot{views_.views(symbol), levels_.levels(symbol)};
}

domain::ConfluenceState ConfluenceEngine::evaluate(const domain::Symbol& symbol,
                                                   const Snapshot& snapshot,
                                                   domain::Timestamp now) const {
    auto state = scorer_.score(symbol, snapshot.views, snapshot.levels, now);
    state.tradeSetup = synthesizer_.synthesize(state, snapshot.views, snapshot.levels, now);
    return state;
}

std::vector<AnnotatedView> ConfluenceEngine::annotate(const std::vector<domain::SourceView>& views,
                                                      domain::Timestamp now) const {
    std::vector<AnnotatedView> out;
    out.reserve(views.size());
    for (const auto& view : views) {
        out.push_back(AnnotatedView{view, evaluator_.evaluate(view, now)});
    }
    return out;
}

std::vector<SymbolSummary> ConfluenceEngine::listSymbols(domain::Timestamp now) const {
    std::vector<SymbolSummary> out;
    out.reserve(normalizer_.catalog().size());
    for (const auto& symbol : normalizer_.catalog()) {
        const auto snap = snapshot(symbol);

        SymbolSummary summary;
        summary.symbol = symbol;
        summary.views = annotate(snap.views, now);
        summary.confluence = evaluate(symbol, snap, now);
        summary.activeLevelCount = static_cast<std::size_t>(
            std::count_if(snap.levels.begin(), snap.levels.end(), [&](const domain::PriceLevel& level) {
                return evaluator_.evaluate(level, now) != domain::Staleness::Expired;
            }));
        out.push_back(std::move(summary));
    }
    return out;
}

std::optional<SymbolDetail> ConfluenceEngine::getSymbol(std::string_view symbol, domain::Timestamp now) const {
    const auto canonical = normalizer_.catalogMember(symbol);
    if (!canonical) {
        return std::nullopt;
    }

    const auto snap = snapshot(*canonical);

    SymbolDetail detail;
    detail.symbol = *canonical;
    detail.views = annotate(snap.views, now);
    detail.levels.reserve(snap.levels.size());
    for (const auto& level : snap.levels) {
        detail.levels.push_back(
            AnnotatedLevel{level, evaluator_.evaluate(level, now), levels_.isLowConfidence(level)});
    }
    detail.confluence = evaluate(*canonical, snap, now);
    return detail;
}

std::optional<std::vector<AnnotatedLevel>> ConfluenceEngine::levels(std::string_view symbol,
                                                                    std::optional<domain::Source> source,
                                                                    domain::Timestamp now) const {
    const auto canonical = normalizer_.catalogMember(symbol);
    if (!canonical) {
        return std::nullopt;
    }

    std::vector<domain::PriceLevel> stored;
    {
        std::lock_guard<std::mutex> lock(lockFor(*canonical));
        stored = levels_.levels(*canonical);
    }

    std::vector<AnnotatedLevel> out;
    for (const auto& level : stored) {
        if (source && level.source != *source) {
            continue;
        }
        out.push_back(AnnotatedLevel{level, evaluator_.evaluate(level, now), levels_.isLowConfidence(level)});
    }
    return out;
}

std::vector<domain::ConfluenceState> ConfluenceEngine::opportunities(domain::Timestamp now) const {
    std::vector<domain::ConfluenceState> out;
    for (const auto& symbol : normalizer_.catalog()) {
        auto state = evaluate(symbol, snapshot(symbol), now);
        if (state.aligned && state.classification == domain::Classification::High) {
            out.push_back(std::move(state));
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.score > rhs.score;
    });
    return out;
}

std::optional<domain::PriceLevel> ConfluenceEngine::dismissLevel(std::string_view symbol, std::uint64_t id) {
    const auto canonical = normalizer_.catalogMember(symbol);
    if (!canonical) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(lockFor(*canonical));
    auto dismissed = levels_.dismiss(*canonical, id);
    if (dismissed) {
        LOG_INFO("Dismissed level id=" << id << " on " << *canonical);
        persist(std::vector<domain::PriceLevel>{*dismissed});
    }
    return dismissed;
}

core::LevelEditResult ConfluenceEngine::updateLevel(std::string_view symbol,
                                                    std::uint64_t id,
                                                    const core::LevelEdit& edit) {
    const auto canonical = normalizer_.catalogMember(symbol);
    if (!canonical) {
        return core::LevelEditResult{};
    }

    std::lock_guard<std::mutex> lock(lockFor(*canonical));
    auto edited = levels_.update(*canonical, id, edit);
    if (edited.status == core::EditStatus::Updated) {
        LOG_INFO("Edited level id=" << id << " on " << *canonical << " (" << edited.changed.size() - 1U
                                    << " absorbed)");
        persist(edited.changed);
    }
    return edited;
}

std::size_t ConfluenceEngine::restore() {
    if (!repository_) {
        return 0;
    }

    const auto state = repository_->loadAll();
    std::size_t applied = 0;
    for (const auto& level : state.levels) {
        if (locks_.count(level.symbol) == 0U) {
            LOG_WARN("Skipping persisted level id=" << level.id << " for unknown symbol " << level.symbol);
            continue;
        }
        std::lock_guard<std::mutex> lock(lockFor(level.symbol));
        levels_.restore(level);
        ++applied;
    }
    for (const auto& view : state.views) {
        if (locks_.count(view.symbol) == 0U) {
            LOG_WARN("Skipping persisted view for unknown symbol " << view.symbol);
            continue;
        }
        std::lock_guard<std::mutex> lock(lockFor(view.symbol));
        views_.restore(view);
        ++applied;
    }
    LOG_INFO("Restored " << applied << " persisted rows");
    return applied;
}

}  // namespace app

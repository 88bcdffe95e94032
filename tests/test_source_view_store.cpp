#include <chrono>
#include <iostream>

#include "core/SourceViewStore.hpp"
#include "domain/SymbolNormalizer.hpp"

int main() {
    using namespace std::chrono_literals;

    const auto t0 = domain::fromEpochMs(1'700'000'000'000LL);
    core::SourceViewStore store(domain::SymbolNormalizer::trackedSymbols());

    // Bias derived from the quadrant when absent.
    {
        domain::ViewFields fields;
        fields.quadrant = domain::Quadrant::BuyCall;
        fields.ivRegime = domain::IvRegime::Cheap;
        const auto result = store.upsert("SPX", domain::Source::Discord, fields, "d1", t0);
        if (result.outcome != core::WriteOutcome::Upserted || !result.stored
            || result.stored->bias != domain::Bias::Bullish) {
            std::cerr << "Expected buy_call to derive a bullish bias\n";
            return 1;
        }

        fields.quadrant = domain::Quadrant::SellCall;
        store.upsert("QQQ", domain::Source::Discord, fields, "d2", t0);
        if (store.view("QQQ", domain::Source::Discord)->bias != domain::Bias::Bearish) {
            std::cerr << "Expected sell_call to derive a bearish bias\n";
            return 1;
        }
    }

    // Explicit bias wins over the quadrant.
    {
        domain::ViewFields fields;
        fields.bias = domain::Bias::Neutral;
        fields.quadrant = domain::Quadrant::BuyPut;
        store.upsert("IWM", domain::Source::Macro42, fields, "m1", t0);
        if (store.view("IWM", domain::Source::Macro42)->bias != domain::Bias::Neutral) {
            std::cerr << "Explicit bias should not be overridden by the quadrant\n";
            return 1;
        }
    }

    // Last write wins by observation time; equal or older writes are ignored.
    {
        domain::ViewFields bullish;
        bullish.bias = domain::Bias::Bullish;
        bullish.strategy = "buy dips";
        store.upsert("NVDA", domain::Source::KtTechnical, bullish, "k1", t0 + 1h);

        domain::ViewFields bearish;
        bearish.bias = domain::Bias::Bearish;
        const auto equal = store.upsert("NVDA", domain::Source::KtTechnical, bearish, "k2", t0 + 1h);
        const auto older = store.upsert("NVDA", domain::Source::KtTechnical, bearish, "k3", t0);
        if (equal.outcome != core::WriteOutcome::StaleWriteIgnored
            || older.outcome != core::WriteOutcome::StaleWriteIgnored) {
            std::cerr << "Expected equal and older writes to be ignored\n";
            return 1;
        }

        const auto newer = store.upsert("NVDA", domain::Source::KtTechnical, bearish, "k4", t0 + 2h);
        const auto stored = store.view("NVDA", domain::Source::KtTechnical);
        if (newer.outcome != core::WriteOutcome::Upserted || stored->bias != domain::Bias::Bearish
            || stored->strategy || stored->contentId != "k4" || stored->lastUpdatedAt != t0 + 2h) {
            std::cerr << "Newer write should replace the view wholesale\n";
            return 1;
        }
    }

    // Confidence outside [0,1] and unknown symbols are rejected.
    {
        domain::ViewFields fields;
        fields.bias = domain::Bias::Bullish;
        fields.confidence = 1.2;
        if (store.upsert("TSLA", domain::Source::Twitter, fields, "t", t0).outcome != core::WriteOutcome::Rejected) {
            std::cerr << "Expected confidence 1.2 to be rejected\n";
            return 1;
        }
        fields.confidence = 0.5;
        if (store.upsert("DOGE", domain::Source::Twitter, fields, "t", t0).outcome != core::WriteOutcome::Rejected) {
            std::cerr << "Expected unknown symbol to be rejected\n";
            return 1;
        }
        if (store.view("TSLA", domain::Source::Twitter)) {
            std::cerr << "Rejected view must not be stored\n";
            return 1;
        }
    }

    // Views come back in source order, one per source.
    {
        domain::ViewFields fields;
        fields.bias = domain::Bias::Bullish;
        store.upsert("AAPL", domain::Source::Youtube, fields, "y", t0);
        store.upsert("AAPL", domain::Source::KtTechnical, fields, "k", t0);
        store.upsert("AAPL", domain::Source::Discord, fields, "d", t0);
        const auto views = store.views("AAPL");
        if (views.size() != 3U || views[0].source != domain::Source::KtTechnical
            || views[1].source != domain::Source::Discord || views[2].source != domain::Source::Youtube) {
            std::cerr << "Views not returned in source order\n";
            return 1;
        }
    }

    return 0;
}

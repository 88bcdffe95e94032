#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "app/ConfluenceEngine.hpp"

namespace {

const auto kBase = domain::fromEpochMs(1'700'000'000'000LL);

domain::ExtractionRecord levelRecord(const std::string& symbol, domain::Source source, double price, int seq) {
    domain::ExtractionRecord record;
    record.symbolText = symbol;
    record.source = source;
    record.kind = domain::RecordKind::Level;
    domain::LevelFields fields;
    fields.type = domain::LevelType::Support;
    fields.price = price;
    fields.confidence = 0.6;
    record.level = fields;
    record.contentId = symbol + "-" + std::to_string(seq);
    record.observedAt = kBase + std::chrono::milliseconds(seq);
    return record;
}

}  // namespace

int main() {
    app::ConfluenceEngine engine;
    constexpr int kThreads = 8;
    constexpr int kWritesPerThread = 200;

    const std::vector<std::string> symbols{"SPX", "QQQ", "IWM", "BTC"};
    std::atomic<int> failures{0};
    std::atomic<bool> stop{false};

    // A reader hammering the aggregate endpoints while writers run.
    std::thread reader([&] {
        while (!stop.load()) {
            const auto summaries = engine.listSymbols(kBase);
            if (summaries.size() != 11U) {
                failures.fetch_add(1);
            }
            engine.opportunities(kBase);
        }
    });

    std::vector<std::thread> writers;
    for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([&, t] {
            const auto& symbol = symbols[static_cast<std::size_t>(t) % symbols.size()];
            // Two threads per symbol; each owns its own source so both series
            // land in distinct partitions of the same symbol.
            const auto source = t < static_cast<int>(symbols.size()) ? domain::Source::KtTechnical
                                                                     : domain::Source::Discord;
            for (int i = 0; i < kWritesPerThread; ++i) {
                // Alternate between two prices far enough apart to stay distinct.
                const double price = (i % 2 == 0) ? 100.0 : 200.0;
                const auto result = engine.ingest(levelRecord(symbol, source, price, i));
                if (result.outcome == core::WriteOutcome::Rejected) {
                    failures.fetch_add(1);
                }
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    stop.store(true);
    reader.join();

    if (failures.load() != 0) {
        std::cerr << "Concurrent ingest produced " << failures.load() << " failures\n";
        return 1;
    }

    for (const auto& symbol : symbols) {
        const auto levels = engine.levels(symbol, std::nullopt, kBase);
        if (!levels || levels->size() != 4U) {
            std::cerr << "Expected 4 levels on " << symbol << ", got " << (levels ? levels->size() : 0U) << '\n';
            return 1;
        }
        for (const auto& annotated : *levels) {
            if (annotated.level.price != 100.0 && annotated.level.price != 200.0) {
                std::cerr << "Level price drifted on " << symbol << '\n';
                return 1;
            }
            if (annotated.level.lastConfirmedAt != kBase + std::chrono::milliseconds(kWritesPerThread - 1)
                && annotated.level.lastConfirmedAt != kBase + std::chrono::milliseconds(kWritesPerThread - 2)) {
                std::cerr << "Lost update on " << symbol << '\n';
                return 1;
            }
        }
    }

    // Same symbol, same source, many threads: exactly one level survives.
    {
        app::ConfluenceEngine shared;
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&shared, t] {
                for (int i = 0; i < kWritesPerThread; ++i) {
                    shared.ingest(levelRecord("NVDA", domain::Source::Youtube, 120.0, t * kWritesPerThread + i));
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        const auto levels = shared.levels("NVDA", std::nullopt, kBase);
        if (!levels || levels->size() != 1U || levels->front().level.price != 120.0) {
            std::cerr << "Concurrent identical writes must collapse into one level\n";
            return 1;
        }
    }

    return 0;
}

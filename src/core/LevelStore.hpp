#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/WriteOutcome.hpp"
#include "domain/Models.hpp"
#include "domain/Settings.hpp"

namespace core {

struct LevelWriteResult : WriteResult {
    // Every stored level touched by the write (the merge target plus any level
    // it absorbed), in the state it was left in.
    std::vector<domain::PriceLevel> changed;
};

// Manual correction of a stored level. Unset fields are left as they are.
struct LevelEdit {
    std::optional<double> price;
    std::optional<domain::LevelType> type;
    std::optional<domain::LevelDirection> direction;
    std::optional<bool> active;
};

enum class EditStatus {
    Updated,
    NotFound,
    Invalid,
};

struct LevelEditResult {
    EditStatus status{EditStatus::NotFound};
    std::string reason;
    // The edited level first, then any level it absorbed.
    std::vector<domain::PriceLevel> changed;
};

// Deduplicated price levels per (symbol, source, type).
//
// Partitions for every catalog symbol are created up front and the map is
// never rehashed afterwards, so different symbols can be written from
// different threads. Calls for the same symbol must be serialized by the
// caller.
class LevelStore {
public:
    LevelStore(const std::vector<domain::Symbol>& catalog, domain::LevelSettings settings);

    LevelStore(const LevelStore&) = delete;
    LevelStore& operator=(const LevelStore&) = delete;

    LevelWriteResult ingest(const domain::Symbol& symbol,
                            domain::Source source,
                            const domain::LevelFields& fields,
                            const std::string& contentId,
                            domain::Timestamp observedAt);

    // Active levels for the symbol, price descending.
    [[nodiscard]] std::vector<domain::PriceLevel> levels(const domain::Symbol& symbol) const;

    // Marks an active level inactive. Returns the dismissed level, or nullopt
    // when the id is unknown for that symbol or already inactive.
    std::optional<domain::PriceLevel> dismiss(const domain::Symbol& symbol, std::uint64_t id);

    // Applies a manual edit. An edited level that is active absorbs every level
    // of its (source, type) now within tolerance; its edited price is kept.
    LevelEditResult update(const domain::Symbol& symbol, std::uint64_t id, const LevelEdit& edit);

    // New content from a source confirms that source's active levels: their
    // last_confirmed_at moves up to `observedAt`. Returns the levels touched.
    std::vector<domain::PriceLevel> confirmSource(const domain::Symbol& symbol,
                                                  domain::Source source,
                                                  domain::Timestamp observedAt);

    // Re-inserts a persisted level verbatim (used at startup).
    void restore(const domain::PriceLevel& level);

    [[nodiscard]] bool isLowConfidence(const domain::PriceLevel& level) const noexcept;
    [[nodiscard]] const domain::LevelSettings& settings() const noexcept { return settings_; }

    static bool withinTolerance(double price, double reference, double tolerance) noexcept;

private:
    using Partition = std::vector<domain::PriceLevel>;

    Partition* partition(const domain::Symbol& symbol);
    const Partition* partition(const domain::Symbol& symbol) const;

    std::string validate(const domain::LevelFields& fields) const;
    void mergeInto(domain::PriceLevel& target,
                   const domain::LevelFields& fields,
                   const std::string& contentId,
                   domain::Timestamp observedAt) const;
    void absorbNeighbours(Partition& levels,
                          std::size_t targetIndex,
                          std::vector<domain::PriceLevel>& changed,
                          std::optional<double> pinnedPrice = std::nullopt) const;
    std::string mergeContext(const std::string& current,
                             const std::string& incoming,
                             bool incomingWins) const;

    domain::LevelSettings settings_;
    std::unordered_map<domain::Symbol, Partition> partitions_;
    std::atomic<std::uint64_t> nextId_{1};
};

}  // namespace core

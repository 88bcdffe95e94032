#pragma once

#include <array>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/WriteOutcome.hpp"
#include "domain/Models.hpp"

namespace core {

struct ViewWriteResult : WriteResult {
    std::optional<domain::SourceView> stored;
};

// One current view per (symbol, source), last write wins by observation time.
// Same threading contract as LevelStore: the slot table is fixed at
// construction and writes to one symbol are serialized by the caller.
class SourceViewStore {
public:
    explicit SourceViewStore(const std::vector<domain::Symbol>& catalog);

    SourceViewStore(const SourceViewStore&) = delete;
    SourceViewStore& operator=(const SourceViewStore&) = delete;

    ViewWriteResult upsert(const domain::Symbol& symbol,
                           domain::Source source,
                           const domain::ViewFields& fields,
                           const std::string& contentId,
                           domain::Timestamp observedAt);

    // Stored views for the symbol in source order.
    [[nodiscard]] std::vector<domain::SourceView> views(const domain::Symbol& symbol) const;
    [[nodiscard]] std::optional<domain::SourceView> view(const domain::Symbol& symbol,
                                                         domain::Source source) const;

    void restore(const domain::SourceView& view);

private:
    using Slots = std::array<std::optional<domain::SourceView>, domain::kAllSources.size()>;

    Slots* slots(const domain::Symbol& symbol);
    const Slots* slots(const domain::Symbol& symbol) const;

    std::unordered_map<domain::Symbol, Slots> slots_;
};

}  // namespace core

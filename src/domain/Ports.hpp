#pragma once

#include <vector>

#include "domain/Models.hpp"

namespace domain::contracts {

struct PersistedState {
    std::vector<PriceLevel> levels;
    std::vector<SourceView> views;
};

// Write-through storage for stored levels and views. Called under the
// owning symbol's lock, so implementations see writes for one symbol in
// order but must tolerate concurrent calls for different symbols.
class IStateRepository {
public:
    virtual ~IStateRepository() = default;

    virtual void saveLevel(const PriceLevel& level) = 0;
    virtual void saveView(const SourceView& view) = 0;

    // Everything previously saved, inactive levels included.
    virtual PersistedState loadAll() const = 0;
};

}  // namespace domain::contracts

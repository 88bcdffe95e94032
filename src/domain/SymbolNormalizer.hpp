#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "domain/Models.hpp"

namespace domain {

// Resolves free-form instrument mentions (tickers, company names, index
// nicknames, futures notation) to the closed catalog of tracked symbols.
// Lookups are pure and never throw; unknown text resolves to std::nullopt.
class SymbolNormalizer {
public:
    SymbolNormalizer();

    [[nodiscard]] std::optional<Symbol> normalize(std::string_view text) const;

    // Exact catalog membership, ignoring case and surrounding whitespace.
    // Aliases are not consulted.
    [[nodiscard]] std::optional<Symbol> catalogMember(std::string_view text) const;

    [[nodiscard]] const std::vector<Symbol>& catalog() const noexcept { return catalog_; }

    static const std::vector<Symbol>& trackedSymbols();

private:
    [[nodiscard]] std::optional<Symbol> lookup(const std::string& key) const;

    std::vector<Symbol> catalog_;
    std::unordered_set<std::string> catalogSet_;
    std::unordered_map<std::string, Symbol> aliases_;
};

}  // namespace domain

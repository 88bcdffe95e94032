#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "domain/SymbolNormalizer.hpp"

int main() {
    domain::SymbolNormalizer normalizer;

    const std::vector<std::pair<std::string, std::string>> resolved{
        {"SPX", "SPX"},
        {"  spx ", "SPX"},
        {"/ES", "SPX"},
        {"ES=F", "SPX"},
        {"es_f", "SPX"},
        {"/MES", "SPX"},
        {"MES=F", "SPX"},
        {"S&P 500", "SPX"},
        {"spy", "SPX"},
        {"/NQ", "QQQ"},
        {"NQ=F", "QQQ"},
        {"MNQ", "QQQ"},
        {"Nasdaq 100", "QQQ"},
        {"QS", "QQQ"},
        {"/RTY", "IWM"},
        {"RTY=F", "IWM"},
        {"/M2K", "IWM"},
        {"russell 2000", "IWM"},
        {"RUT", "IWM"},
        {"/BTC", "BTC"},
        {"Bitcoin", "BTC"},
        {"btcusd", "BTC"},
        {"semis", "SMH"},
        {"Google", "GOOGL"},
        {"GOOG", "GOOGL"},
        {"Alphabet", "GOOGL"},
        {"apple", "AAPL"},
        {"Amazon", "AMZN"},
        {"microsoft", "MSFT"},
        {"TESLA", "TSLA"},
        {"Nvidia", "NVDA"},
        {"\tnvda\n", "NVDA"},
    };

    for (const auto& [input, expected] : resolved) {
        const auto actual = normalizer.normalize(input);
        if (!actual || *actual != expected) {
            std::cerr << "Expected '" << input << "' to resolve to " << expected << " but got "
                      << (actual ? *actual : std::string{"<none>"}) << "\n";
            return 1;
        }
    }

    for (const std::string input : {"", "   ", "XYZ", "ETH", "/", "//ES", "SPXX", "S & P"}) {
        if (const auto actual = normalizer.normalize(input)) {
            std::cerr << "Expected '" << input << "' to be unrecognized but got " << *actual << "\n";
            return 1;
        }
    }

    // Every catalog member resolves to itself.
    for (const auto& symbol : domain::SymbolNormalizer::trackedSymbols()) {
        const auto actual = normalizer.normalize(symbol);
        if (!actual || *actual != symbol) {
            std::cerr << "Catalog symbol " << symbol << " did not resolve to itself\n";
            return 1;
        }
    }

    if (normalizer.catalog().size() != 11U || normalizer.catalog().front() != "SPX"
        || normalizer.catalog().back() != "AMZN") {
        std::cerr << "Unexpected catalog contents\n";
        return 1;
    }

    // Catalog membership ignores aliases.
    if (!normalizer.catalogMember(" qqq ") || normalizer.catalogMember("NASDAQ")) {
        std::cerr << "catalogMember should accept catalog symbols only\n";
        return 1;
    }

    return 0;
}

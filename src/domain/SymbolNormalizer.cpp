#include "domain/SymbolNormalizer.hpp"

#include <cctype>
#include <iterator>
#include <utility>

namespace domain {
namespace {

constexpr char kContractMarker = '/';

struct AliasEntry {
    const char* alias;
    const char* symbol;
};

// One raw mention maps to exactly one symbol. Collisions (ES, SP, QS, GOOG)
// are settled here, not at lookup time.
constexpr AliasEntry kAliases[] = {
    // Company names and share classes
    {"GOOGLE", "GOOGL"},
    {"GOOG", "GOOGL"},
    {"ALPHABET", "GOOGL"},
    {"APPLE", "AAPL"},
    {"AMAZON", "AMZN"},
    {"MICROSOFT", "MSFT"},
    {"TESLA", "TSLA"},
    {"NVIDIA", "NVDA"},

    // S&P 500
    {"S&P", "SPX"},
    {"S&P 500", "SPX"},
    {"S&P500", "SPX"},
    {"SP500", "SPX"},
    {"SPY", "SPX"},
    {"ES", "SPX"},
    {"SP", "SPX"},
    {"ES=F", "SPX"},
    {"ES_F", "SPX"},
    {"SP=F", "SPX"},
    {"MES", "SPX"},
    {"MES=F", "SPX"},
    {"MES_F", "SPX"},

    // Nasdaq 100
    {"NASDAQ", "QQQ"},
    {"NASDAQ 100", "QQQ"},
    {"NASDAQ100", "QQQ"},
    {"NDX", "QQQ"},
    {"NQ", "QQQ"},
    {"QS", "QQQ"},
    {"NQ=F", "QQQ"},
    {"NQ_F", "QQQ"},
    {"MNQ", "QQQ"},
    {"MNQ=F", "QQQ"},
    {"MNQ_F", "QQQ"},

    // Russell 2000
    {"RUSSELL", "IWM"},
    {"RUSSELL 2000", "IWM"},
    {"RUSSELL2000", "IWM"},
    {"RTY", "IWM"},
    {"RUT", "IWM"},
    {"RTY=F", "IWM"},
    {"RTY_F", "IWM"},
    {"M2K", "IWM"},
    {"M2K=F", "IWM"},
    {"M2K_F", "IWM"},

    // Bitcoin
    {"BITCOIN", "BTC"},
    {"BTCUSD", "BTC"},
    {"BTC-USD", "BTC"},
    {"BTCUSDT", "BTC"},
    {"BTC=F", "BTC"},
    {"BTC_F", "BTC"},
    {"MBT", "BTC"},

    // Semiconductors
    {"SEMIS", "SMH"},
    {"SEMICONDUCTORS", "SMH"},
};

const char* kCatalog[] = {
    "SPX", "QQQ", "IWM", "BTC", "SMH", "NVDA", "TSLA", "GOOGL", "AAPL", "MSFT", "AMZN",
};

std::string canonicalKey(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }

    std::string key;
    key.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) {
        key.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(text[i]))));
    }
    return key;
}

}  // namespace

SymbolNormalizer::SymbolNormalizer() {
    catalog_.reserve(sizeof(kCatalog) / sizeof(kCatalog[0]));
    for (const char* symbol : kCatalog) {
        catalog_.emplace_back(symbol);
        catalogSet_.emplace(symbol);
    }
    aliases_.reserve(sizeof(kAliases) / sizeof(kAliases[0]));
    for (const auto& entry : kAliases) {
        aliases_.emplace(entry.alias, entry.symbol);
    }
}

const std::vector<Symbol>& SymbolNormalizer::trackedSymbols() {
    static const std::vector<Symbol> symbols(std::begin(kCatalog), std::end(kCatalog));
    return symbols;
}

std::optional<Symbol> SymbolNormalizer::normalize(std::string_view text) const {
    const auto key = canonicalKey(text);
    if (key.empty()) {
        return std::nullopt;
    }

    if (auto resolved = lookup(key)) {
        return resolved;
    }

    if (key.front() == kContractMarker && key.size() > 1) {
        return lookup(key.substr(1));
    }
    return std::nullopt;
}

std::optional<Symbol> SymbolNormalizer::catalogMember(std::string_view text) const {
    auto key = canonicalKey(text);
    if (catalogSet_.count(key) != 0U) {
        return key;
    }
    return std::nullopt;
}

std::optional<Symbol> SymbolNormalizer::lookup(const std::string& key) const {
    if (catalogSet_.count(key) != 0U) {
        return key;
    }
    const auto it = aliases_.find(key);
    if (it != aliases_.end()) {
        return it->second;
    }
    return std::nullopt;
}

}  // namespace domain

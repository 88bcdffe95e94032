#include "core/LevelStore.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace core {
namespace {

constexpr const char* kContextSeparator = " | ";

domain::LevelFields fieldsOf(const domain::PriceLevel& level) {
    domain::LevelFields fields;
    fields.type = level.type;
    fields.price = level.price;
    fields.priceUpper = level.priceUpper;
    fields.direction = level.direction;
    fields.fib = level.fib;
    fields.confidence = level.confidence;
    fields.context = level.context;
    fields.invalidationPrice = level.invalidationPrice;
    return fields;
}

template <typename T>
void takeOptional(std::optional<T>& current, const std::optional<T>& incoming, bool incomingWins) {
    if (!incoming) {
        return;
    }
    if (incomingWins || !current) {
        current = incoming;
    }
}

}  // namespace

LevelStore::LevelStore(const std::vector<domain::Symbol>& catalog, domain::LevelSettings settings)
    : settings_(settings) {
    partitions_.reserve(catalog.size());
    for (const auto& symbol : catalog) {
        partitions_.emplace(symbol, Partition{});
    }
}

bool LevelStore::withinTolerance(double price, double reference, double tolerance) noexcept {
    if (reference <= 0.0) {
        return false;
    }
    return std::fabs(price - reference) <= tolerance * reference;
}

LevelStore::Partition* LevelStore::partition(const domain::Symbol& symbol) {
    const auto it = partitions_.find(symbol);
    return it != partitions_.end() ? &it->second : nullptr;
}

const LevelStore::Partition* LevelStore::partition(const domain::Symbol& symbol) const {
    const auto it = partitions_.find(symbol);
    return it != partitions_.end() ? &it->second : nullptr;
}

std::string LevelStore::validate(const domain::LevelFields& fields) const {
    if (!std::isfinite(fields.price) || fields.price <= 0.0) {
        std::ostringstream oss;
        oss << "price must be positive (got " << fields.price << ')';
        return oss.str();
    }
    if (!std::isfinite(fields.confidence) || fields.confidence < 0.0 || fields.confidence > 1.0) {
        std::ostringstream oss;
        oss << "confidence outside [0,1] (got " << fields.confidence << ')';
        return oss.str();
    }
    if (fields.priceUpper && (!std::isfinite(*fields.priceUpper) || *fields.priceUpper <= fields.price)) {
        return "price_upper must be above price";
    }
    if (fields.invalidationPrice
        && (!std::isfinite(*fields.invalidationPrice) || *fields.invalidationPrice <= 0.0)) {
        return "invalidation_price must be positive";
    }
    return {};
}

LevelWriteResult LevelStore::ingest(const domain::Symbol& symbol,
                                    domain::Source source,
                                    const domain::LevelFields& fields,
                                    const std::string& contentId,
                                    domain::Timestamp observedAt) {
    LevelWriteResult result;

    auto* levels = partition(symbol);
    if (levels == nullptr) {
        result.outcome = WriteOutcome::Rejected;
        result.reason = "symbol not tracked: " + symbol;
        return result;
    }

    if (auto error = validate(fields); !error.empty()) {
        result.outcome = WriteOutcome::Rejected;
        result.reason = std::move(error);
        return result;
    }

    std::optional<std::size_t> nearest;
    double nearestDistance = 0.0;
    for (std::size_t i = 0; i < levels->size(); ++i) {
        const auto& candidate = (*levels)[i];
        if (!candidate.active || candidate.source != source || candidate.type != fields.type) {
            continue;
        }
        if (!withinTolerance(fields.price, candidate.price, settings_.mergeTolerance)) {
            continue;
        }
        const double distance = std::fabs(fields.price - candidate.price);
        if (!nearest || distance < nearestDistance) {
            nearest = i;
            nearestDistance = distance;
        }
    }

    if (!nearest) {
        domain::PriceLevel level;
        level.id = nextId_.fetch_add(1U, std::memory_order_relaxed);
        level.symbol = symbol;
        level.source = source;
        level.type = fields.type;
        level.price = fields.price;
        level.priceUpper = fields.priceUpper;
        level.direction = fields.direction;
        level.fib = fields.fib;
        level.confidence = fields.confidence;
        level.context = fields.context.substr(0, settings_.maxContextLength);
        level.invalidationPrice = fields.invalidationPrice;
        level.contentId = contentId;
        level.createdAt = observedAt;
        level.lastConfirmedAt = observedAt;
        level.active = true;

        levels->push_back(level);
        result.outcome = WriteOutcome::Inserted;
        result.changed.push_back(std::move(level));
        return result;
    }

    auto& target = (*levels)[*nearest];
    if (observedAt < target.lastConfirmedAt) {
        result.outcome = WriteOutcome::StaleWriteIgnored;
        result.reason = "observation older than stored confirmation";
        return result;
    }

    // The confirmation already folded in: a replay must not pull the price again.
    if (observedAt == target.lastConfirmedAt && contentId == target.contentId) {
        result.outcome = WriteOutcome::Merged;
        result.reason = "confirmation already applied";
        return result;
    }

    mergeInto(target, fields, contentId, observedAt);
    result.outcome = WriteOutcome::Merged;
    absorbNeighbours(*levels, *nearest, result.changed);
    result.changed.insert(result.changed.begin(), (*levels)[*nearest]);
    return result;
}

void LevelStore::mergeInto(domain::PriceLevel& target,
                           const domain::LevelFields& fields,
                           const std::string& contentId,
                           domain::Timestamp observedAt) const {
    const double storedConfidence = target.confidence;
    const double incomingConfidence = fields.confidence;
    const bool incomingWins = incomingConfidence >= storedConfidence;

    const double weight = storedConfidence + incomingConfidence;
    if (weight > 0.0) {
        target.price = (target.price * storedConfidence + fields.price * incomingConfidence) / weight;
    } else {
        target.price = (target.price + fields.price) / 2.0;
    }

    target.context = mergeContext(target.context, fields.context, incomingConfidence > storedConfidence);

    takeOptional(target.priceUpper, fields.priceUpper, incomingWins);
    takeOptional(target.fib, fields.fib, incomingWins);
    takeOptional(target.invalidationPrice, fields.invalidationPrice, incomingWins);
    if (incomingWins) {
        target.direction = fields.direction;
    }
    if (target.priceUpper && *target.priceUpper <= target.price) {
        target.priceUpper.reset();
    }

    target.confidence = settings_.confidenceMerge == domain::ConfidenceMerge::KeepMax
                            ? std::max(storedConfidence, incomingConfidence)
                            : std::min(storedConfidence, incomingConfidence);
    target.lastConfirmedAt = std::max(target.lastConfirmedAt, observedAt);
    if (!contentId.empty()) {
        target.contentId = contentId;
    }
}

void LevelStore::absorbNeighbours(Partition& levels,
                                  std::size_t targetIndex,
                                  std::vector<domain::PriceLevel>& changed,
                                  std::optional<double> pinnedPrice) const {
    // The weighted price can drift into the band of another level of the same
    // kind; fold it in so no two active levels stay within tolerance.
    bool absorbed = true;
    while (absorbed) {
        absorbed = false;
        auto& target = levels[targetIndex];
        for (std::size_t i = 0; i < levels.size(); ++i) {
            if (i == targetIndex) {
                continue;
            }
            auto& other = levels[i];
            if (!other.active || other.source != target.source || other.type != target.type) {
                continue;
            }
            if (!withinTolerance(other.price, target.price, settings_.mergeTolerance)) {
                continue;
            }
            mergeInto(target, fieldsOf(other), std::string{}, other.lastConfirmedAt);
            if (pinnedPrice) {
                target.price = *pinnedPrice;
                if (target.priceUpper && *target.priceUpper <= target.price) {
                    target.priceUpper.reset();
                }
            }
            other.active = false;
            changed.push_back(other);
            absorbed = true;
            break;
        }
    }
}

std::string LevelStore::mergeContext(const std::string& current,
                                     const std::string& incoming,
                                     bool incomingWins) const {
    std::string merged;
    if (incoming.empty()) {
        merged = current;
    } else if (current.empty() || incomingWins) {
        merged = incoming;
    } else if (current.find(incoming) != std::string::npos) {
        merged = current;
    } else {
        merged = current + kContextSeparator + incoming;
    }

    if (merged.size() > settings_.maxContextLength) {
        merged.resize(settings_.maxContextLength);
    }
    return merged;
}

std::vector<domain::PriceLevel> LevelStore::levels(const domain::Symbol& symbol) const {
    std::vector<domain::PriceLevel> active;
    const auto* levels = partition(symbol);
    if (levels == nullptr) {
        return active;
    }

    active.reserve(levels->size());
    for (const auto& level : *levels) {
        if (level.active) {
            active.push_back(level);
        }
    }
    std::sort(active.begin(), active.end(), [](const auto& lhs, const auto& rhs) {
        if (lhs.price != rhs.price) {
            return lhs.price > rhs.price;
        }
        return lhs.id < rhs.id;
    });
    return active;
}

std::optional<domain::PriceLevel> LevelStore::dismiss(const domain::Symbol& symbol, std::uint64_t id) {
    auto* levels = partition(symbol);
    if (levels == nullptr) {
        return std::nullopt;
    }
    for (auto& level : *levels) {
        if (level.id == id && level.active) {
            level.active = false;
            return level;
        }
    }
    return std::nullopt;
}

LevelEditResult LevelStore::update(const domain::Symbol& symbol, std::uint64_t id, const LevelEdit& edit) {
    LevelEditResult result;
    auto* levels = partition(symbol);
    if (levels == nullptr) {
        return result;
    }

    const auto it = std::find_if(levels->begin(), levels->end(), [id](const domain::PriceLevel& level) {
        return level.id == id;
    });
    if (it == levels->end()) {
        return result;
    }
    const auto index = static_cast<std::size_t>(it - levels->begin());

    if (edit.price) {
        if (!std::isfinite(*edit.price) || *edit.price <= 0.0) {
            std::ostringstream oss;
            oss << "price must be positive (got " << *edit.price << ')';
            result.status = EditStatus::Invalid;
            result.reason = oss.str();
            return result;
        }
    }

    auto& level = (*levels)[index];
    if (edit.price) {
        level.price = *edit.price;
        if (level.priceUpper && *level.priceUpper <= level.price) {
            level.priceUpper.reset();
        }
    }
    if (edit.type) {
        level.type = *edit.type;
    }
    if (edit.direction) {
        level.direction = *edit.direction;
    }
    if (edit.active) {
        level.active = *edit.active;
    }

    result.status = EditStatus::Updated;
    if (level.active) {
        absorbNeighbours(*levels, index, result.changed, level.price);
    }
    result.changed.insert(result.changed.begin(), (*levels)[index]);
    return result;
}

std::vector<domain::PriceLevel> LevelStore::confirmSource(const domain::Symbol& symbol,
                                                          domain::Source source,
                                                          domain::Timestamp observedAt) {
    std::vector<domain::PriceLevel> touched;
    auto* levels = partition(symbol);
    if (levels == nullptr) {
        return touched;
    }
    for (auto& level : *levels) {
        if (!level.active || level.source != source || level.lastConfirmedAt >= observedAt) {
            continue;
        }
        level.lastConfirmedAt = observedAt;
        touched.push_back(level);
    }
    return touched;
}

void LevelStore::restore(const domain::PriceLevel& level) {
    auto* levels = partition(level.symbol);
    if (levels == nullptr) {
        return;
    }
    levels->push_back(level);

    auto expected = nextId_.load(std::memory_order_relaxed);
    while (expected <= level.id
           && !nextId_.compare_exchange_weak(expected, level.id + 1U, std::memory_order_relaxed)) {
    }
}

bool LevelStore::isLowConfidence(const domain::PriceLevel& level) const noexcept {
    return level.confidence < settings_.lowConfidenceFloor;
}

}  // namespace core

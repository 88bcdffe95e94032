#include "http/RecordCodec.hpp"

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/string.hpp>

namespace cfe::http {
namespace {

constexpr std::int64_t kMillisecondsThreshold = 1'000'000'000'000LL;
// 2200-01-01T00:00:00Z. Nanosecond time points stop at 2262.
constexpr std::int64_t kMaxEpochMs = 7'258'118'400'000LL;

domain::Timestamp boundedEpochMs(std::int64_t ms) {
    if (ms < 0 || ms >= kMaxEpochMs) {
        throw RecordDecodeError("field 'observed_at' out of range (" + std::to_string(ms) + " ms)");
    }
    return domain::fromEpochMs(ms);
}

const boost::json::value* field(const boost::json::object& object, std::string_view key) {
    const auto* found = object.if_contains(boost::json::string_view(key.data(), key.size()));
    if (found == nullptr || found->is_null()) {
        return nullptr;
    }
    return found;
}

std::string requireString(const boost::json::object& object, std::string_view key) {
    const auto* value = field(object, key);
    if (value == nullptr) {
        throw RecordDecodeError("missing field '" + std::string(key) + "'");
    }
    if (!value->is_string()) {
        throw RecordDecodeError("field '" + std::string(key) + "' must be a string");
    }
    const auto& text = value->get_string();
    return std::string(text.data(), text.size());
}

std::optional<std::string> optionalString(const boost::json::object& object, std::string_view key) {
    const auto* value = field(object, key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_string()) {
        const auto& text = value->get_string();
        return std::string(text.data(), text.size());
    }
    if (value->is_number()) {
        // Retracement labels are sometimes sent as bare numbers (0.618).
        return boost::json::serialize(*value);
    }
    throw RecordDecodeError("field '" + std::string(key) + "' must be a string");
}

double asDouble(const boost::json::value& value, std::string_view key) {
    if (value.is_double()) {
        return value.get_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.get_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.get_uint64());
    }
    throw RecordDecodeError("field '" + std::string(key) + "' must be a number");
}

std::optional<double> optionalDouble(const boost::json::object& object, std::string_view key) {
    const auto* value = field(object, key);
    if (value == nullptr) {
        return std::nullopt;
    }
    return asDouble(*value, key);
}

template <typename Enum>
Enum requireEnum(const boost::json::object& object,
                 std::string_view key,
                 std::optional<Enum> (*fromString)(std::string_view)) {
    const auto text = requireString(object, key);
    const auto parsed = fromString(text);
    if (!parsed) {
        throw RecordDecodeError("unknown " + std::string(key) + " '" + text + "'");
    }
    return *parsed;
}

template <typename Enum>
std::optional<Enum> optionalEnum(const boost::json::object& object,
                                 std::string_view key,
                                 std::optional<Enum> (*fromString)(std::string_view)) {
    if (field(object, key) == nullptr) {
        return std::nullopt;
    }
    return requireEnum(object, key, fromString);
}

const boost::json::object& requireObject(const boost::json::object& object, std::string_view key) {
    const auto* value = field(object, key);
    if (value == nullptr) {
        throw RecordDecodeError("missing field '" + std::string(key) + "'");
    }
    if (!value->is_object()) {
        throw RecordDecodeError("field '" + std::string(key) + "' must be an object");
    }
    return value->get_object();
}

domain::LevelFields decodeLevel(const boost::json::object& object) {
    domain::LevelFields fields;
    fields.type = requireEnum(object, "type", &domain::levelTypeFromString);
    const auto* price = field(object, "price");
    if (price == nullptr) {
        throw RecordDecodeError("missing field 'price'");
    }
    fields.price = asDouble(*price, "price");
    fields.priceUpper = optionalDouble(object, "price_upper");
    if (auto direction = optionalEnum(object, "direction", &domain::levelDirectionFromString)) {
        fields.direction = *direction;
    }
    fields.fib = optionalString(object, "fib");
    if (auto confidence = optionalDouble(object, "confidence")) {
        fields.confidence = *confidence;
    }
    fields.context = optionalString(object, "context").value_or(std::string{});
    fields.invalidationPrice = optionalDouble(object, "invalidation_price");
    return fields;
}

domain::ViewFields decodeView(const boost::json::object& object) {
    domain::ViewFields fields;
    fields.bias = optionalEnum(object, "bias", &domain::biasFromString);
    fields.quadrant = optionalEnum(object, "quadrant", &domain::quadrantFromString);
    fields.ivRegime = optionalEnum(object, "iv_regime", &domain::ivRegimeFromString);
    fields.wavePosition = optionalString(object, "wave_position");
    fields.wavePhase = optionalString(object, "wave_phase");
    fields.strategy = optionalString(object, "strategy");
    fields.notes = optionalString(object, "notes").value_or(std::string{});
    if (auto confidence = optionalDouble(object, "confidence")) {
        fields.confidence = *confidence;
    }
    return fields;
}

int parseDigits(std::string_view text, std::size_t offset, std::size_t count) {
    if (offset + count > text.size()) {
        throw RecordDecodeError("truncated timestamp '" + std::string(text) + "'");
    }
    int value = 0;
    const auto* begin = text.data() + offset;
    const auto* end = begin + count;
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        throw RecordDecodeError("invalid timestamp '" + std::string(text) + "'");
    }
    return value;
}

void expectChar(std::string_view text, std::size_t offset, char expected) {
    if (offset >= text.size() || text[offset] != expected) {
        throw RecordDecodeError("invalid timestamp '" + std::string(text) + "'");
    }
}

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

}  // namespace

domain::Timestamp parse_iso8601(std::string_view text) {
    const int year = parseDigits(text, 0, 4);
    expectChar(text, 4, '-');
    const int month = parseDigits(text, 5, 2);
    expectChar(text, 7, '-');
    const int day = parseDigits(text, 8, 2);
    if (text.size() <= 10 || (text[10] != 'T' && text[10] != ' ')) {
        throw RecordDecodeError("invalid timestamp '" + std::string(text) + "'");
    }
    const int hour = parseDigits(text, 11, 2);
    expectChar(text, 13, ':');
    const int minute = parseDigits(text, 14, 2);
    expectChar(text, 16, ':');
    const int second = parseDigits(text, 17, 2);
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        throw RecordDecodeError("timestamp out of range '" + std::string(text) + "'");
    }

    std::size_t pos = 19;
    std::int64_t millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            throw RecordDecodeError("invalid timestamp '" + std::string(text) + "'");
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }

    std::int64_t offsetSeconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        const int sign = text[pos] == '+' ? 1 : -1;
        const int offsetHours = parseDigits(text, pos + 1, 2);
        expectChar(text, pos + 3, ':');
        const int offsetMinutes = parseDigits(text, pos + 4, 2);
        offsetSeconds = sign * (offsetHours * 3600 + offsetMinutes * 60);
        pos += 6;
    }
    if (pos != text.size()) {
        throw RecordDecodeError("invalid timestamp '" + std::string(text) + "'");
    }

    const auto days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const std::int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offsetSeconds;
    return boundedEpochMs(seconds * 1000 + millis);
}

domain::Timestamp decode_timestamp(const boost::json::value& value) {
    if (value.is_string()) {
        const auto& text = value.get_string();
        return parse_iso8601(std::string_view(text.data(), text.size()));
    }
    const double raw = asDouble(value, "observed_at");
    if (!std::isfinite(raw) || raw < 0.0) {
        throw RecordDecodeError("field 'observed_at' must be a non-negative epoch");
    }
    if (raw >= static_cast<double>(kMaxEpochMs)) {
        throw RecordDecodeError("field 'observed_at' out of range");
    }
    auto ms = static_cast<std::int64_t>(raw);
    if (ms > 0 && ms < kMillisecondsThreshold) {
        ms *= 1000LL;
    }
    return boundedEpochMs(ms);
}

domain::ExtractionRecord decode_record(const boost::json::value& value) {
    if (!value.is_object()) {
        throw RecordDecodeError("record must be a JSON object");
    }
    const auto& object = value.get_object();

    domain::ExtractionRecord record;
    record.symbolText = requireString(object, "symbol_text");
    record.source = requireEnum(object, "source", &domain::sourceFromString);

    const auto kind = requireString(object, "kind");
    if (kind == "level") {
        record.kind = domain::RecordKind::Level;
        record.level = decodeLevel(requireObject(object, "level_fields"));
    } else if (kind == "view") {
        record.kind = domain::RecordKind::View;
        record.view = decodeView(requireObject(object, "view_fields"));
    } else {
        throw RecordDecodeError("unknown kind '" + kind + "'");
    }

    record.contentId = optionalString(object, "content_id").value_or(std::string{});

    const auto* observed = field(object, "observed_at");
    if (observed == nullptr) {
        throw RecordDecodeError("missing field 'observed_at'");
    }
    record.observedAt = decode_timestamp(*observed);
    return record;
}

DecodedBatch decode_batch(const boost::json::value& value) {
    DecodedBatch batch;
    if (value.is_object()) {
        try {
            batch.records.push_back(decode_record(value));
        } catch (const RecordDecodeError& ex) {
            batch.errors.push_back(std::string("[0] ") + ex.what());
        }
        return batch;
    }
    if (!value.is_array()) {
        throw RecordDecodeError("body must be a record object or an array of records");
    }

    const auto& items = value.get_array();
    batch.records.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        try {
            batch.records.push_back(decode_record(items[i]));
        } catch (const RecordDecodeError& ex) {
            batch.errors.push_back("[" + std::to_string(i) + "] " + ex.what());
        }
    }
    return batch;
}

}  // namespace cfe::http

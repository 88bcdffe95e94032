#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/json/value.hpp>

#include "domain/Models.hpp"

namespace cfe::http {

// Thrown when a JSON value cannot be turned into an extraction record.
class RecordDecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Decodes one inbound record object. Throws RecordDecodeError naming the
// offending field.
domain::ExtractionRecord decode_record(const boost::json::value& value);

// Accepts epoch milliseconds, epoch seconds (normalized to milliseconds) or
// an ISO-8601 UTC string.
domain::Timestamp decode_timestamp(const boost::json::value& value);

// "2024-03-08T14:30:00Z", "2024-03-08T14:30:00.250Z" or with a +HH:MM offset.
domain::Timestamp parse_iso8601(std::string_view text);

struct DecodedBatch {
    std::vector<domain::ExtractionRecord> records;
    // One entry per element that failed to decode, "[index] reason".
    std::vector<std::string> errors;
};

// A single record object or an array of them. Elements that fail to decode
// are reported in `errors` and do not stop the others.
DecodedBatch decode_batch(const boost::json::value& value);

}  // namespace cfe::http

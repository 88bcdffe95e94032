#pragma once

#include <string>
#include <string_view>

namespace core {

enum class WriteOutcome {
    Inserted,
    Merged,
    Upserted,
    StaleWriteIgnored,
    Rejected,
};

inline std::string_view writeOutcomeToString(WriteOutcome outcome) noexcept {
    switch (outcome) {
    case WriteOutcome::Inserted:
        return "inserted";
    case WriteOutcome::Merged:
        return "merged";
    case WriteOutcome::Upserted:
        return "upserted";
    case WriteOutcome::StaleWriteIgnored:
        return "stale_write_ignored";
    case WriteOutcome::Rejected:
        return "rejected";
    }
    return "rejected";
}

struct WriteResult {
    WriteOutcome outcome{WriteOutcome::Rejected};
    std::string reason;
};

}  // namespace core

#include "adapters/duckdb/DuckStateRepo.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "common/Log.hpp"

#if defined(HAS_DUCKDB)
#include <duckdb.hpp>
#endif

namespace fs = std::filesystem;

namespace adapters::duckdb {

#if !defined(HAS_DUCKDB)

struct DuckStateRepo::Impl {};

DuckStateRepo::DuckStateRepo(std::string dbPath) : dbPath_(std::move(dbPath)) {}

DuckStateRepo::~DuckStateRepo() = default;

void DuckStateRepo::migrate() {
    LOG_WARN("DuckDB support disabled at compile time; state for " << dbPath_ << " will not be persisted.");
}

void DuckStateRepo::saveLevel(const domain::PriceLevel& level) {
    (void)level;
}

void DuckStateRepo::saveView(const domain::SourceView& view) {
    (void)view;
}

domain::contracts::PersistedState DuckStateRepo::loadAll() const {
    return {};
}

#else

namespace {

// DuckDB exposes its own vector alias; using it keeps Execute(values) on the
// non-variadic overload.
using DuckdbValueVector = ::duckdb::vector<::duckdb::Value>;

constexpr std::int64_t kMillisecondsThreshold = 1'000'000'000'000LL;

constexpr auto kCreateLevelsTable = R"SQL(
    CREATE TABLE IF NOT EXISTS price_levels (
        id BIGINT PRIMARY KEY,
        symbol TEXT NOT NULL,
        source TEXT NOT NULL,
        level_type TEXT NOT NULL,
        price DOUBLE NOT NULL,
        price_upper DOUBLE,
        direction TEXT NOT NULL,
        fib TEXT,
        confidence DOUBLE NOT NULL,
        context TEXT,
        invalidation_price DOUBLE,
        content_id TEXT,
        created_at BIGINT NOT NULL,
        last_confirmed_at BIGINT NOT NULL,
        active BOOLEAN NOT NULL
    )
)SQL";

constexpr auto kCreateViewsTable = R"SQL(
    CREATE TABLE IF NOT EXISTS source_views (
        symbol TEXT NOT NULL,
        source TEXT NOT NULL,
        bias TEXT NOT NULL,
        quadrant TEXT,
        iv_regime TEXT,
        wave_position TEXT,
        wave_phase TEXT,
        strategy TEXT,
        notes TEXT,
        confidence DOUBLE NOT NULL,
        content_id TEXT,
        last_updated_at BIGINT NOT NULL,
        PRIMARY KEY(symbol, source)
    )
)SQL";

::duckdb::Value optionalDouble(const std::optional<double>& value) {
    return value ? ::duckdb::Value::DOUBLE(*value) : ::duckdb::Value();
}

::duckdb::Value optionalText(const std::optional<std::string>& value) {
    return value ? ::duckdb::Value(*value) : ::duckdb::Value();
}

template <typename Enum>
::duckdb::Value optionalEnum(const std::optional<Enum>& value, std::string_view (*toString)(Enum) noexcept) {
    return value ? ::duckdb::Value(std::string(toString(*value))) : ::duckdb::Value();
}

std::optional<double> readDouble(const ::duckdb::Value& value) {
    if (value.IsNull()) {
        return std::nullopt;
    }
    return value.GetValue<double>();
}

std::optional<std::string> readText(const ::duckdb::Value& value) {
    if (value.IsNull()) {
        return std::nullopt;
    }
    return value.GetValue<std::string>();
}

domain::Timestamp readTimestamp(const ::duckdb::Value& value) {
    auto ms = value.IsNull() ? 0 : value.GetValue<std::int64_t>();
    if (ms > 0 && ms < kMillisecondsThreshold) {
        ms *= 1000LL;
    }
    return domain::fromEpochMs(ms);
}

void execute(::duckdb::Connection& connection, const std::string& sql, DuckdbValueVector& values) {
    auto statement = connection.Prepare(sql);
    if (!statement || statement->HasError()) {
        const std::string errorMessage =
            statement ? statement->GetError() : std::string{"failed to prepare statement"};
        throw std::runtime_error("DuckStateRepo prepare failed: " + errorMessage);
    }
    auto result = statement->Execute(values);
    if (!result || result->HasError()) {
        const std::string errorMessage = result ? result->GetError() : std::string{"unknown query error"};
        throw std::runtime_error("DuckStateRepo write failed: " + errorMessage);
    }
}

}  // namespace

struct DuckStateRepo::Impl {
    explicit Impl(const std::string& path) : database(path), connection(database) {}

    ::duckdb::DuckDB database;
    ::duckdb::Connection connection;
    mutable std::mutex mutex;
};

DuckStateRepo::DuckStateRepo(std::string dbPath) : dbPath_(std::move(dbPath)) {}

DuckStateRepo::~DuckStateRepo() = default;

void DuckStateRepo::migrate() {
    const fs::path dbPath{dbPath_};

    if (dbPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(dbPath.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("DuckStateRepo: unable to create directory '" +
                                     dbPath.parent_path().string() + "': " + ec.message());
        }
    }

    if (!impl_) {
        impl_ = std::make_unique<Impl>(dbPath.string());
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (const auto* ddl : {kCreateLevelsTable, kCreateViewsTable}) {
        auto result = impl_->connection.Query(ddl);
        if (!result || result->HasError()) {
            const std::string errorMessage = result ? result->GetError() : std::string("unknown error");
            throw std::runtime_error("DuckStateRepo: migration failed: " + errorMessage);
        }
    }

    LOG_INFO("DuckStateRepo migration finished for " << dbPath.string());
}

void DuckStateRepo::saveLevel(const domain::PriceLevel& level) {
    if (!impl_) {
        throw std::runtime_error("DuckStateRepo: saveLevel before migrate()");
    }

    DuckdbValueVector values;
    values.reserve(15);
    values.emplace_back(::duckdb::Value::BIGINT(static_cast<std::int64_t>(level.id)));
    values.emplace_back(level.symbol);
    values.emplace_back(std::string(domain::sourceToString(level.source)));
    values.emplace_back(std::string(domain::levelTypeToString(level.type)));
    values.emplace_back(::duckdb::Value::DOUBLE(level.price));
    values.emplace_back(optionalDouble(level.priceUpper));
    values.emplace_back(std::string(domain::levelDirectionToString(level.direction)));
    values.emplace_back(optionalText(level.fib));
    values.emplace_back(::duckdb::Value::DOUBLE(level.confidence));
    values.emplace_back(level.context);
    values.emplace_back(optionalDouble(level.invalidationPrice));
    values.emplace_back(level.contentId);
    values.emplace_back(::duckdb::Value::BIGINT(domain::toEpochMs(level.createdAt)));
    values.emplace_back(::duckdb::Value::BIGINT(domain::toEpochMs(level.lastConfirmedAt)));
    values.emplace_back(::duckdb::Value::BOOLEAN(level.active));

    std::lock_guard<std::mutex> lock(impl_->mutex);
    execute(impl_->connection,
            "INSERT OR REPLACE INTO price_levels VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
            values);
}

void DuckStateRepo::saveView(const domain::SourceView& view) {
    if (!impl_) {
        throw std::runtime_error("DuckStateRepo: saveView before migrate()");
    }

    DuckdbValueVector values;
    values.reserve(12);
    values.emplace_back(view.symbol);
    values.emplace_back(std::string(domain::sourceToString(view.source)));
    values.emplace_back(std::string(domain::biasToString(view.bias)));
    values.emplace_back(optionalEnum(view.quadrant, &domain::quadrantToString));
    values.emplace_back(optionalEnum(view.ivRegime, &domain::ivRegimeToString));
    values.emplace_back(optionalText(view.wavePosition));
    values.emplace_back(optionalText(view.wavePhase));
    values.emplace_back(optionalText(view.strategy));
    values.emplace_back(view.notes);
    values.emplace_back(::duckdb::Value::DOUBLE(view.confidence));
    values.emplace_back(view.contentId);
    values.emplace_back(::duckdb::Value::BIGINT(domain::toEpochMs(view.lastUpdatedAt)));

    std::lock_guard<std::mutex> lock(impl_->mutex);
    execute(impl_->connection,
            "INSERT OR REPLACE INTO source_views VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
            values);
}

domain::contracts::PersistedState DuckStateRepo::loadAll() const {
    domain::contracts::PersistedState state;
    if (!impl_) {
        return state;
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto levels = impl_->connection.Query(
        "SELECT id, symbol, source, level_type, price, price_upper, direction, fib, confidence, context, "
        "invalidation_price, content_id, created_at, last_confirmed_at, active FROM price_levels ORDER BY id");
    if (!levels || levels->HasError()) {
        const std::string errorMessage = levels ? levels->GetError() : std::string{"failed to load levels"};
        throw std::runtime_error("DuckStateRepo loadAll failed: " + errorMessage);
    }
    while (auto chunk = levels->Fetch()) {
        for (::duckdb::idx_t row = 0; row < chunk->size(); ++row) {
            const auto source = domain::sourceFromString(chunk->GetValue(2, row).GetValue<std::string>());
            const auto type = domain::levelTypeFromString(chunk->GetValue(3, row).GetValue<std::string>());
            const auto direction =
                domain::levelDirectionFromString(chunk->GetValue(6, row).GetValue<std::string>());
            if (!source || !type || !direction) {
                LOG_WARN("DuckStateRepo: skipping level row with unknown enum value");
                continue;
            }

            domain::PriceLevel level;
            level.id = static_cast<std::uint64_t>(chunk->GetValue(0, row).GetValue<std::int64_t>());
            level.symbol = chunk->GetValue(1, row).GetValue<std::string>();
            level.source = *source;
            level.type = *type;
            level.price = chunk->GetValue(4, row).GetValue<double>();
            level.priceUpper = readDouble(chunk->GetValue(5, row));
            level.direction = *direction;
            level.fib = readText(chunk->GetValue(7, row));
            level.confidence = chunk->GetValue(8, row).GetValue<double>();
            level.context = readText(chunk->GetValue(9, row)).value_or(std::string{});
            level.invalidationPrice = readDouble(chunk->GetValue(10, row));
            level.contentId = readText(chunk->GetValue(11, row)).value_or(std::string{});
            level.createdAt = readTimestamp(chunk->GetValue(12, row));
            level.lastConfirmedAt = readTimestamp(chunk->GetValue(13, row));
            level.active = chunk->GetValue(14, row).GetValue<bool>();
            state.levels.push_back(std::move(level));
        }
    }

    auto views = impl_->connection.Query(
        "SELECT symbol, source, bias, quadrant, iv_regime, wave_position, wave_phase, strategy, notes, "
        "confidence, content_id, last_updated_at FROM source_views ORDER BY symbol, source");
    if (!views || views->HasError()) {
        const std::string errorMessage = views ? views->GetError() : std::string{"failed to load views"};
        throw std::runtime_error("DuckStateRepo loadAll failed: " + errorMessage);
    }
    while (auto chunk = views->Fetch()) {
        for (::duckdb::idx_t row = 0; row < chunk->size(); ++row) {
            const auto source = domain::sourceFromString(chunk->GetValue(1, row).GetValue<std::string>());
            const auto bias = domain::biasFromString(chunk->GetValue(2, row).GetValue<std::string>());
            if (!source || !bias) {
                LOG_WARN("DuckStateRepo: skipping view row with unknown enum value");
                continue;
            }

            domain::SourceView view;
            view.symbol = chunk->GetValue(0, row).GetValue<std::string>();
            view.source = *source;
            view.bias = *bias;
            if (const auto quadrant = readText(chunk->GetValue(3, row))) {
                view.quadrant = domain::quadrantFromString(*quadrant);
            }
            if (const auto regime = readText(chunk->GetValue(4, row))) {
                view.ivRegime = domain::ivRegimeFromString(*regime);
            }
            view.wavePosition = readText(chunk->GetValue(5, row));
            view.wavePhase = readText(chunk->GetValue(6, row));
            view.strategy = readText(chunk->GetValue(7, row));
            view.notes = readText(chunk->GetValue(8, row)).value_or(std::string{});
            view.confidence = chunk->GetValue(9, row).GetValue<double>();
            view.contentId = readText(chunk->GetValue(10, row)).value_or(std::string{});
            view.lastUpdatedAt = readTimestamp(chunk->GetValue(11, row));
            state.views.push_back(std::move(view));
        }
    }

    LOG_INFO("DuckStateRepo loaded " << state.levels.size() << " levels and " << state.views.size()
                                     << " views from " << dbPath_);
    return state;
}

#endif

}  // namespace adapters::duckdb

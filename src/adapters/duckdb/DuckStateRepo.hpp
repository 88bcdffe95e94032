#pragma once

#include <memory>
#include <string>

#include "domain/Ports.hpp"

namespace adapters::duckdb {

class DuckStateRepo : public domain::contracts::IStateRepository {
public:
    explicit DuckStateRepo(std::string dbPath = "data/confluence.duckdb");
    ~DuckStateRepo() override;

    DuckStateRepo(const DuckStateRepo&) = delete;
    DuckStateRepo& operator=(const DuckStateRepo&) = delete;

    // Opens the database and creates the tables when missing. Throws
    // std::runtime_error when the file cannot be opened or migrated.
    void migrate();

    void saveLevel(const domain::PriceLevel& level) override;
    void saveView(const domain::SourceView& view) override;
    domain::contracts::PersistedState loadAll() const override;

private:
    struct Impl;

    std::string dbPath_;
    std::unique_ptr<Impl> impl_;
};

}  // namespace adapters::duckdb

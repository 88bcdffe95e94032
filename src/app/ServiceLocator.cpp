#include "app/ServiceLocator.hpp"

#include <utility>

#include "adapters/duckdb/DuckStateRepo.hpp"
#include "app/ConfluenceEngine.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"

namespace app {

ServiceLocator& ServiceLocator::instance() {
    static ServiceLocator locator;
    return locator;
}

void ServiceLocator::init_backends(const cfe::common::Config& config) {
    std::shared_ptr<domain::contracts::IStateRepository> repository;
    if (config.storage == "duck") {
        auto duck = std::make_shared<adapters::duckdb::DuckStateRepo>(config.duckdbPath);
        duck->migrate();
        repository = std::move(duck);
        LOG_INFO("Storage: DuckDB at " << config.duckdbPath);
    } else {
        LOG_INFO("Storage: in-memory only");
    }

    auto engine = std::make_shared<ConfluenceEngine>(config.engine, std::move(repository));
    engine->restore();
    ServiceLocator::instance().setEngine(std::move(engine));
}

void ServiceLocator::setEngine(std::shared_ptr<ConfluenceEngine> engine) {
    engine_ = std::move(engine);
}

std::shared_ptr<ConfluenceEngine> ServiceLocator::engineHandle() const {
    return engine_;
}

ConfluenceEngine* ServiceLocator::engine() const {
    return engine_.get();
}

}  // namespace app

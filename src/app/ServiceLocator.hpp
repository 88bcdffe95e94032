#pragma once

#include <memory>

namespace cfe::common {
struct Config;
}  // namespace cfe::common

namespace app {

class ConfluenceEngine;

class ServiceLocator {
public:
    static ServiceLocator& instance();

    // Builds the storage backend named by the config, restores persisted
    // state into a fresh engine and installs it.
    static void init_backends(const cfe::common::Config& config);

    void setEngine(std::shared_ptr<ConfluenceEngine> engine);
    std::shared_ptr<ConfluenceEngine> engineHandle() const;
    ConfluenceEngine* engine() const;

private:
    ServiceLocator() = default;

    std::shared_ptr<ConfluenceEngine> engine_;
};

}  // namespace app

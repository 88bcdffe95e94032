#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <thread>
#include <utility>

#include "api/HttpServer.hpp"
#include "app/ConfluenceEngine.hpp"
#include "app/SeedLoader.hpp"
#include "app/ServiceLocator.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        if (auto eptr = std::current_exception()) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& ex) {
                std::fprintf(stderr, "std::terminate: %s\n", ex.what());
            } catch (...) {
                std::fprintf(stderr, "std::terminate: unknown exception\n");
            }
        } else {
            std::fprintf(stderr, "std::terminate without current_exception\n");
        }
        std::_Exit(1);
    });

    try {
        auto config = cfe::common::Config::fromArgs(argc, argv);
        cfe::log::setLevel(config.logLevel);

        const auto& scoring = config.engine.scoring;
        LOG_INFO("Configuration loaded");
        LOG_INFO("  Port: " << config.port);
        LOG_INFO("  Log level: " << cfe::log::levelToString(config.logLevel));
        LOG_INFO("  Worker threads: " << config.threads);
        LOG_INFO("  Storage: " << config.storage);
        LOG_INFO("  Merge tolerance: " << config.engine.levels.mergeTolerance
                 << " confidence floor: " << config.engine.levels.lowConfidenceFloor);
        LOG_INFO("  Score weights bias=" << scoring.biasWeight << " proximity=" << scoring.proximityWeight
                 << " recency=" << scoring.recencyWeight);

        app::ServiceLocator::init_backends(config);

        if (!config.seedPath.empty()) {
            auto* engine = app::ServiceLocator::instance().engine();
            app::loadSeedFile(*engine, config.seedPath);
        }

        cfe::api::Endpoint endpoint{"0.0.0.0", config.port};
        cfe::api::HttpServer server(endpoint, config.threads);

        cfe::api::HttpServer::CorsConfig corsConfig{};
        corsConfig.enabled = config.httpCorsEnable && !config.httpCorsOrigin.empty();
        corsConfig.origin = config.httpCorsOrigin;
        server.setCorsConfig(std::move(corsConfig));

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        server.start();
        LOG_INFO("Server running, waiting for requests");

        while (gSignalStatus == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO("Signal " << gSignalStatus << " received, starting graceful shutdown");
        server.stop();
        app::ServiceLocator::instance().setEngine(nullptr);
        LOG_INFO("Shutdown complete");
    } catch (const std::exception& ex) {
        LOG_ERR("Fatal error: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

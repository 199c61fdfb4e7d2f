#include "db/ConnectionPool.hpp"
#include "db/Migrator.hpp"
#include "events/ClickPipeline.hpp"
#include "events/GaugeUpdater.hpp"
#include "server/Config.hpp"
#include "server/HttpServer.hpp"
#include "server/Logger.hpp"
#include "server/RequestHandler.hpp"
#include "store/ClickStore.hpp"
#include "store/KeywordStore.hpp"
#include "store/LinkStore.hpp"
#include "store/UserStore.hpp"
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>

using namespace slugline;
using namespace slugline::server;

namespace {
    std::function<void()> shutdown_handler;
    void signal_handler(int) {
        if (shutdown_handler) shutdown_handler();
    }

    void configureLogging(const Config& config) {
        auto& logger = Logger::instance();
        logger.setLevel(parseLogLevel(config.logLevel));
        if (!config.logFile.empty()) {
            logger.enableFileLogging(config.logFile);
        }
    }

    int runMigrations(db::ConnectionPool& pool) {
        auto conn = pool.acquire();
        db::Migrator migrator(*conn);
        int applied = migrator.migrate();
        LOG_INFO("Schema at version " + std::to_string(migrator.currentVersion()) +
                 " (" + std::to_string(applied) + " migration(s) applied)");
        return applied;
    }
}

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = Config::load(argc, argv, [](const char* name) { return std::getenv(name); });
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << Config::usage(argv[0]);
        return 2;
    }

    if (config.showHelp) {
        std::cout << Config::usage(argv[0]);
        return 0;
    }

    try {
        configureLogging(config);

        db::ConnectionPool pool(config.dialect(), config.dbDsn, config.dbPoolSize);
        LOG_INFO("Database: " + config.dbDriver + " (pool of " + std::to_string(config.dbPoolSize) + ")");

        runMigrations(pool);
        if (config.command == "migrate") {
            return 0;
        }

        store::LinkStore links(pool);
        store::UserStore users(pool);
        store::KeywordStore keywords(pool);
        store::ClickStore clickStore(pool);

        events::ClickPipeline clicks(clickStore, config.clicksQueueCapacity);
        clicks.start();

        events::GaugeUpdater gauges(links, users, std::chrono::seconds(config.gaugesIntervalS));
        gauges.start();

        // Créer le contexte IO
        net::io_context ioc{1};

        RequestHandler handler(links, keywords, clicks);
        HttpServer server(ioc, config.httpAddr, config.httpPort, handler);
        server.run();

        // Gérer le signal d'arrêt
        shutdown_handler = [&]() {
            ioc.stop();
        };
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        LOG_INFO("Press Ctrl+C to stop");

        // Lancer la boucle d'événements
        ioc.run();

        LOG_INFO("Shutting down...");
        shutdown_handler = nullptr;
        gauges.stop();
        server.stop();

        if (!clicks.shutdown(std::chrono::seconds(config.clicksDrainTimeoutS))) {
            LOG_WARN("Click queue was not fully drained");
            // The detached consumer may still be using the pool; skip destructors
            std::quick_exit(EXIT_SUCCESS);
        }

    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Fatal: ") + e.what());
        return 1;
    }

    return 0;
}

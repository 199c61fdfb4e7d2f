#pragma once

#include "db/Dialect.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace slugline {
namespace server {

/**
 * Application settings.
 *
 * Sources, later ones win: built-in defaults, a YAML file (--config),
 * SLUGLINE_* environment variables (http.port -> SLUGLINE_HTTP_PORT), then
 * command-line flags.
 *
 * The file nests keys by section:
 *
 *   http:
 *     port: 8080
 *   db:
 *     driver: postgres
 *     dsn: "@/run/secrets/slugline-dsn"
 *   clicks:
 *     queue_capacity: 512
 */
struct Config {
    using EnvLookup = std::function<const char*(const char*)>;

    std::string command = "serve";       // serve | migrate
    bool showHelp = false;

    std::string httpAddr = "0.0.0.0";
    unsigned short httpPort = 8080;

    std::string dbDriver = "sqlite3";
    std::string dbDsn = "slugline.db";
    size_t dbPoolSize = 4;

    std::string logLevel = "info";
    std::string logFile;                 // empty: stdout

    size_t clicksQueueCapacity = 256;
    int64_t clicksDrainTimeoutS = 30;
    int64_t gaugesIntervalS = 60;

    /**
     * All recognized keys, in documentation order
     */
    static const std::vector<std::string>& keys();

    /**
     * @brief Set one key. A db.dsn value starting with '@' names a file
     * whose non-comment lines are joined with spaces.
     * @throws std::invalid_argument for an unknown key or a malformed number
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Apply a YAML file of sections (http, db, log, clicks, gauges)
     * @param path File path, optionally prefixed with '@'
     * @throws std::runtime_error if the file cannot be opened
     * @throws std::invalid_argument for malformed YAML or an unknown key
     */
    void loadFile(const std::string& path);

    void loadEnvironment(const EnvLookup& lookup);

    /**
     * @throws std::invalid_argument for an unknown flag or a missing value
     */
    void parseArgs(int argc, char* argv[]);

    /**
     * @throws std::invalid_argument describing the first invalid setting
     */
    void validate() const;

    db::Dialect dialect() const { return db::parseDialect(dbDriver); }

    /**
     * Defaults, then file, environment and arguments, then validate()
     */
    static Config load(int argc, char* argv[], const EnvLookup& lookup);

    static std::string envName(const std::string& key);
    static std::string usage(const std::string& program);
};

} // namespace server
} // namespace slugline

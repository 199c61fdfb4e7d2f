#include "server/Config.hpp"
#include "server/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace slugline {
namespace server {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    return s.substr(start);
}

int64_t parseInteger(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        long long parsed = std::stoll(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid number for " + key + ": \"" + value + "\"");
    }
}

size_t parseCount(const std::string& key, const std::string& value) {
    int64_t parsed = parseInteger(key, value);
    if (parsed < 0) {
        throw std::invalid_argument(key + " must not be negative");
    }
    return static_cast<size_t>(parsed);
}

/**
 * Connection parameters split over lines, e.g. one libpq keyword per line
 */
std::string readDsnFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open DSN file: " + path);
    }

    std::string dsn;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (!dsn.empty()) dsn += " ";
        dsn += line;
    }
    return dsn;
}

// Flag -> config key
const std::map<std::string, std::string>& flagKeys() {
    static const std::map<std::string, std::string> flags = {
        {"-a", "http.addr"}, {"--address", "http.addr"},
        {"-p", "http.port"}, {"--port", "http.port"},
        {"--db-driver", "db.driver"},
        {"--db-dsn", "db.dsn"},
        {"--pool-size", "db.pool_size"},
        {"-l", "log.level"}, {"--log-level", "log.level"},
        {"--log-file", "log.file"},
        {"--queue-capacity", "clicks.queue_capacity"},
        {"--drain-timeout", "clicks.drain_timeout_s"},
        {"--gauge-interval", "gauges.interval_s"},
    };
    return flags;
}

} // anonymous namespace

const std::vector<std::string>& Config::keys() {
    static const std::vector<std::string> all = {
        "http.addr", "http.port",
        "db.driver", "db.dsn", "db.pool_size",
        "log.level", "log.file",
        "clicks.queue_capacity", "clicks.drain_timeout_s",
        "gauges.interval_s",
    };
    return all;
}

void Config::set(const std::string& key, const std::string& value) {
    if (key == "http.addr") {
        httpAddr = value;
    } else if (key == "http.port") {
        int64_t port = parseInteger(key, value);
        if (port <= 0 || port > 65535) {
            throw std::invalid_argument("http.port out of range: " + value);
        }
        httpPort = static_cast<unsigned short>(port);
    } else if (key == "db.driver") {
        dbDriver = value;
    } else if (key == "db.dsn") {
        dbDsn = (!value.empty() && value[0] == '@') ? readDsnFile(value.substr(1)) : value;
    } else if (key == "db.pool_size") {
        dbPoolSize = parseCount(key, value);
    } else if (key == "log.level") {
        logLevel = value;
    } else if (key == "log.file") {
        logFile = value;
    } else if (key == "clicks.queue_capacity") {
        clicksQueueCapacity = parseCount(key, value);
    } else if (key == "clicks.drain_timeout_s") {
        clicksDrainTimeoutS = parseInteger(key, value);
    } else if (key == "gauges.interval_s") {
        gaugesIntervalS = parseInteger(key, value);
    } else {
        throw std::invalid_argument("unknown config key: " + key);
    }
}

void Config::loadFile(const std::string& path) {
    std::string resolved = (!path.empty() && path[0] == '@') ? path.substr(1) : path;

    YAML::Node root;
    try {
        root = YAML::LoadFile(resolved);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Cannot open config file: " + resolved);
    } catch (const YAML::ParserException& e) {
        throw std::invalid_argument(resolved + ": " + e.what());
    }
    if (root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw std::invalid_argument(resolved + ": expected a mapping of sections");
    }

    for (const auto& section : root) {
        std::string sectionName = section.first.as<std::string>();
        const YAML::Node& entries = section.second;
        if (!entries.IsMap()) {
            throw std::invalid_argument(resolved + ": section " + sectionName + " must be a mapping");
        }
        for (const auto& entry : entries) {
            std::string key = sectionName + "." + entry.first.as<std::string>();
            if (!entry.second.IsScalar()) {
                throw std::invalid_argument(resolved + ": " + key + " must be a scalar");
            }
            // set() rejects unknown keys
            set(key, entry.second.as<std::string>());
        }
    }
}

std::string Config::envName(const std::string& key) {
    std::string name = "SLUGLINE_";
    for (char c : key) {
        name += (c == '.') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return name;
}

void Config::loadEnvironment(const EnvLookup& lookup) {
    for (const auto& key : keys()) {
        const char* value = lookup(envName(key).c_str());
        if (value != nullptr) {
            set(key, value);
        }
    }
}

void Config::parseArgs(int argc, char* argv[]) {
    const auto& flags = flagKeys();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            showHelp = true;
        } else if (arg == "serve" || arg == "migrate") {
            command = arg;
        } else if (arg == "--config") {
            // Already applied by load()
            if (i + 1 >= argc) throw std::invalid_argument("missing value for --config");
            ++i;
        } else if (arg == "--set") {
            if (i + 1 >= argc) throw std::invalid_argument("missing value for --set");
            std::string assignment = argv[++i];
            auto eq = assignment.find('=');
            if (eq == std::string::npos) {
                throw std::invalid_argument("--set expects key=value, got \"" + assignment + "\"");
            }
            set(assignment.substr(0, eq), assignment.substr(eq + 1));
        } else if (auto it = flags.find(arg); it != flags.end()) {
            if (i + 1 >= argc) throw std::invalid_argument("missing value for " + arg);
            set(it->second, argv[++i]);
        } else {
            throw std::invalid_argument("unknown argument: " + arg);
        }
    }
}

void Config::validate() const {
    db::parseDialect(dbDriver);
    parseLogLevel(logLevel);

    if (dbDsn.empty()) {
        throw std::invalid_argument("db.dsn must not be empty");
    }
    if (dbPoolSize == 0) {
        throw std::invalid_argument("db.pool_size must be at least 1");
    }
    if (clicksQueueCapacity == 0) {
        throw std::invalid_argument("clicks.queue_capacity must be at least 1");
    }
    if (clicksDrainTimeoutS < 0) {
        throw std::invalid_argument("clicks.drain_timeout_s must not be negative");
    }
    if (gaugesIntervalS <= 0) {
        throw std::invalid_argument("gauges.interval_s must be positive");
    }
}

Config Config::load(int argc, char* argv[], const EnvLookup& lookup) {
    Config config;

    std::string configFile;
    if (const char* fromEnv = lookup("SLUGLINE_CONFIG")) {
        configFile = fromEnv;
    }
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            configFile = argv[i + 1];
        }
    }

    if (!configFile.empty()) {
        config.loadFile(configFile);
    }
    config.loadEnvironment(lookup);
    config.parseArgs(argc, argv);

    if (!config.showHelp) {
        config.validate();
    }
    return config;
}

std::string Config::usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [serve|migrate] [options]\n"
        << "Commands:\n"
        << "  serve                  Migrate, then serve redirects (default)\n"
        << "  migrate                Apply pending migrations and exit\n"
        << "Options:\n"
        << "  --config FILE          YAML settings file (http, db, log, clicks, gauges)\n"
        << "  -a, --address ADDR     Address to bind to (default: 0.0.0.0)\n"
        << "  -p, --port PORT        Port to listen on (default: 8080)\n"
        << "  --db-driver NAME       sqlite3, postgres or mysql (default: sqlite3)\n"
        << "  --db-dsn DSN           SQLite path, libpq string or mysqlx URI\n"
        << "                         @/path/to/file reads the DSN from a file\n"
        << "  --pool-size N          Maximum open connections (default: 4)\n"
        << "  -l, --log-level LVL    debug, info, warn, error (default: info)\n"
        << "  --log-file PATH        Append logs to a file instead of stdout\n"
        << "  --queue-capacity N     Click queue capacity (default: 256)\n"
        << "  --drain-timeout SEC    Click drain timeout at shutdown (default: 30)\n"
        << "  --gauge-interval SEC   Gauge refresh interval (default: 60)\n"
        << "  --set KEY=VALUE        Set any config key\n"
        << "  -h, --help             Show this help\n"
        << "Environment: SLUGLINE_CONFIG, and SLUGLINE_<KEY> for every key\n"
        << "(e.g. SLUGLINE_DB_DSN for db.dsn).\n";
    return oss.str();
}

} // namespace server
} // namespace slugline

#include "linewire/util/config.hpp"

#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace linewire::util {

namespace {
std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if(start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end-start+1);
}

// std::stoi and friends accept trailing garbage ("80x") and throw their own
// exceptions without saying which setting was bad
long long parse_integer(const std::string& key, const std::string& value, long long min,
                        long long max) {
    size_t pos = 0;
    long long n = 0;
    try {
        n = std::stoll(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid value for " + key + ": '" + value + "'");
    }
    if(pos != value.size() || n < min || n > max) {
        throw std::invalid_argument("invalid value for " + key + ": '" + value + "'");
    }
    return n;
}

uint16_t parse_port(const std::string& key, const std::string& value) {
    return static_cast<uint16_t>(parse_integer(key, value, 0, 65535));
}

std::size_t parse_size(const std::string& key, const std::string& value) {
    return static_cast<std::size_t>(
        parse_integer(key, value, 1, std::numeric_limits<long long>::max()));
}

int parse_seconds(const std::string& key, const std::string& value) {
    return static_cast<int>(parse_integer(key, value, 0, std::numeric_limits<int>::max()));
}

LogLevel parse_level(const std::string& key, const std::string& value) {
    auto level = parse_log_level(value);
    if(!level) {
        throw std::invalid_argument("invalid value for " + key + ": '" + value + "'");
    }
    return *level;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -c, --config FILE          Config file path\n"
              << "  -H, --host HOST            Host to bind (default: 127.0.0.1)\n"
              << "  -p, --port PORT            Port to listen on (default: 1234)\n"
              << "  -l, --log-level LEVEL      Log level: debug, info, warn, error, none\n"
              << "  --max-connections N        Max client connections (default: 1000)\n"
              << "  --client-timeout SEC       Client socket timeout, 0 = none (default: 300)\n"
              << "  --greeting TEXT            Text of the 220 greeting\n"
              << "  -h, --help                 Show this help\n";
}

} //namespace

std::optional<LogLevel> parse_log_level(const std::string& s) {
    if(s == "debug") return LogLevel::Debug;
    if(s == "info") return LogLevel::Info;
    if(s == "warn") return LogLevel::Warn;
    if(s == "error") return LogLevel::Error;
    if(s == "none") return LogLevel::None;
    return std::nullopt;
}

std::optional<Config> Config::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if(!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;

    while(std::getline(file, line)) {
        line = trim(line);

        if(line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if(eq == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq+1));

        //remove quotes if present
        if(value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size()-2);
        }

        if (key == "host") {
            config.host = value;
        } else if (key == "port") {
            config.port = parse_port(key, value);
        } else if (key == "max_connections") {
            config.max_connections = parse_size(key, value);
        } else if (key == "client_timeout_seconds") {
            config.client_timeout_seconds = parse_seconds(key, value);
        } else if (key == "greeting") {
            config.greeting = value;
        } else if (key == "log_level") {
            config.log_level = parse_level(key, value);
        } else {
            LOG_WARN("Ignoring unknown config key: " + key);
        }
    }

    return config;
}

std::optional<Config> Config::parse_args(int argc, char* argv[]) {
    Config config;

    for(int i=1; i<argc; ++i) {
        std::string arg = argv[i];
        if(arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return std::nullopt;
        }
        if ((arg == "-H" || arg == "--host") && i + 1 < argc) {
            config.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            config.port = parse_port("port", argv[++i]);
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            config.log_level = parse_level("log-level", argv[++i]);
        } else if (arg == "--max-connections" && i + 1 < argc) {
            config.max_connections = parse_size("max-connections", argv[++i]);
        } else if (arg == "--client-timeout" && i + 1 < argc) {
            config.client_timeout_seconds = parse_seconds("client-timeout", argv[++i]);
        } else if (arg == "--greeting" && i + 1 < argc) {
            config.greeting = argv[++i];
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            // Config file handled separately in main
            ++i;
        } else {
            throw std::invalid_argument("unknown or incomplete option: " + arg);
        }
    }

    return config;
}

Config Config::merge(const Config& file_config, const Config& cli_config, const Config& defaults) {
    Config result = defaults;
    // File overrides defaults
    if (file_config.host != defaults.host) result.host = file_config.host;
    if (file_config.port != defaults.port) result.port = file_config.port;
    if (file_config.max_connections != defaults.max_connections) result.max_connections = file_config.max_connections;
    if (file_config.client_timeout_seconds != defaults.client_timeout_seconds) result.client_timeout_seconds = file_config.client_timeout_seconds;
    if (file_config.greeting != defaults.greeting) result.greeting = file_config.greeting;
    if (file_config.log_level != defaults.log_level) result.log_level = file_config.log_level;

    // CLI overrides file
    if (cli_config.host != defaults.host) result.host = cli_config.host;
    if (cli_config.port != defaults.port) result.port = cli_config.port;
    if (cli_config.max_connections != defaults.max_connections) result.max_connections = cli_config.max_connections;
    if (cli_config.client_timeout_seconds != defaults.client_timeout_seconds) result.client_timeout_seconds = cli_config.client_timeout_seconds;
    if (cli_config.greeting != defaults.greeting) result.greeting = cli_config.greeting;
    if (cli_config.log_level != defaults.log_level) result.log_level = cli_config.log_level;

    return result;
}

} //namespace linewire::util

#ifndef LINEWIRE_UTIL_CONFIG_HPP
#define LINEWIRE_UTIL_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "linewire/util/logger.hpp"

namespace linewire::util {

struct Config {
    // server
    std::string host = "127.0.0.1";
    uint16_t port = 1234;
    std::size_t max_connections = 1000;
    int client_timeout_seconds = 300;

    // protocol
    std::string greeting = "may i help you?";

    // logging
    LogLevel log_level = LogLevel::Info;

    // Load from file (key = value, '#' comments). nullopt if the file can't be opened,
    // throws std::invalid_argument on a malformed value
    static std::optional<Config> load_file(const std::filesystem::path& path);

    // parse CLI args, returns nullopt on --help
    static std::optional<Config> parse_args(int argc, char* argv[]);

    // merge: CLI overrides file overrides defaults
    static Config merge(const Config& file_config, const Config& cli_config,
                        const Config& defaults);
};

std::optional<LogLevel> parse_log_level(const std::string& s);

}  // namespace linewire::util

#endif

#include <filesystem>
#include <iostream>
#include <string>

#include "linewire/demo/demo_protocol.hpp"
#include "linewire/net/server.hpp"
#include "linewire/util/config.hpp"
#include "linewire/util/logger.hpp"
#include "linewire/util/signal_handler.hpp"

int main(int argc, char* argv[]) {
    try {
        linewire::util::Config defaults;
        linewire::util::Config file_config = defaults;
        linewire::util::Config cli_config = defaults;

        //first pass: find config_path;
        std::filesystem::path config_path;
        for(int i=1; i<argc; ++i) {
            std::string arg = argv[i];
            if((arg == "-c" || arg == "--config") && i+1 < argc) {
                config_path = argv[++i];
                break;
            }
        }

        //load config file if specified
        if(!config_path.empty()) {
            auto loaded = linewire::util::Config::load_file(config_path);
            if(loaded) {
                file_config = *loaded;
            } else {
                std::cerr << "Warning: Could not load config file: " << config_path << std::endl;
            }
        }

        auto cli_result = linewire::util::Config::parse_args(argc, argv);
        if(!cli_result) {
            return 0; //--help was shown
        }
        cli_config = *cli_result;

        //Merge: CLI > file > defaults
        auto config = linewire::util::Config::merge(file_config, cli_config, defaults);

        linewire::util::Logger::instance().set_level(config.log_level);

        const auto proto = linewire::demo::make_demo_protocol(config.greeting);

        linewire::net::ServerOptions server_opts;
        server_opts.host = config.host;
        server_opts.port = config.port;
        server_opts.max_connections = config.max_connections;
        server_opts.client_timeout_seconds = config.client_timeout_seconds;

        linewire::net::Server server(proto, [] { return linewire::demo::Conversation{}; },
                                     server_opts);

        linewire::util::SignalHandler::install();

        server.start();

        LOG_INFO("Press Ctrl+C to shutdown");

        linewire::util::SignalHandler::wait_for_shutdown();

        server.stop();

        LOG_INFO("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("fatal error: " + std::string(e.what()));
        return 1;
    }
}

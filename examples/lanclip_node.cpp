/**
 * @file lanclip_node.cpp
 * @brief LanClip node: console menu + session engine
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Usage:
 *   lanclip_node [--config <path>] [--log-level <level>] [--log-file <path>]
 *
 * The engine runs on a worker thread; the console menu owns the main
 * thread until the user quits or a signal arrives.
 */

#include "lanclip/command_queue.hpp"
#include "lanclip/console_menu.hpp"
#include "lanclip/interface_monitor.hpp"
#include "lanclip/node_config.hpp"
#include "lanclip/session_engine.hpp"
#include "lanclip/spool_clipboard.hpp"
#include "lanclip/transport.hpp"
#include "lanclip/utilities.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace lanclip;

// Global menu pointer for signal handler
static std::atomic<ConsoleMenu*> g_menu(nullptr);

void signal_handler(int /*signal*/) {
    auto* menu = g_menu.load();
    if (menu) {
        menu->stop();
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [--config <path>] [--log-level <level>] [--log-file <path>]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <path>      JSON configuration (default: $LANCLIP_CONFIG)\n";
    std::cout << "  --log-level <level>  debug, info, warn, error, critical\n";
    std::cout << "  --log-file <path>    Also log to a rotating file\n\n";
}

int main(int argc, char* argv[]) {
    std::string config_path = utilities::get_env("LANCLIP_CONFIG", "");
    std::string log_level_arg;
    std::string log_file_arg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "--log-level" || arg == "--log-file") && i + 1 < argc) {
            std::string value = argv[++i];
            if (arg == "--config") config_path = value;
            else if (arg == "--log-level") log_level_arg = value;
            else log_file_arg = value;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    config::NodeConfig cfg;
    if (!config_path.empty()) {
        auto loaded = config::NodeConfig::load_from_file(config_path);
        if (!loaded) {
            std::cerr << "Invalid configuration: " << config_path << "\n";
            return 1;
        }
        cfg = *loaded;
    }
    if (!log_level_arg.empty()) cfg.log_level = log_level_arg;
    if (!log_file_arg.empty()) cfg.log_file = log_file_arg;

    // Bare file names go to the data directory's log folder
    if (!cfg.log_file.empty() && !std::filesystem::path(cfg.log_file).has_parent_path()) {
        try {
            cfg.log_file = (config::get_log_directory(cfg.data_dir) / cfg.log_file).string();
        } catch (const std::filesystem::filesystem_error& e) {
            std::cerr << "Cannot create log directory: " << e.what() << "\n";
            return 1;
        }
    }

    auto level = utilities::parse_log_level(cfg.log_level);
    if (!level) {
        std::cerr << "Unknown log level: " << cfg.log_level << "\n";
        return 1;
    }
    utilities::initialize_logging(cfg.log_file, *level);

    try {
        auto commands = std::make_shared<CommandQueue>();
        auto clipboard = std::make_shared<SpoolClipboard>(config::get_received_directory(cfg.data_dir));
        auto menu = std::make_shared<ConsoleMenu>(clipboard);
        auto transport = std::make_shared<AsioTransport>(cfg);

        SessionEngine engine(cfg, transport, clipboard, menu, commands);

        InterfaceMonitor monitor(cfg.interface_poll_interval);
        if (!monitor.init([commands]() { commands->push(SessionCommand::network_change()); }) ||
            !monitor.start_listening()) {
            utilities::log_warn("Network change detection unavailable");
        }

        g_menu.store(menu.get());
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        utilities::log_info("LanClip node '" + cfg.effective_peer_name() + "' starting, received files go to " +
                            clipboard->received_directory().string());

        std::thread engine_thread([&engine]() {
            try {
                engine.run();
            } catch (const std::exception& e) {
                utilities::log_critical("Engine thread error: " + std::string(e.what()));
            }
        });

        menu->run();

        g_menu.store(nullptr);
        monitor.stop();
        // STOP must not be lost or the join below never returns
        while (!commands->push(SessionCommand::stop())) {
            utilities::sleep_ms(10);
        }

        if (engine_thread.joinable()) {
            engine_thread.join();
        }

        utilities::log_info("LanClip node stopped");

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

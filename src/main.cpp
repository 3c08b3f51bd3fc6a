#include "app.hpp"
#include "command.hpp"
#include "config.hpp"
#include "local_api_client.hpp"
#include "logging.hpp"
#include "player.hpp"
#include "shared.hpp"
#include "theme.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

void print_usage(const char *program) {
    std::cout << "Usage: " << program << " [--library <dir>] [-c <command>]...\n"
              << "  --library <dir>  library root, one sub-directory per account\n"
              << "  -c <command>     run a command at startup, e.g. -c help\n";
}

}

int main(int argc, char **argv) {
    modtui::Config config;
    // --library applies to this run only and is not saved
    std::filesystem::path library = config.get_library();
    std::vector<modtui::Command> startup_commands;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if ((arg == "--library" || arg == "-c") && i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            return 1;
        }
        if (arg == "--library") {
            library = argv[++i];
        } else if (arg == "-c") {
            modtui::ParseError error;
            auto command = modtui::parse_command(argv[++i], error);
            if (!command) {
                std::cerr << "Invalid startup command '" << argv[i] << "': " << modtui::describe(error) << std::endl;
                return 1;
            }
            startup_commands.push_back(*command);
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!std::filesystem::is_directory(library)) {
        std::cerr << "Library not found: " << library << std::endl;
        return 1;
    }

    try {
        modtui::init_logging(config.log_path(), spdlog::level::from_str(config.get_log_level()));
        spdlog::info("Starting with library {}", library.string());

        modtui::LocalApiClient api_client(library, config.session_path());
        modtui::Player player;
        player.set_volume(config.get_volume());

        modtui::Shared<modtui::ApiClient> api(api_client);
        modtui::Shared<modtui::PlaybackControl> playback(player);

        modtui::App app(api, playback, modtui::theme_by_name(config.get_theme()));
        if (api.with([](modtui::ApiClient &client) { return client.is_login(); })) {
            app.init_after_login();
        } else {
            app.enqueue(modtui::Command::goto_screen(modtui::ScreenId::Login));
        }
        for (auto &command : startup_commands) {
            app.enqueue(command);
        }

        app.run(std::chrono::milliseconds(config.get_tick_ms()));

        player.stop();
        config.save();
        spdlog::info("Exiting");
        modtui::shutdown_logging();
        return 0;
    } catch (const std::exception &ex) {
        spdlog::critical("Fatal error: {}", ex.what());
        std::cerr << "Fatal error: " << ex.what() << std::endl;
    }
    modtui::shutdown_logging();
    return 1;
}

#include "config.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace modtui {

namespace {

std::filesystem::path home_dir() {
    const char *home = std::getenv("HOME");
    if (!home || strlen(home) == 0) {
        return {};
    }
    return home;
}

std::string trim(const std::string &value) {
    auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

}

Config::Config() {
    auto home = home_dir();
    library_ = home.empty() ? std::filesystem::path("Music") : home / "Music";
    load();
}

std::filesystem::path Config::config_dir() const {
    const char *xdg_config = std::getenv("XDG_CONFIG_HOME");
    std::filesystem::path dir;

    if (xdg_config && strlen(xdg_config) > 0) {
        dir = xdg_config;
    } else {
        auto home = home_dir();
        if (home.empty()) {
            return ".";
        }
        dir = home / ".config";
    }

    dir /= "modtui";

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);

    return dir;
}

std::filesystem::path Config::get_config_path() const {
    return config_dir() / "config.ini";
}

void Config::load() {
    auto config_path = get_config_path();

    std::ifstream file(config_path);
    if (!file) {
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        parse_line(line);
    }
}

void Config::set_volume(double volume) {
    volume_ = std::clamp(volume, 0.0, 1.0);
}

void Config::parse_line(const std::string &line) {
    if (line.empty() || line[0] == '#' || line[0] == ';') {
        return;
    }

    auto pos = line.find('=');
    if (pos == std::string::npos) {
        return;
    }

    std::string key = trim(line.substr(0, pos));
    std::string value = trim(line.substr(pos + 1));

    try {
        if (key == "volume") {
            set_volume(std::stod(value));
        } else if (key == "theme") {
            theme_ = value;
        } else if (key == "library") {
            if (!value.empty()) {
                library_ = value;
            }
        } else if (key == "log_level") {
            // from_str maps unknown names to off
            if (spdlog::level::from_str(value) == spdlog::level::off && value != "off") {
                spdlog::warn("Ignoring unknown log level: {}", value);
            } else {
                log_level_ = value;
            }
        } else if (key == "tick_ms") {
            tick_ms_ = std::clamp(std::stoi(value), 10, 1000);
        }
    } catch (const std::logic_error &) {
        spdlog::warn("Ignoring invalid value for '{}': {}", key, value);
    }
}

void Config::save() const {
    auto config_path = get_config_path();

    std::ofstream file(config_path);
    if (!file) {
        spdlog::error("Failed to save config to: {}", config_path.string());
        return;
    }

    file << "# modtui configuration\n";
    file << "# Volume (0.0 - 1.0)\n";
    file << "volume=" << volume_ << "\n";
    file << "\n";
    file << "# Theme (dark, light)\n";
    file << "theme=" << theme_ << "\n";
    file << "\n";
    file << "# Library root; each sub-directory is an account\n";
    file << "library=" << library_.string() << "\n";
    file << "\n";
    file << "# Log level (trace, debug, info, warn, err, critical, off)\n";
    file << "log_level=" << log_level_ << "\n";
    file << "\n";
    file << "# Milliseconds between ticks (10 - 1000)\n";
    file << "tick_ms=" << tick_ms_ << "\n";
}

}

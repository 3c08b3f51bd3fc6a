#pragma once

#include <filesystem>
#include <string>

namespace modtui {

class Config {
public:
    Config();

    void load();
    void save() const;

    double get_volume() const { return volume_; }
    std::string get_theme() const { return theme_; }
    std::filesystem::path get_library() const { return library_; }
    std::string get_log_level() const { return log_level_; }
    int get_tick_ms() const { return tick_ms_; }

    void set_volume(double volume);

    std::filesystem::path config_dir() const;
    std::filesystem::path session_path() const { return config_dir() / "session"; }
    std::filesystem::path log_path() const { return config_dir() / "modtui.log"; }

private:
    std::filesystem::path get_config_path() const;
    void parse_line(const std::string &line);

    double volume_{1.0};
    std::string theme_{"dark"};
    std::filesystem::path library_;
    std::string log_level_{"info"};
    int tick_ms_{50};
};

}

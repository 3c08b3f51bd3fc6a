#pragma once

#include <string>

#include <ftxui/screen/color.hpp>

namespace modtui {

struct Theme {
    ftxui::Color background;
    ftxui::Color panel;
    ftxui::Color panel_alt;
    ftxui::Color accent;
    ftxui::Color border;
    ftxui::Color text;
    ftxui::Color text_dim;
    ftxui::Color success;
    ftxui::Color warning;
};

// Unknown names fall back to the dark theme.
const Theme &theme_by_name(const std::string &name);

}

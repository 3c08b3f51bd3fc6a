#include "theme.hpp"

namespace modtui {

namespace {

const Theme kDarkTheme{ftxui::Color::RGB(16, 18, 26),    ftxui::Color::RGB(26, 28, 38),
                       ftxui::Color::RGB(32, 34, 46),    ftxui::Color::RGB(129, 200, 190),
                       ftxui::Color::RGB(118, 92, 199),  ftxui::Color::RGB(230, 230, 230),
                       ftxui::Color::RGB(160, 164, 182), ftxui::Color::RGB(124, 200, 146),
                       ftxui::Color::RGB(230, 196, 84)};

const Theme kLightTheme{ftxui::Color::RGB(246, 246, 242), ftxui::Color::RGB(236, 236, 230),
                        ftxui::Color::RGB(224, 226, 218), ftxui::Color::RGB(36, 112, 120),
                        ftxui::Color::RGB(120, 96, 180),  ftxui::Color::RGB(32, 32, 36),
                        ftxui::Color::RGB(110, 112, 124), ftxui::Color::RGB(46, 128, 70),
                        ftxui::Color::RGB(168, 120, 20)};

}

const Theme &theme_by_name(const std::string &name) {
    if (name == "light") {
        return kLightTheme;
    }
    return kDarkTheme;
}

}

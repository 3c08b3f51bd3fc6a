#pragma once

#include "command.hpp"

#include <string>
#include <vector>

#include <ftxui/component/event.hpp>

namespace modtui {

struct KeyBinding {
    ftxui::Event event;
    std::string label;
    Command command;
};

const std::vector<KeyBinding> &normal_mode_keymap();

// Mouse, cursor reports and tick events are not key presses.
bool is_key_event(const ftxui::Event &event);

// Unmapped keys translate to Nop.
Command command_from_key(const ftxui::Event &event);

}

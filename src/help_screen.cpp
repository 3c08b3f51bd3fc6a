#include "help_screen.hpp"
#include "keymap.hpp"

namespace modtui {

namespace {

std::string describe_command(const Command &command) {
    if (command.kind == CommandKind::GotoScreen) {
        return "GotoScreen(" + to_string(command.screen) + ")";
    }
    return to_string(command.kind);
}

}

HelpScreen::HelpScreen() : view_(ftxui::text("")) {
    lines_.emplace_back("Keys", "");
    for (const auto &binding : normal_mode_keymap()) {
        if (lines_.size() > 1 && lines_.back().second == describe_command(binding.command)) {
            lines_.back().first += ", " + binding.label;
            continue;
        }
        lines_.emplace_back(binding.label, describe_command(binding.command));
    }

    lines_.emplace_back("", "");
    lines_.emplace_back("Commands", "");
    for (const auto &spec : command_vocabulary()) {
        std::string usage = ":" + spec.usage;
        for (const auto &alias : spec.aliases) {
            usage += " | :" + alias;
        }
        lines_.emplace_back(usage, spec.summary);
    }
}

bool HelpScreen::handle_event(const Command &command) {
    switch (command.kind) {
        case CommandKind::Up:
            if (offset_ == 0) {
                return false;
            }
            --offset_;
            return true;
        case CommandKind::Down:
            if (offset_ + 1 >= lines_.size()) {
                return false;
            }
            ++offset_;
            return true;
        default:
            return false;
    }
}

void HelpScreen::update_view(const Theme &theme) {
    using namespace ftxui;

    std::vector<Elements> rows;
    for (std::size_t i = offset_; i < lines_.size(); ++i) {
        const auto &[left, right] = lines_[i];
        if (right.empty()) {
            rows.push_back({text(left) | bold | color(theme.accent), text("")});
        } else {
            rows.push_back({text("  " + left + "  ") | color(theme.success), text(right) | color(theme.text)});
        }
    }

    view_ = window(text(" Help ") | color(theme.accent), gridbox(std::move(rows)) | yflex | bgcolor(theme.panel)) |
            color(theme.border) | bgcolor(theme.background);
}

ftxui::Element HelpScreen::draw() const {
    return view_;
}

}

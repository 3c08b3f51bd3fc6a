#include "keymap.hpp"

namespace modtui {

const std::vector<KeyBinding> &normal_mode_keymap() {
    using ftxui::Event;
    static const std::vector<KeyBinding> keymap = {
        {Event::Character('k'), "k", CommandKind::Up},
        {Event::ArrowUp, "Up", CommandKind::Up},
        {Event::Character('j'), "j", CommandKind::Down},
        {Event::ArrowDown, "Down", CommandKind::Down},
        {Event::Character(' '), "Space", CommandKind::TogglePlay},
        {Event::Character(','), ",", CommandKind::PrevTrack},
        {Event::Character('.'), ".", CommandKind::NextTrack},
        {Event::Return, "Enter", CommandKind::Play},
        {Event::Escape, "Esc", CommandKind::Esc},
        {Event::Character('r'), "r", CommandKind::ToggleRepeat},
        {Event::Character('s'), "s", CommandKind::ToggleShuffle},
        {Event::Character('g'), "g", CommandKind::GotoTop},
        {Event::Character('G'), "G", CommandKind::GotoBottom},
        {Event::ArrowRight, "Right", CommandKind::NextPanel},
        {Event::Tab, "Tab", CommandKind::NextPanel},
        {Event::ArrowLeft, "Left", CommandKind::PrevPanel},
        {Event::TabReverse, "Shift-Tab", CommandKind::PrevPanel},
        {Event::Character('1'), "1", Command::goto_screen(ScreenId::Main)},
        {Event::Character('0'), "0", Command::goto_screen(ScreenId::Help)},
        {Event::F1, "F1", Command::goto_screen(ScreenId::Help)},
        {Event::Character('n'), "n", Command::new_playlist(std::nullopt)},
        {Event::Character('p'), "p", CommandKind::PlaylistAdd},
        {Event::Character('x'), "x", CommandKind::SelectPlaylist},
        {Event::Character('q'), "q", CommandKind::Quit},
        {Event::Character(':'), ":", CommandKind::EnterCommand},
    };
    return keymap;
}

bool is_key_event(const ftxui::Event &event) {
    if (event == ftxui::Event::Custom) {
        return false;
    }
    return !event.is_mouse() && !event.is_cursor_position() && !event.is_cursor_shape();
}

Command command_from_key(const ftxui::Event &event) {
    for (const auto &binding : normal_mode_keymap()) {
        if (binding.event == event) {
            return binding.command;
        }
    }
    return Command(CommandKind::Nop);
}

}

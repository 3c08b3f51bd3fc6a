#include "keymap.hpp"

#include <cassert>
#include <iostream>

using ftxui::Event;
using modtui::Command;
using modtui::CommandKind;
using modtui::ScreenId;
using modtui::command_from_key;

int main() {
    assert(command_from_key(Event::Character('k')) == Command(CommandKind::Up));
    assert(command_from_key(Event::ArrowUp) == Command(CommandKind::Up));
    assert(command_from_key(Event::Character('j')) == Command(CommandKind::Down));
    assert(command_from_key(Event::ArrowDown) == Command(CommandKind::Down));
    assert(command_from_key(Event::ArrowRight) == Command(CommandKind::NextPanel));
    assert(command_from_key(Event::Tab) == Command(CommandKind::NextPanel));
    assert(command_from_key(Event::ArrowLeft) == Command(CommandKind::PrevPanel));
    assert(command_from_key(Event::TabReverse) == Command(CommandKind::PrevPanel));
    assert(command_from_key(Event::Character(' ')) == Command(CommandKind::TogglePlay));
    assert(command_from_key(Event::Character(',')) == Command(CommandKind::PrevTrack));
    assert(command_from_key(Event::Character('.')) == Command(CommandKind::NextTrack));
    assert(command_from_key(Event::Return) == Command(CommandKind::Play));
    assert(command_from_key(Event::Escape) == Command(CommandKind::Esc));
    assert(command_from_key(Event::Character('r')) == Command(CommandKind::ToggleRepeat));
    assert(command_from_key(Event::Character('s')) == Command(CommandKind::ToggleShuffle));
    assert(command_from_key(Event::Character('g')) == Command(CommandKind::GotoTop));
    assert(command_from_key(Event::Character('G')) == Command(CommandKind::GotoBottom));
    assert(command_from_key(Event::Character('1')) == Command::goto_screen(ScreenId::Main));
    assert(command_from_key(Event::Character('0')) == Command::goto_screen(ScreenId::Help));
    assert(command_from_key(Event::F1) == Command::goto_screen(ScreenId::Help));
    assert(command_from_key(Event::Character('n')) == Command::new_playlist(std::nullopt));
    assert(command_from_key(Event::Character('p')) == Command(CommandKind::PlaylistAdd));
    assert(command_from_key(Event::Character('x')) == Command(CommandKind::SelectPlaylist));
    assert(command_from_key(Event::Character('q')) == Command(CommandKind::Quit));
    assert(command_from_key(Event::Character(':')) == Command(CommandKind::EnterCommand));

    assert(command_from_key(Event::Character('z')) == Command(CommandKind::Nop));
    assert(command_from_key(Event::Character('Q')) == Command(CommandKind::Nop));
    assert(command_from_key(Event::Character('K')) == Command(CommandKind::Nop));
    assert(command_from_key(Event::Character('2')) == Command(CommandKind::Nop));
    assert(command_from_key(Event::Backspace) == Command(CommandKind::Nop));

    assert(modtui::is_key_event(Event::Character('a')));
    assert(modtui::is_key_event(Event::Escape));
    assert(!modtui::is_key_event(Event::Custom));

    ftxui::Mouse mouse;
    mouse.button = ftxui::Mouse::Left;
    mouse.motion = ftxui::Mouse::Released;
    assert(!modtui::is_key_event(Event::Mouse("", mouse)));

    for (const auto &binding : modtui::normal_mode_keymap()) {
        assert(!binding.label.empty());
        assert(command_from_key(binding.event) == binding.command);
    }

    std::cout << "All keymap tests passed." << std::endl;
    return 0;
}

#include "command.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <optional>
#include <string>

using modtui::Command;
using modtui::CommandKind;
using modtui::ParseError;
using modtui::ParseErrorKind;
using modtui::ScreenId;
using modtui::parse_command;

namespace {

std::optional<Command> parse(const std::string &text) {
    ParseError error;
    return parse_command(text, error);
}

ParseError parse_error(const std::string &text) {
    ParseError error;
    auto command = parse_command(text, error);
    assert(!command);
    return error;
}

}

int main() {
    assert(parse("quit") == Command(CommandKind::Quit));
    assert(parse("q") == Command(CommandKind::Quit));
    assert(parse("exit") == Command(CommandKind::Quit));
    assert(parse(":quit") == Command(CommandKind::Quit));
    assert(parse("  :q  ") == Command(CommandKind::Quit));

    assert(parse("down") == Command(CommandKind::Down));
    assert(parse("next-panel") == Command(CommandKind::NextPanel));
    assert(parse("pause") == Command(CommandKind::TogglePlay));
    assert(parse("logout") == Command(CommandKind::Logout));
    assert(parse("select-playlist") == Command(CommandKind::SelectPlaylist));

    assert(parse("help") == Command::goto_screen(ScreenId::Help));
    assert(parse("h") == Command::goto_screen(ScreenId::Help));
    assert(parse("login") == Command::goto_screen(ScreenId::Login));
    assert(parse("screen main") == Command::goto_screen(ScreenId::Main));
    assert(parse("screen help") == Command::goto_screen(ScreenId::Help));

    assert(parse("new-playlist") == Command::new_playlist(std::nullopt));
    auto named = parse("np  Late   Night ");
    assert(named && named->kind == CommandKind::NewPlaylist);
    assert(named->playlist_name == std::optional<std::string>("Late Night"));

    assert(parse_error("").kind == ParseErrorKind::Empty);
    assert(parse_error(":").kind == ParseErrorKind::Empty);

    auto unknown = parse_error("bogus");
    assert(unknown.kind == ParseErrorKind::UnknownCommand);
    assert(unknown.token == "bogus");
    assert(modtui::describe(unknown) == "unknown command: bogus");

    auto extra = parse_error("quit now");
    assert(extra.kind == ParseErrorKind::UnexpectedArgument);
    assert(extra.token == "now");

    assert(parse_error("screen").kind == ParseErrorKind::MissingArgument);
    assert(parse_error("screen main help").kind == ParseErrorKind::UnexpectedArgument);

    auto screen = parse_error("screen playlists");
    assert(screen.kind == ParseErrorKind::UnknownScreen);
    assert(modtui::describe(screen).find("playlists") != std::string::npos);

    assert(parse_error("QUIT").kind == ParseErrorKind::UnknownCommand);

    const auto &vocabulary = modtui::command_vocabulary();
    for (const char *name : {"quit", "help", "logout", "screen", "new-playlist"}) {
        assert(std::any_of(vocabulary.begin(), vocabulary.end(),
                           [&](const modtui::CommandSpec &spec) { return spec.name == name; }));
    }

    assert(modtui::to_string(ScreenId::Login) == "login");
    assert(modtui::to_string(CommandKind::GotoBottom) == "GotoBottom");

    std::cout << "All command parser tests passed." << std::endl;
    return 0;
}

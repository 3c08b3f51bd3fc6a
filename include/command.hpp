#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modtui {

enum class ScreenId {
    Main,
    Login,
    Help,
};

enum class AppMode {
    Normal,
    CommandEntry,
};

enum class CommandKind {
    Up,
    Down,
    NextPanel,
    PrevPanel,
    TogglePlay,
    PrevTrack,
    NextTrack,
    Play,
    Esc,
    ToggleRepeat,
    ToggleShuffle,
    GotoTop,
    GotoBottom,
    GotoScreen,
    NewPlaylist,
    PlaylistAdd,
    SelectPlaylist,
    Quit,
    EnterCommand,
    Logout,
    Nop,
};

struct Command {
    CommandKind kind{CommandKind::Nop};
    ScreenId screen{ScreenId::Main};
    std::optional<std::string> playlist_name;

    Command() = default;
    Command(CommandKind k) : kind(k) {}

    static Command goto_screen(ScreenId target);
    static Command new_playlist(std::optional<std::string> name);

    bool operator==(const Command &other) const = default;
};

enum class ParseErrorKind {
    Empty,
    UnknownCommand,
    UnexpectedArgument,
    MissingArgument,
    UnknownScreen,
};

struct ParseError {
    ParseErrorKind kind{ParseErrorKind::Empty};
    std::string token;
};

struct CommandSpec {
    std::string name;
    std::vector<std::string> aliases;
    std::string usage;
    std::string summary;
};

std::string to_string(ScreenId screen);
std::string to_string(CommandKind kind);

// Accepts an optional leading ':'. On failure returns nullopt and fills error.
std::optional<Command> parse_command(std::string_view input, ParseError &error);
std::string describe(const ParseError &error);

const std::vector<CommandSpec> &command_vocabulary();

}

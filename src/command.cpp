#include "command.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace modtui {

namespace {

struct Entry {
    CommandSpec spec;
    Command command;
    bool takes_screen{false};
    bool takes_name{false};
};

const std::vector<Entry> &entries() {
    static const std::vector<Entry> table = {
        {{"quit", {"q", "exit"}, "quit", "leave the player"}, CommandKind::Quit},
        {{"up", {}, "up", "move selection up"}, CommandKind::Up},
        {{"down", {}, "down", "move selection down"}, CommandKind::Down},
        {{"next-panel", {}, "next-panel", "focus the next panel"}, CommandKind::NextPanel},
        {{"prev-panel", {}, "prev-panel", "focus the previous panel"}, CommandKind::PrevPanel},
        {{"play", {}, "play", "play or open the selection"}, CommandKind::Play},
        {{"esc", {}, "esc", "cancel the current action"}, CommandKind::Esc},
        {{"toggle-play", {"pause"}, "toggle-play", "pause or resume"}, CommandKind::TogglePlay},
        {{"prev", {}, "prev", "previous track"}, CommandKind::PrevTrack},
        {{"next", {}, "next", "next track"}, CommandKind::NextTrack},
        {{"repeat", {}, "repeat", "toggle repeat"}, CommandKind::ToggleRepeat},
        {{"shuffle", {}, "shuffle", "toggle shuffle"}, CommandKind::ToggleShuffle},
        {{"top", {}, "top", "jump to the first item"}, CommandKind::GotoTop},
        {{"bottom", {}, "bottom", "jump to the last item"}, CommandKind::GotoBottom},
        {{"main", {}, "main", "show the library screen"}, Command::goto_screen(ScreenId::Main)},
        {{"login", {}, "login", "show the login screen"}, Command::goto_screen(ScreenId::Login)},
        {{"help", {"h"}, "help", "show this help"}, Command::goto_screen(ScreenId::Help)},
        {{"screen", {}, "screen <main|login|help>", "switch screen"},
         CommandKind::GotoScreen, true, false},
        {{"new-playlist", {"np"}, "new-playlist [name]", "create a playlist"},
         Command::new_playlist(std::nullopt), false, true},
        {{"add", {"playlist-add"}, "add", "add the selection to a playlist"}, CommandKind::PlaylistAdd},
        {{"select", {"select-playlist"}, "select", "select a playlist"}, CommandKind::SelectPlaylist},
        {{"logout", {}, "logout", "end the current session"}, CommandKind::Logout},
    };
    return table;
}

std::vector<std::string> tokenize(std::string_view input) {
    std::vector<std::string> tokens;
    std::istringstream stream{std::string(input)};
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

const Entry *find_entry(const std::string &word) {
    for (const auto &entry : entries()) {
        if (entry.spec.name == word ||
            std::find(entry.spec.aliases.begin(), entry.spec.aliases.end(), word) != entry.spec.aliases.end()) {
            return &entry;
        }
    }
    return nullptr;
}

std::optional<ScreenId> screen_from_name(const std::string &name) {
    if (name == "main") return ScreenId::Main;
    if (name == "login") return ScreenId::Login;
    if (name == "help") return ScreenId::Help;
    return std::nullopt;
}

}

Command Command::goto_screen(ScreenId target) {
    Command command(CommandKind::GotoScreen);
    command.screen = target;
    return command;
}

Command Command::new_playlist(std::optional<std::string> name) {
    Command command(CommandKind::NewPlaylist);
    command.playlist_name = std::move(name);
    return command;
}

std::string to_string(ScreenId screen) {
    switch (screen) {
        case ScreenId::Main:
            return "main";
        case ScreenId::Login:
            return "login";
        case ScreenId::Help:
            return "help";
    }
    return "unknown";
}

std::string to_string(CommandKind kind) {
    switch (kind) {
        case CommandKind::Up: return "Up";
        case CommandKind::Down: return "Down";
        case CommandKind::NextPanel: return "NextPanel";
        case CommandKind::PrevPanel: return "PrevPanel";
        case CommandKind::TogglePlay: return "TogglePlay";
        case CommandKind::PrevTrack: return "PrevTrack";
        case CommandKind::NextTrack: return "NextTrack";
        case CommandKind::Play: return "Play";
        case CommandKind::Esc: return "Esc";
        case CommandKind::ToggleRepeat: return "ToggleRepeat";
        case CommandKind::ToggleShuffle: return "ToggleShuffle";
        case CommandKind::GotoTop: return "GotoTop";
        case CommandKind::GotoBottom: return "GotoBottom";
        case CommandKind::GotoScreen: return "GotoScreen";
        case CommandKind::NewPlaylist: return "NewPlaylist";
        case CommandKind::PlaylistAdd: return "PlaylistAdd";
        case CommandKind::SelectPlaylist: return "SelectPlaylist";
        case CommandKind::Quit: return "Quit";
        case CommandKind::EnterCommand: return "EnterCommand";
        case CommandKind::Logout: return "Logout";
        case CommandKind::Nop: return "Nop";
    }
    return "Unknown";
}

std::optional<Command> parse_command(std::string_view input, ParseError &error) {
    auto first = input.find_first_not_of(" \t");
    if (first != std::string_view::npos && input[first] == ':') {
        input.remove_prefix(first + 1);
    }

    auto tokens = tokenize(input);
    if (tokens.empty()) {
        error = {ParseErrorKind::Empty, ""};
        return std::nullopt;
    }

    const Entry *entry = find_entry(tokens.front());
    if (!entry) {
        error = {ParseErrorKind::UnknownCommand, tokens.front()};
        return std::nullopt;
    }

    if (entry->takes_screen) {
        if (tokens.size() < 2) {
            error = {ParseErrorKind::MissingArgument, tokens.front()};
            return std::nullopt;
        }
        if (tokens.size() > 2) {
            error = {ParseErrorKind::UnexpectedArgument, tokens[2]};
            return std::nullopt;
        }
        auto target = screen_from_name(tokens[1]);
        if (!target) {
            error = {ParseErrorKind::UnknownScreen, tokens[1]};
            return std::nullopt;
        }
        return Command::goto_screen(*target);
    }

    if (entry->takes_name) {
        if (tokens.size() == 1) {
            return Command::new_playlist(std::nullopt);
        }
        std::string name = tokens[1];
        for (std::size_t i = 2; i < tokens.size(); ++i) {
            name += ' ' + tokens[i];
        }
        return Command::new_playlist(std::move(name));
    }

    if (tokens.size() > 1) {
        error = {ParseErrorKind::UnexpectedArgument, tokens[1]};
        return std::nullopt;
    }
    return entry->command;
}

std::string describe(const ParseError &error) {
    switch (error.kind) {
        case ParseErrorKind::Empty:
            return "empty command";
        case ParseErrorKind::UnknownCommand:
            return "unknown command: " + error.token;
        case ParseErrorKind::UnexpectedArgument:
            return "unexpected argument: " + error.token;
        case ParseErrorKind::MissingArgument:
            return "missing argument for: " + error.token;
        case ParseErrorKind::UnknownScreen:
            return "unknown screen: " + error.token + " (expected main, login or help)";
    }
    return "invalid command";
}

const std::vector<CommandSpec> &command_vocabulary() {
    static const std::vector<CommandSpec> specs = [] {
        std::vector<CommandSpec> result;
        result.reserve(entries().size());
        for (const auto &entry : entries()) {
            result.push_back(entry.spec);
        }
        return result;
    }();
    return specs;
}

}

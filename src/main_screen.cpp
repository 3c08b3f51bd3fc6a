#include "main_screen.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace modtui {

namespace {

constexpr int kPlaylistPanelWidth = 30;

}

MainScreen::MainScreen(Shared<PlaybackControl> &player)
    : player_(player), view_(ftxui::text("")) {}

void MainScreen::update_playlist_model(const std::string &name, Playlist playlist) {
    playlist.name = name;
    auto existing = std::find_if(playlists_.begin(), playlists_.end(),
                                 [&](const Playlist &p) { return p.name == name; });
    if (existing != playlists_.end()) {
        *existing = std::move(playlist);
    } else {
        playlists_.push_back(std::move(playlist));
    }
    if (selected_playlist_ >= playlists_.size()) {
        selected_playlist_ = 0;
    }
    selected_track_ = std::min(selected_track_, track_count() > 0 ? track_count() - 1 : 0);
}

const Playlist *MainScreen::current_playlist() const {
    if (selected_playlist_ >= playlists_.size()) {
        return nullptr;
    }
    return &playlists_[selected_playlist_];
}

std::size_t MainScreen::track_count() const {
    const Playlist *playlist = current_playlist();
    return playlist ? playlist->tracks.size() : 0;
}

bool MainScreen::update_model() {
    auto current = player_.with([](PlaybackControl &player) { return player.current_track(); });
    if (current == now_playing_) {
        return false;
    }
    now_playing_ = std::move(current);
    return true;
}

void MainScreen::move_selection(int delta) {
    if (focus_ == Panel::Playlists) {
        if (playlists_.empty()) {
            return;
        }
        auto last = static_cast<long>(playlists_.size()) - 1;
        auto target = std::clamp(static_cast<long>(selected_playlist_) + delta, 0L, last);
        if (static_cast<std::size_t>(target) != selected_playlist_) {
            selected_playlist_ = static_cast<std::size_t>(target);
            selected_track_ = 0;
        }
        return;
    }

    if (track_count() == 0) {
        return;
    }
    auto last = static_cast<long>(track_count()) - 1;
    selected_track_ = static_cast<std::size_t>(std::clamp(static_cast<long>(selected_track_) + delta, 0L, last));
}

void MainScreen::play_selected() {
    const Playlist *playlist = current_playlist();
    if (!playlist || selected_track_ >= playlist->tracks.size()) {
        return;
    }
    const Track &track = playlist->tracks[selected_track_];

    std::string error_message;
    bool ok = player_.with([&](PlaybackControl &player) { return player.play(track, error_message); });
    if (ok) {
        status_message_ = "Playing: " + track.title;
    } else {
        spdlog::warn("Cannot play {}: {}", track.path.string(), error_message);
        status_message_ = "Cannot play " + track.title + ": " + error_message;
    }
}

bool MainScreen::handle_event(const Command &command) {
    switch (command.kind) {
        case CommandKind::Up:
            move_selection(-1);
            break;
        case CommandKind::Down:
            move_selection(1);
            break;
        case CommandKind::NextPanel:
            focus_ = Panel::Tracks;
            break;
        case CommandKind::PrevPanel:
            focus_ = Panel::Playlists;
            break;
        case CommandKind::Esc:
            status_message_.clear();
            focus_ = Panel::Playlists;
            break;
        case CommandKind::Play:
            if (focus_ == Panel::Playlists) {
                if (current_playlist()) {
                    focus_ = Panel::Tracks;
                }
            } else {
                play_selected();
            }
            break;
        default:
            return false;
    }
    return true;
}

ftxui::Element MainScreen::render_playlists(const Theme &theme) const {
    using namespace ftxui;

    Elements rows;
    for (std::size_t i = 0; i < playlists_.size(); ++i) {
        auto line = text(" " + playlists_[i].name);
        if (i == selected_playlist_) {
            line = line | bgcolor(theme.panel_alt) | color(theme.accent) | bold | focus;
        } else {
            line = line | color(theme.text);
        }
        rows.push_back(line);
    }
    if (rows.empty()) {
        rows.push_back(text("No playlists") | color(theme.text_dim) | dim);
    }

    auto border_color = focus_ == Panel::Playlists ? theme.accent : theme.border;
    return window(text(" Playlists ") | color(theme.accent),
                  vbox(std::move(rows)) | vscroll_indicator | yframe | bgcolor(theme.panel)) |
           color(border_color) | size(WIDTH, EQUAL, kPlaylistPanelWidth);
}

ftxui::Element MainScreen::render_tracks(const Theme &theme) const {
    using namespace ftxui;

    const Playlist *playlist = current_playlist();
    Elements rows;
    if (playlist) {
        for (std::size_t i = 0; i < playlist->tracks.size(); ++i) {
            const Track &track = playlist->tracks[i];
            bool playing = now_playing_ && now_playing_->path == track.path;
            auto line = text((playing ? "▶ " : "  ") + track.title);
            if (i == selected_track_) {
                line = line | bgcolor(theme.panel_alt) | color(theme.accent) | bold | focus;
            } else if (playing) {
                line = line | color(theme.success);
            } else {
                line = line | color(theme.text);
            }
            rows.push_back(line);
        }
    }
    if (rows.empty()) {
        rows.push_back(text("No tracks") | color(theme.text_dim) | dim);
    }

    std::string title = playlist ? " " + playlist->name + " " : " Tracks ";
    auto border_color = focus_ == Panel::Tracks ? theme.accent : theme.border;
    return window(text(title) | color(theme.accent),
                  vbox(std::move(rows)) | vscroll_indicator | yframe | bgcolor(theme.panel)) |
           color(border_color) | flex;
}

void MainScreen::update_view(const Theme &theme) {
    using namespace ftxui;

    auto status = status_message_.empty()
                      ? text(now_playing_ ? "Now playing: " + now_playing_->title : "Stopped") | color(theme.text_dim)
                      : text(status_message_) | color(theme.warning);

    view_ = vbox({
        hbox({render_playlists(theme), render_tracks(theme)}) | flex,
        status,
    }) | bgcolor(theme.background) | color(theme.text);
}

ftxui::Element MainScreen::draw() const {
    return view_;
}

}

#pragma once

#include "library.hpp"
#include "playback.hpp"
#include "screen.hpp"
#include "shared.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace modtui {

class MainScreen : public Screen {
public:
    enum class Panel {
        Playlists,
        Tracks,
    };

    explicit MainScreen(Shared<PlaybackControl> &player);

    void update_playlist_model(const std::string &name, Playlist playlist);

    bool update_model() override;
    bool handle_event(const Command &command) override;
    void update_view(const Theme &theme) override;
    ftxui::Element draw() const override;

    std::size_t playlist_count() const noexcept { return playlists_.size(); }
    std::size_t track_count() const;
    std::size_t selected_playlist() const noexcept { return selected_playlist_; }
    std::size_t selected_track() const noexcept { return selected_track_; }
    Panel focused_panel() const noexcept { return focus_; }
    const std::string &status_message() const noexcept { return status_message_; }
    const std::optional<Track> &now_playing() const noexcept { return now_playing_; }

private:
    void move_selection(int delta);
    void play_selected();
    const Playlist *current_playlist() const;
    ftxui::Element render_playlists(const Theme &theme) const;
    ftxui::Element render_tracks(const Theme &theme) const;

    Shared<PlaybackControl> &player_;
    std::vector<Playlist> playlists_;
    std::size_t selected_playlist_{0};
    std::size_t selected_track_{0};
    Panel focus_{Panel::Playlists};
    std::optional<Track> now_playing_;
    std::string status_message_;
    ftxui::Element view_;
};

}

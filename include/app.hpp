#pragma once

#include "api_client.hpp"
#include "command.hpp"
#include "command_line.hpp"
#include "command_queue.hpp"
#include "help_screen.hpp"
#include "login_screen.hpp"
#include "main_screen.hpp"
#include "playback.hpp"
#include "playback_bar.hpp"
#include "shared.hpp"
#include "theme.hpp"

#include <chrono>
#include <memory>
#include <string>

#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>

namespace modtui {

class App {
public:
    static constexpr int kReservedStripWidth = 26;
    static constexpr int kPlaybackRows = 3;

    App(Shared<ApiClient> &api, Shared<PlaybackControl> &player, const Theme &theme);

    // Runs the full-screen loop until Quit. Collaborator failures are rethrown
    // after the terminal has been released.
    void run(std::chrono::milliseconds tick = std::chrono::milliseconds(50));

    // One tick is update_model(), handle_event(event), draw().
    void update_model();
    bool handle_event(const ftxui::Event &event);
    void update_view();
    ftxui::Element draw();

    void init_after_login();
    void enqueue(Command command);

    ScreenId current_screen() const noexcept { return current_screen_; }
    AppMode current_mode() const noexcept { return current_mode_; }
    bool needs_redraw() const noexcept { return need_re_update_view_; }
    std::size_t pending_commands() const noexcept { return command_queue_.size(); }
    const CommandLine &command_line() const noexcept { return command_line_; }
    const PlaybackBar &playback_bar() const noexcept { return playback_bar_; }
    const MainScreen &main_screen() const noexcept { return *main_screen_; }
    const LoginScreen &login_screen() const noexcept { return *login_screen_; }
    const HelpScreen &help_screen() const noexcept { return *help_screen_; }

private:
    void translate_key(const ftxui::Event &event);
    bool dispatch(const Command &command);
    void commit_command_line();
    void show_prompt(const std::string &text);
    void switch_screen(ScreenId to_screen);
    void switch_to_command_entry_mode();
    void back_to_normal_mode();
    bool update_login_model();
    bool is_login();
    Screen &active_screen();

    Shared<ApiClient> &api_;
    Shared<PlaybackControl> &player_;
    const Theme &theme_;

    ScreenId current_screen_{ScreenId::Main};
    AppMode current_mode_{AppMode::Normal};
    bool need_re_update_view_{true};
    bool redraw_pending_{true};
    CommandQueue command_queue_;

    std::unique_ptr<MainScreen> main_screen_;
    std::unique_ptr<LoginScreen> login_screen_;
    std::unique_ptr<HelpScreen> help_screen_;
    CommandLine command_line_;
    PlaybackBar playback_bar_;
};

}

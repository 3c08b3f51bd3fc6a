#include "app.hpp"
#include "keymap.hpp"

#include <atomic>
#include <thread>
#include <utility>

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <spdlog/spdlog.h>

namespace modtui {

App::App(Shared<ApiClient> &api, Shared<PlaybackControl> &player, const Theme &theme)
    : api_(api),
      player_(player),
      theme_(theme),
      main_screen_(std::make_unique<MainScreen>(player)),
      login_screen_(std::make_unique<LoginScreen>(api)),
      help_screen_(std::make_unique<HelpScreen>()) {}

void App::run(std::chrono::milliseconds tick) {
    auto screen = ftxui::ScreenInteractive::Fullscreen();
    std::atomic<bool> loop_running{true};

    auto renderer = ftxui::Renderer([&] { return draw(); });

    auto component = ftxui::CatchEvent(renderer, [&](ftxui::Event event) {
        update_model();
        if (!handle_event(event)) {
            loop_running = false;
            screen.Exit();
        }
        return true;
    });

    std::thread ticker([&] {
        while (loop_running.load()) {
            std::this_thread::sleep_for(tick);
            screen.PostEvent(ftxui::Event::Custom);
        }
    });

    const auto stop_ticker = [&] {
        loop_running = false;
        if (ticker.joinable()) {
            ticker.join();
        }
    };

    // The loop gives the terminal back while unwinding; the ticker must be
    // joined before the failure leaves this frame.
    try {
        screen.Loop(component);
    } catch (...) {
        stop_ticker();
        throw;
    }
    stop_ticker();
}

void App::update_model() {
    switch (current_screen_) {
        case ScreenId::Help:
            need_re_update_view_ = false;
            break;
        case ScreenId::Login:
            need_re_update_view_ = update_login_model();
            break;
        case ScreenId::Main:
            need_re_update_view_ = main_screen_->update_model();
            break;
    }

    auto [position, duration] = player_.with([](PlaybackControl &player) {
        return std::make_pair(player.position(), player.duration());
    });
    playback_bar_.update(position, duration);
}

bool App::handle_event(const ftxui::Event &event) {
    if (is_key_event(event)) {
        translate_key(event);
    }

    bool keep_running = true;
    if (auto command = command_queue_.pop()) {
        keep_running = dispatch(*command);
    }

    // Several ticks may run before FTXUI draws; a later update_model() must
    // not hide a rebuild an earlier tick asked for.
    redraw_pending_ = redraw_pending_ || need_re_update_view_;
    return keep_running;
}

void App::update_view() {
    if (redraw_pending_ || need_re_update_view_) {
        active_screen().update_view(theme_);
        redraw_pending_ = false;
    }

    command_line_.set_cursor_visibility(current_mode_ == AppMode::CommandEntry);
    command_line_.update_view(theme_);
}

ftxui::Element App::draw() {
    using namespace ftxui;

    update_view();

    auto playback_strip = hbox({
        text("") | size(WIDTH, EQUAL, kReservedStripWidth),
        playback_bar_.draw(theme_) | flex,
    }) | size(HEIGHT, EQUAL, kPlaybackRows);

    return vbox({
        active_screen().draw() | size(HEIGHT, GREATER_THAN, 3) | flex,
        playback_strip,
        command_line_.draw() | size(HEIGHT, EQUAL, 1),
    }) | bgcolor(theme_.background);
}

void App::init_after_login() {
    auto favorite = api_.with([](ApiClient &api) { return api.user_favorite_songlist(); });

    main_screen_ = std::make_unique<MainScreen>(player_);
    login_screen_ = std::make_unique<LoginScreen>(api_);
    if (favorite) {
        spdlog::info("Loaded playlist '{}' with {} tracks", favorite->first, favorite->second.tracks.size());
        main_screen_->update_playlist_model(favorite->first, std::move(favorite->second));
    }

    switch_screen(ScreenId::Main);
}

void App::enqueue(Command command) {
    command_queue_.push(std::move(command));
}

void App::translate_key(const ftxui::Event &event) {
    if (current_mode_ == AppMode::Normal) {
        command_queue_.push(command_from_key(event));
        return;
    }

    if (event == ftxui::Event::Return) {
        commit_command_line();
        back_to_normal_mode();
    } else if (event == ftxui::Event::Escape) {
        command_line_.reset();
        back_to_normal_mode();
    } else {
        command_line_.input(event);
    }
}

bool App::dispatch(const Command &command) {
    spdlog::debug("Dispatching {}", to_string(command.kind));

    switch (command.kind) {
        case CommandKind::Quit:
            return false;
        case CommandKind::GotoScreen:
            switch_screen(command.screen);
            break;
        case CommandKind::EnterCommand:
            switch_to_command_entry_mode();
            command_line_.reset();
            command_line_.set_prompt(":");
            break;
        case CommandKind::Logout:
            login_screen_ = std::make_unique<LoginScreen>(api_);
            api_.with([](ApiClient &api) { api.logout(); });
            break;
        case CommandKind::Down:
        case CommandKind::Up:
        case CommandKind::NextPanel:
        case CommandKind::PrevPanel:
        case CommandKind::Esc:
        case CommandKind::Play: {
            bool screen_result = active_screen().handle_event(command);
            need_re_update_view_ = need_re_update_view_ || screen_result;
            break;
        }
        default:
            break;
    }
    return true;
}

void App::commit_command_line() {
    std::string input = command_line_.get_contents();
    command_line_.reset();

    ParseError error;
    if (auto command = parse_command(input, error)) {
        command_queue_.push(std::move(*command));
        return;
    }
    if (error.kind == ParseErrorKind::Empty) {
        return;
    }
    spdlog::debug("Rejected command '{}': {}", input, describe(error));
    show_prompt(describe(error));
}

void App::show_prompt(const std::string &text) {
    command_line_.show_message(text);
}

void App::switch_screen(ScreenId to_screen) {
    if (to_screen == ScreenId::Login && is_login()) {
        show_prompt("you have to logout from current account first!");
        return;
    }

    need_re_update_view_ = true;
    current_screen_ = to_screen;
    spdlog::debug("Switched to {} screen", to_string(to_screen));
}

void App::switch_to_command_entry_mode() {
    current_mode_ = AppMode::CommandEntry;
}

void App::back_to_normal_mode() {
    current_mode_ = AppMode::Normal;
}

bool App::update_login_model() {
    bool need_redraw = login_screen_->update_model();

    if (is_login()) {
        init_after_login();
        return true;
    }
    return need_redraw;
}

bool App::is_login() {
    return api_.with([](ApiClient &api) { return api.is_login(); });
}

Screen &App::active_screen() {
    switch (current_screen_) {
        case ScreenId::Login:
            return *login_screen_;
        case ScreenId::Help:
            return *help_screen_;
        case ScreenId::Main:
            break;
    }
    return *main_screen_;
}

}

#include "login_screen.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace modtui {

LoginScreen::LoginScreen(Shared<ApiClient> &api) : api_(api), view_(ftxui::text("")) {}

bool LoginScreen::update_model() {
    auto accounts = api_.with([](ApiClient &api) { return api.available_accounts(); });
    if (accounts == accounts_) {
        return false;
    }
    accounts_ = std::move(accounts);
    if (selected_ >= accounts_.size()) {
        selected_ = accounts_.empty() ? 0 : accounts_.size() - 1;
    }
    return true;
}

void LoginScreen::login_selected() {
    if (selected_ >= accounts_.size()) {
        status_message_ = "No account to log in with";
        return;
    }
    const std::string &account = accounts_[selected_];
    std::string error_message;
    bool ok = api_.with([&](ApiClient &api) { return api.login(account, error_message); });
    if (ok) {
        status_message_ = "Logged in as " + account;
    } else {
        spdlog::warn("Login as '{}' failed: {}", account, error_message);
        status_message_ = error_message;
    }
}

bool LoginScreen::handle_event(const Command &command) {
    switch (command.kind) {
        case CommandKind::Up:
            if (selected_ > 0) {
                --selected_;
            }
            break;
        case CommandKind::Down:
            if (selected_ + 1 < accounts_.size()) {
                ++selected_;
            }
            break;
        case CommandKind::Play:
            login_selected();
            break;
        case CommandKind::Esc:
            status_message_.clear();
            break;
        case CommandKind::NextPanel:
        case CommandKind::PrevPanel:
            break;
        default:
            return false;
    }
    return true;
}

void LoginScreen::update_view(const Theme &theme) {
    using namespace ftxui;

    Elements rows;
    for (std::size_t i = 0; i < accounts_.size(); ++i) {
        auto line = text("  " + accounts_[i] + "  ");
        if (i == selected_) {
            line = line | bgcolor(theme.panel_alt) | color(theme.accent) | bold | focus;
        } else {
            line = line | color(theme.text);
        }
        rows.push_back(line);
    }
    if (rows.empty()) {
        rows.push_back(text("No accounts found in the library") | color(theme.text_dim) | dim);
    }

    auto status = status_message_.empty() ? text("↑↓: choose  Enter: log in") | color(theme.text_dim)
                                          : text(status_message_) | color(theme.warning);

    auto dialog = window(text(" Login ") | color(theme.accent),
                         vbox({
                             vbox(std::move(rows)) | vscroll_indicator | yframe | size(HEIGHT, LESS_THAN, 12),
                             separatorLight(),
                             status,
                         }) | bgcolor(theme.panel)) |
                  color(theme.border) | size(WIDTH, GREATER_THAN, 36);

    view_ = dialog | center | flex | bgcolor(theme.background);
}

ftxui::Element LoginScreen::draw() const {
    return view_;
}

}

#pragma once

#include "api_client.hpp"
#include "screen.hpp"
#include "shared.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace modtui {

class LoginScreen : public Screen {
public:
    explicit LoginScreen(Shared<ApiClient> &api);

    bool update_model() override;
    bool handle_event(const Command &command) override;
    void update_view(const Theme &theme) override;
    ftxui::Element draw() const override;

    const std::vector<std::string> &accounts() const noexcept { return accounts_; }
    std::size_t selected() const noexcept { return selected_; }
    const std::string &status_message() const noexcept { return status_message_; }

private:
    void login_selected();

    Shared<ApiClient> &api_;
    std::vector<std::string> accounts_;
    std::size_t selected_{0};
    std::string status_message_;
    ftxui::Element view_;
};

}

#pragma once

#include "screen.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace modtui {

class HelpScreen : public Screen {
public:
    HelpScreen();

    bool update_model() override { return false; }
    bool handle_event(const Command &command) override;
    void update_view(const Theme &theme) override;
    ftxui::Element draw() const override;

private:
    std::vector<std::pair<std::string, std::string>> lines_;
    std::size_t offset_{0};
    ftxui::Element view_;
};

}

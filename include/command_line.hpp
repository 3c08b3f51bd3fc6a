#pragma once

#include "theme.hpp"

#include <cstddef>
#include <string>

#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>

namespace modtui {

class CommandLine {
public:
    CommandLine();

    void reset();
    void set_prompt(const std::string &prompt);
    void set_cursor_visibility(bool visible) noexcept { cursor_visible_ = visible; }
    void show_message(const std::string &message);

    // Edits the buffer. Returns false when the event is not an editing key.
    bool input(const ftxui::Event &event);

    const std::string &get_contents() const noexcept { return contents_; }
    const std::string &prompt() const noexcept { return prompt_; }
    std::size_t cursor() const noexcept { return cursor_; }
    bool cursor_visible() const noexcept { return cursor_visible_; }

    void update_view(const Theme &theme);
    ftxui::Element draw() const;

private:
    std::size_t previous_boundary(std::size_t index) const;
    std::size_t next_boundary(std::size_t index) const;

    std::string prompt_;
    std::string contents_;
    std::size_t cursor_{0};
    bool cursor_visible_{false};
    ftxui::Element view_;
};

}

#include "command_line.hpp"

namespace modtui {

namespace {

bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}

CommandLine::CommandLine() : view_(ftxui::text("")) {}

void CommandLine::reset() {
    prompt_.clear();
    contents_.clear();
    cursor_ = 0;
}

void CommandLine::set_prompt(const std::string &prompt) {
    prompt_ = prompt;
}

void CommandLine::show_message(const std::string &message) {
    contents_ = message;
    cursor_ = contents_.size();
}

std::size_t CommandLine::previous_boundary(std::size_t index) const {
    if (index == 0) {
        return 0;
    }
    --index;
    while (index > 0 && is_continuation_byte(contents_[index])) {
        --index;
    }
    return index;
}

std::size_t CommandLine::next_boundary(std::size_t index) const {
    if (index >= contents_.size()) {
        return contents_.size();
    }
    ++index;
    while (index < contents_.size() && is_continuation_byte(contents_[index])) {
        ++index;
    }
    return index;
}

bool CommandLine::input(const ftxui::Event &event) {
    if (event.is_character()) {
        const std::string &glyph = event.character();
        contents_.insert(cursor_, glyph);
        cursor_ += glyph.size();
        return true;
    }

    if (event == ftxui::Event::Backspace) {
        if (cursor_ > 0) {
            std::size_t start = previous_boundary(cursor_);
            contents_.erase(start, cursor_ - start);
            cursor_ = start;
        }
        return true;
    }

    if (event == ftxui::Event::Delete) {
        if (cursor_ < contents_.size()) {
            contents_.erase(cursor_, next_boundary(cursor_) - cursor_);
        }
        return true;
    }

    if (event == ftxui::Event::ArrowLeft) {
        cursor_ = previous_boundary(cursor_);
        return true;
    }

    if (event == ftxui::Event::ArrowRight) {
        cursor_ = next_boundary(cursor_);
        return true;
    }

    if (event == ftxui::Event::Home) {
        cursor_ = 0;
        return true;
    }

    if (event == ftxui::Event::End) {
        cursor_ = contents_.size();
        return true;
    }

    return false;
}

void CommandLine::update_view(const Theme &theme) {
    using namespace ftxui;

    if (!cursor_visible_) {
        view_ = text(prompt_ + contents_) | color(theme.text_dim) | bgcolor(theme.background);
        return;
    }

    std::string before = contents_.substr(0, cursor_);
    std::size_t end = next_boundary(cursor_);
    std::string under = cursor_ < contents_.size() ? contents_.substr(cursor_, end - cursor_) : " ";
    std::string after = contents_.substr(end);

    view_ = hbox({
        text(prompt_) | color(theme.accent) | bold,
        text(before),
        text(under) | inverted,
        text(after),
        filler(),
    }) | color(theme.text) | bgcolor(theme.background);
}

ftxui::Element CommandLine::draw() const {
    return view_;
}

}

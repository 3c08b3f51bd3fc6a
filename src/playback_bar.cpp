#include "playback_bar.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace modtui {

namespace {

void append_clock(std::ostringstream &oss, std::chrono::milliseconds value) {
    auto total_seconds = std::max<long long>(0, std::chrono::duration_cast<std::chrono::seconds>(value).count());
    oss << std::setw(2) << std::setfill('0') << total_seconds / 60 << ':'
        << std::setw(2) << std::setfill('0') << total_seconds % 60;
}

}

std::string format_playback_label(std::chrono::milliseconds position, std::chrono::milliseconds duration) {
    std::ostringstream oss;
    append_clock(oss, position);
    oss << '/';
    append_clock(oss, duration);
    return oss.str();
}

void PlaybackBar::update(std::optional<std::chrono::milliseconds> position,
                         std::optional<std::chrono::milliseconds> duration) {
    if (!position || !duration) {
        return;
    }
    label_ = format_playback_label(*position, *duration);
    if (duration->count() > 0) {
        ratio_ = std::clamp(static_cast<double>(position->count()) / static_cast<double>(duration->count()), 0.0, 1.0);
    } else {
        ratio_ = 0.0;
    }
}

ftxui::Element PlaybackBar::draw(const Theme &theme) const {
    using namespace ftxui;

    auto bar = gauge(static_cast<float>(ratio_)) | color(theme.accent) | bgcolor(theme.panel_alt);
    auto label = text(label_) | bold | color(theme.text) | center;
    return dbox({bar, label}) | border | color(theme.border) | bgcolor(theme.panel);
}

}

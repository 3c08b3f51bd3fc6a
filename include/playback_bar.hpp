#pragma once

#include "theme.hpp"

#include <chrono>
#include <optional>
#include <string>

#include <ftxui/dom/elements.hpp>

namespace modtui {

// "MM:SS/MM:SS"; minutes are not wrapped at the hour.
std::string format_playback_label(std::chrono::milliseconds position, std::chrono::milliseconds duration);

class PlaybackBar {
public:
    static constexpr const char *kEmptyLabel = "--:--/--:--";

    // Leaves the previous label in place unless both values are known.
    void update(std::optional<std::chrono::milliseconds> position,
                std::optional<std::chrono::milliseconds> duration);

    const std::string &label() const noexcept { return label_; }
    double ratio() const noexcept { return ratio_; }

    ftxui::Element draw(const Theme &theme) const;

private:
    std::string label_{kEmptyLabel};
    double ratio_{0.0};
};

}

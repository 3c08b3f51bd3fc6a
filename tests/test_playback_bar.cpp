#include "playback_bar.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>

using namespace std::chrono_literals;
using modtui::PlaybackBar;
using modtui::format_playback_label;

int main() {
    assert(format_playback_label(0ms, 0ms) == "00:00/00:00");
    assert(format_playback_label(65s, 200s) == "01:05/03:20");
    assert(format_playback_label(59999ms, 60s) == "00:59/01:00");
    assert(format_playback_label(3725s, 4000s) == "62:05/66:40");
    assert(format_playback_label(-5s, 10s) == "00:00/00:10");

    PlaybackBar bar;
    assert(bar.label() == PlaybackBar::kEmptyLabel);
    assert(bar.ratio() == 0.0);

    bar.update(std::nullopt, 200000ms);
    assert(bar.label() == "--:--/--:--");

    bar.update(65000ms, 200000ms);
    assert(bar.label() == "01:05/03:20");
    assert(std::abs(bar.ratio() - 0.325) < 1e-9);

    bar.update(std::nullopt, std::nullopt);
    assert(bar.label() == "01:05/03:20");
    bar.update(70000ms, std::nullopt);
    assert(bar.label() == "01:05/03:20");

    bar.update(300000ms, 200000ms);
    assert(bar.ratio() == 1.0);

    bar.update(0ms, 0ms);
    assert(bar.label() == "00:00/00:00");
    assert(bar.ratio() == 0.0);

    std::cout << "All playback bar tests passed." << std::endl;
    return 0;
}

#pragma once

#include "library.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace modtui {

class PlaybackControl {
public:
    virtual ~PlaybackControl() = default;

    virtual bool play(const Track &track, std::string &error_message) = 0;
    virtual std::optional<std::chrono::milliseconds> position() const = 0;
    virtual std::optional<std::chrono::milliseconds> duration() const = 0;
    virtual std::optional<Track> current_track() const = 0;
};

}

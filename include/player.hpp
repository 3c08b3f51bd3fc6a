#pragma once

#include "playback.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <libopenmpt/libopenmpt.hpp>
#include <portaudio.h>

namespace modtui {

class Player : public PlaybackControl {
public:
    explicit Player(int sample_rate = 48000, int buffer_size = 1024);
    ~Player() override;

    Player(const Player &) = delete;
    Player &operator=(const Player &) = delete;

    bool play(const Track &track, std::string &error_message) override;
    void stop();

    void set_volume(double volume);

    std::optional<std::chrono::milliseconds> position() const override;
    std::optional<std::chrono::milliseconds> duration() const override;
    std::optional<Track> current_track() const override;

private:
    void playback_loop();

    int sample_rate_;
    int buffer_size_;
    PaStream *stream_{nullptr};
    bool pa_initialized_{false};
    std::thread playback_thread_;

    mutable std::mutex state_mutex_;
    std::condition_variable stop_cv_;
    bool running_{false};
    bool stop_requested_{false};
    bool stream_running_{false};
    double volume_{1.0};
    std::optional<Track> current_track_;

    mutable std::mutex module_mutex_;
    std::unique_ptr<openmpt::module> module_;
};

}

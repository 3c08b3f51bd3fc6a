#include "player.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>
#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace modtui {

namespace {

// PortAudio probes every host API on start-up and prints the failures.
class SuppressStderr {
public:
    SuppressStderr() {
        fflush(stderr);
        old_stderr_ = dup(STDERR_FILENO);
        int devnull = open("/dev/null", O_WRONLY);
        dup2(devnull, STDERR_FILENO);
        close(devnull);
    }

    ~SuppressStderr() {
        fflush(stderr);
        dup2(old_stderr_, STDERR_FILENO);
        close(old_stderr_);
    }

private:
    int old_stderr_;
};

std::chrono::milliseconds to_millis(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        seconds = 0.0;
    }
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

}

Player::Player(int sample_rate, int buffer_size) : sample_rate_(sample_rate), buffer_size_(buffer_size) {
    PaError err;
    {
        SuppressStderr suppress;
        err = Pa_Initialize();
    }
    if (err != paNoError) {
        throw std::runtime_error(std::string("Failed to initialize PortAudio: ") + Pa_GetErrorText(err));
    }
    pa_initialized_ = true;

    err = Pa_OpenDefaultStream(&stream_, 0, 2, paFloat32, sample_rate_, buffer_size_, nullptr, nullptr);
    if (err != paNoError) {
        Pa_Terminate();
        pa_initialized_ = false;
        throw std::runtime_error(std::string("Failed to open PortAudio stream: ") + Pa_GetErrorText(err));
    }
}

Player::~Player() {
    stop();
    if (stream_) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
    if (pa_initialized_) {
        Pa_Terminate();
        pa_initialized_ = false;
    }
}

bool Player::play(const Track &track, std::string &error_message) {
    std::ifstream file(track.path, std::ios::binary);
    if (!file) {
        error_message = "Unable to open file";
        return false;
    }

    std::unique_ptr<openmpt::module> module;
    try {
        module = std::make_unique<openmpt::module>(file);
    } catch (const openmpt::exception &ex) {
        error_message = ex.what();
        return false;
    }

    stop();

    {
        std::lock_guard module_lock(module_mutex_);
        module_ = std::move(module);
    }
    {
        std::lock_guard lock(state_mutex_);
        current_track_ = track;
        stop_requested_ = false;
        running_ = true;
    }

    PaError err = Pa_StartStream(stream_);
    if (err != paNoError && err != paStreamIsNotStopped) {
        {
            std::lock_guard module_lock(module_mutex_);
            module_.reset();
        }
        std::lock_guard lock(state_mutex_);
        running_ = false;
        current_track_.reset();
        error_message = std::string("Failed to start audio stream: ") + Pa_GetErrorText(err);
        return false;
    }
    {
        std::lock_guard lock(state_mutex_);
        stream_running_ = true;
    }

    playback_thread_ = std::thread(&Player::playback_loop, this);
    spdlog::info("Playing {}", track.path.string());
    return true;
}

void Player::stop() {
    {
        std::lock_guard lock(state_mutex_);
        if (!running_) {
            return;
        }
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
    if (playback_thread_.joinable()) {
        playback_thread_.join();
    }

    std::lock_guard lock(state_mutex_);
    if (stream_running_) {
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError && err != paStreamIsStopped) {
            spdlog::warn("PortAudio stop error: {}", Pa_GetErrorText(err));
        }
        stream_running_ = false;
    }
    running_ = false;
}

void Player::set_volume(double volume) {
    std::lock_guard lock(state_mutex_);
    volume_ = std::clamp(volume, 0.0, 1.0);
}

std::optional<std::chrono::milliseconds> Player::position() const {
    std::lock_guard module_lock(module_mutex_);
    if (!module_) {
        return std::nullopt;
    }
    return to_millis(module_->get_position_seconds());
}

std::optional<std::chrono::milliseconds> Player::duration() const {
    std::lock_guard module_lock(module_mutex_);
    if (!module_) {
        return std::nullopt;
    }
    return to_millis(module_->get_duration_seconds());
}

std::optional<Track> Player::current_track() const {
    std::lock_guard lock(state_mutex_);
    return current_track_;
}

void Player::playback_loop() {
    std::vector<float> buffer(static_cast<std::size_t>(buffer_size_) * 2);

    while (true) {
        double current_volume = 1.0;
        {
            std::lock_guard lock(state_mutex_);
            if (stop_requested_) {
                break;
            }
            current_volume = volume_;
        }

        long frames_rendered = 0;
        {
            std::lock_guard module_lock(module_mutex_);
            frames_rendered = static_cast<long>(
                module_->read_interleaved_stereo(sample_rate_, static_cast<std::size_t>(buffer_size_), buffer.data()));
        }

        if (frames_rendered <= 0) {
            spdlog::info("Track finished");
            std::unique_lock lock(state_mutex_);
            stop_cv_.wait(lock, [&] { return stop_requested_; });
            break;
        }

        if (current_volume != 1.0) {
            for (long i = 0; i < frames_rendered * 2; ++i) {
                buffer[static_cast<std::size_t>(i)] *= static_cast<float>(current_volume);
            }
        }

        PaError err = Pa_WriteStream(stream_, buffer.data(), static_cast<unsigned long>(frames_rendered));
        if (err != paNoError && err != paOutputUnderflowed) {
            spdlog::error("PortAudio error: {}", Pa_GetErrorText(err));
            std::unique_lock lock(state_mutex_);
            stop_cv_.wait(lock, [&] { return stop_requested_; });
            break;
        }
    }
}

}

#include "Player.hpp"
#include "Logger.hpp"
#include "Quantizer.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace soundwave {

Player::Player(std::unique_ptr<hal::PlaybackSink> sink)
    : sink_(std::move(sink))
{
    if (!sink_) {
        throw std::invalid_argument("Player requires a playback sink");
    }
}

Player::~Player() {
    wait();
}

void Player::start(const Sound& sound) {
    const double rounded = std::round(sound.sample_rate());
    if (rounded < 1.0 || rounded > static_cast<double>(std::numeric_limits<unsigned int>::max())) {
        throw std::invalid_argument("Sample rate not playable: " + std::to_string(sound.sample_rate()));
    }

    wait();

    auto samples = quantize(sound);
    playing_.store(true, std::memory_order_release);
    worker_ = std::thread(&Player::run, this, std::move(samples), static_cast<unsigned int>(rounded));
}

bool Player::wait() {
    if (worker_.joinable()) {
        worker_.join();
    }
    return last_result_.load(std::memory_order_acquire);
}

void Player::run(std::vector<int8_t> samples, unsigned int sample_rate) {
    auto& logger = AudioLogger::instance();
    logger.log_message("PLAY", "Playback started");

    bool ok = false;
    try {
        ok = sink_->play(samples, sample_rate);
    } catch (const std::exception& e) {
        logger.log_message("PLAY", e.what());
    }

    if (ok) {
        logger.log_event("PLAY_FRAMES", static_cast<double>(samples.size()));
    } else {
        logger.log_message("PLAY", "Playback failed: device unavailable");
    }

    last_result_.store(ok, std::memory_order_release);
    playing_.store(false, std::memory_order_release);
}

} // namespace soundwave

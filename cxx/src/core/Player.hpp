/**
 * @file Player.hpp
 * @brief Plays a Sound on a worker thread so the caller never blocks on the device.
 */

#ifndef SOUNDWAVE_PLAYER_HPP
#define SOUNDWAVE_PLAYER_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>
#include "PlaybackSink.hpp"
#include "Sound.hpp"

namespace soundwave {

/**
 * @brief Owns a playback sink and one worker thread.
 *
 * There is no cancellation: a started playback runs until the sink has
 * drained it or failed. Starting again, or destroying the Player, waits
 * for the current playback first.
 */
class Player {
public:
    explicit Player(std::unique_ptr<hal::PlaybackSink> sink);
    ~Player();

    Player(const Player&) = delete;
    Player& operator=(const Player&) = delete;

    /**
     * @brief Quantize on the calling thread, then play on the worker.
     * @throws std::invalid_argument if the sample rate rounds below 1 Hz
     */
    void start(const Sound& sound);

    /**
     * @brief Block until the current playback ends.
     * @return false if the device was unavailable or failed.
     */
    bool wait();

    bool is_playing() const { return playing_.load(std::memory_order_acquire); }

private:
    void run(std::vector<int8_t> samples, unsigned int sample_rate);

    std::unique_ptr<hal::PlaybackSink> sink_;
    std::thread worker_;
    std::atomic<bool> playing_{false};
    std::atomic<bool> last_result_{true};
};

} // namespace soundwave

#endif // SOUNDWAVE_PLAYER_HPP

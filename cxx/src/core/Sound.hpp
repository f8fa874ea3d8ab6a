/**
 * @file Sound.hpp
 * @brief Immutable mono sample buffer with its sample rate.
 */

#ifndef SOUNDWAVE_SOUND_HPP
#define SOUNDWAVE_SOUND_HPP

#include <span>
#include <vector>
#include <cstddef>

namespace soundwave {

/**
 * @brief A mono sound: samples in temporal order plus a sample rate.
 *
 * Sounds are created by the synthesis and composition functions (or
 * from_samples()) and never change afterwards.
 */
class Sound {
public:
    static constexpr double DEFAULT_SAMPLE_RATE = 44100.0;
    static constexpr double MAX_AMPLITUDE = 128.0;

    /**
     * @brief Wrap an existing sample buffer.
     *
     * @param samples Samples in temporal order
     * @param sample_rate Samples per second, must be positive and finite
     * @throws std::invalid_argument on a bad sample rate
     */
    static Sound from_samples(std::vector<double> samples, double sample_rate);

    std::span<const double> buffer() const { return buffer_; }
    double sample_rate() const { return sample_rate_; }
    size_t size() const { return buffer_.size(); }
    bool empty() const { return buffer_.empty(); }

    double duration_seconds() const {
        return static_cast<double>(buffer_.size()) / sample_rate_;
    }

private:
    Sound(std::vector<double> buffer, double sample_rate);

    std::vector<double> buffer_;
    double sample_rate_;
};

} // namespace soundwave

#endif // SOUNDWAVE_SOUND_HPP

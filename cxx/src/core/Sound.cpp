#include "Sound.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace soundwave {

Sound::Sound(std::vector<double> buffer, double sample_rate)
    : buffer_(std::move(buffer))
    , sample_rate_(sample_rate)
{
}

Sound Sound::from_samples(std::vector<double> samples, double sample_rate) {
    if (!std::isfinite(sample_rate) || sample_rate <= 0.0) {
        throw std::invalid_argument("Sample rate must be positive, got " + std::to_string(sample_rate));
    }
    return Sound(std::move(samples), sample_rate);
}

} // namespace soundwave

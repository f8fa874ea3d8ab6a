#include "SineGenerator.hpp"
#include <cmath>
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace soundwave {

namespace {
// 2^31 - 1 samples, about 13.5 hours at 44.1 kHz
constexpr long kMaxSamples = std::numeric_limits<int32_t>::max();
}

Sound sine_wave(long length, double sample_rate, double frequency, double amplitude, double phase) {
    if (length < 0) {
        throw std::invalid_argument("Sine wave length must not be negative, got " + std::to_string(length));
    }
    if (!std::isfinite(sample_rate) || sample_rate <= 0.0) {
        throw std::invalid_argument("Sample rate must be positive, got " + std::to_string(sample_rate));
    }

    std::vector<double> buffer(static_cast<size_t>(length));
    const double angular_freq = 2.0 * M_PI * frequency;
    for (size_t i = 0; i < buffer.size(); ++i) {
        buffer[i] = amplitude * std::sin(angular_freq * static_cast<double>(i) / sample_rate + phase);
    }
    return Sound::from_samples(std::move(buffer), sample_rate);
}

Sound sine_wave(double duration_seconds, double frequency) {
    return sine_wave(duration_seconds, frequency, NoteSettings{});
}

Sound sine_wave(double duration_seconds, double frequency, const NoteSettings& settings) {
    if (!std::isfinite(settings.sample_rate) || settings.sample_rate <= 0.0) {
        throw std::invalid_argument("Sample rate must be positive, got " + std::to_string(settings.sample_rate));
    }
    if (!std::isfinite(duration_seconds)) {
        throw std::invalid_argument("Duration must be finite");
    }
    const double samples = std::floor(settings.sample_rate * duration_seconds);
    if (!std::isfinite(samples) || samples > static_cast<double>(kMaxSamples)) {
        throw std::invalid_argument("Duration too long: " + std::to_string(duration_seconds) + " s");
    }
    const long length = static_cast<long>(samples);
    return sine_wave(length, settings.sample_rate, frequency, settings.amplitude, 0.0);
}

} // namespace soundwave

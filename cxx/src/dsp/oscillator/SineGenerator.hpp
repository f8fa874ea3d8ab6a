/**
 * @file SineGenerator.hpp
 * @brief Fixed-length pure sine tone synthesis.
 */

#ifndef SOUNDWAVE_SINE_GENERATOR_HPP
#define SOUNDWAVE_SINE_GENERATOR_HPP

#include "Sound.hpp"

namespace soundwave {

/**
 * @brief Sample rate and peak amplitude used for note synthesis.
 */
struct NoteSettings {
    double sample_rate = Sound::DEFAULT_SAMPLE_RATE;
    double amplitude = Sound::MAX_AMPLITUDE;
};

/**
 * @brief Pure sine wave.
 *
 * sample[i] = amplitude * sin(2 * pi * frequency * i / sample_rate + phase)
 *
 * Frequencies at or above sample_rate / 2 alias; no band-limiting is applied.
 *
 * @param length Number of samples (0 yields an empty Sound)
 * @param sample_rate Samples per second
 * @param frequency Waves per second
 * @param amplitude Peak height (128 recommended)
 * @param phase Phase shift in radians
 * @throws std::invalid_argument if length is negative or sample_rate is not positive
 */
Sound sine_wave(long length, double sample_rate, double frequency, double amplitude, double phase);

/**
 * @brief Sine wave at 44.1 kHz, amplitude 128, phase 0.
 *
 * Length is floor(44100 * duration_seconds).
 */
Sound sine_wave(double duration_seconds, double frequency);

Sound sine_wave(double duration_seconds, double frequency, const NoteSettings& settings);

} // namespace soundwave

#endif // SOUNDWAVE_SINE_GENERATOR_HPP

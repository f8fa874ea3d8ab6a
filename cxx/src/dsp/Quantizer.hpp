/**
 * @file Quantizer.hpp
 * @brief Rescales a sound into signed 8-bit samples for playback.
 */

#ifndef SOUNDWAVE_QUANTIZER_HPP
#define SOUNDWAVE_QUANTIZER_HPP

#include <cstdint>
#include <span>
#include <vector>
#include "Sound.hpp"

namespace soundwave {

/**
 * @brief Squash samples into [-128, 127] using the buffer's own min and max.
 *
 * out[i] = round((x[i] - min) * 255 / (max - min) - 128)
 *
 * The smallest sample always maps to -128 and the largest to 127, so the
 * absolute level of different sounds is not preserved. A buffer whose
 * samples are all equal (including a single sample) maps to all zeros, as
 * does a buffer holding NaN or infinity. Finite samples of any magnitude
 * use the full range.
 */
std::vector<int8_t> quantize(std::span<const double> samples);

inline std::vector<int8_t> quantize(const Sound& sound) {
    return quantize(sound.buffer());
}

} // namespace soundwave

#endif // SOUNDWAVE_QUANTIZER_HPP

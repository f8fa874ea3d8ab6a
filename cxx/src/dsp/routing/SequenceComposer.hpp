/**
 * @file SequenceComposer.hpp
 * @brief Joins sounds end to end into one sound.
 */

#ifndef SOUNDWAVE_SEQUENCE_COMPOSER_HPP
#define SOUNDWAVE_SEQUENCE_COMPOSER_HPP

#include <array>
#include <span>
#include <type_traits>
#include "Sound.hpp"

namespace soundwave {

/**
 * @brief Combine sounds so they are heard one after the next.
 *
 * The result holds the samples of sounds[0], then sounds[1], and so on,
 * with no gap or crossfade at the joins.
 *
 * @throws EmptyCompositionError if sounds is empty
 * @throws SampleRateMismatchError if the sample rates differ
 */
Sound concatenate(std::span<const Sound> sounds);

Sound concatenate(std::span<const Sound* const> sounds);

template<typename... Rest>
Sound concatenate(const Sound& first, const Rest&... rest) {
    static_assert((std::is_same_v<Rest, Sound> && ...), "concatenate() takes Sound arguments");
    const std::array<const Sound*, 1 + sizeof...(Rest)> sounds{&first, &rest...};
    return concatenate(std::span<const Sound* const>(sounds));
}

} // namespace soundwave

#endif // SOUNDWAVE_SEQUENCE_COMPOSER_HPP

/**
 * @file PlaybackSink.hpp
 * @brief Abstract base class for platform-specific playback devices.
 *
 * Hardware/OS audio code stays behind this interface, apart from the
 * synthesis core.
 */

#ifndef SOUNDWAVE_HAL_PLAYBACK_SINK_HPP
#define SOUNDWAVE_HAL_PLAYBACK_SINK_HPP

#include <cstdint>
#include <span>

namespace hal {

/**
 * @brief Plays a complete buffer of mono, signed 8-bit samples.
 */
class PlaybackSink {
public:
    virtual ~PlaybackSink() = default;

    /**
     * @brief Play the samples and block until the device has drained them.
     *
     * @param samples Mono S8 samples in temporal order
     * @param sample_rate Frames per second
     * @return true on success, false if the device was unavailable or failed.
     */
    virtual bool play(std::span<const int8_t> samples, unsigned int sample_rate) = 0;
};

} // namespace hal

#endif // SOUNDWAVE_HAL_PLAYBACK_SINK_HPP

/**
 * @file AlsaDriver.hpp
 * @brief Linux ALSA implementation of the PlaybackSink interface.
 */

#ifndef SOUNDWAVE_HAL_ALSA_DRIVER_HPP
#define SOUNDWAVE_HAL_ALSA_DRIVER_HPP

#include "PlaybackSink.hpp"
#include <alsa/asoundlib.h>
#include <string>
#include <span>

namespace hal {

/**
 * @brief ALSA playback for mono S8 buffers.
 *
 * Each play() call opens the PCM, writes the whole buffer period by period,
 * drains and closes it again. The device is never held between calls.
 */
class AlsaDriver : public PlaybackSink {
public:
    /**
     * @param device ALSA device name.
     * @param period_frames Requested period size (frames per interrupt).
     */
    explicit AlsaDriver(const std::string& device = "default", int period_frames = 512);
    ~AlsaDriver() override;

    bool play(std::span<const int8_t> samples, unsigned int sample_rate) override;

    const std::string& device() const { return device_name_; }
    int period_frames() const { return period_frames_; }

private:
    bool setup_pcm(unsigned int sample_rate);
    bool write_all(std::span<const int8_t> samples);
    bool recover_pcm(int err);
    void close_pcm();

    snd_pcm_t* pcm_handle_;
    std::string device_name_;
    int period_frames_;
};

} // namespace hal

#endif // SOUNDWAVE_HAL_ALSA_DRIVER_HPP

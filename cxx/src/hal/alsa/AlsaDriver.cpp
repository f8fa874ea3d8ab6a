/**
 * @file AlsaDriver.cpp
 * @brief Linux ALSA implementation of the PlaybackSink interface.
 */

#include "AlsaDriver.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <iostream>
#include <thread>

namespace hal {

AlsaDriver::AlsaDriver(const std::string& device, int period_frames)
    : pcm_handle_(nullptr)
    , device_name_(device)
    , period_frames_(period_frames)
{
}

AlsaDriver::~AlsaDriver() {
    close_pcm();
}

void AlsaDriver::close_pcm() {
    if (pcm_handle_) {
        snd_pcm_close(pcm_handle_);
        pcm_handle_ = nullptr;
    }
}

bool AlsaDriver::play(std::span<const int8_t> samples, unsigned int sample_rate) {
    if (!setup_pcm(sample_rate)) {
        close_pcm();
        soundwave::AudioLogger::instance().log_message("ALSA", "Device unavailable");
        return false;
    }

    bool ok = write_all(samples);
    if (ok) {
        int err = snd_pcm_drain(pcm_handle_);
        if (err < 0) {
            std::cerr << "ALSA: Drain failed (" << snd_strerror(err) << ")" << std::endl;
            ok = false;
        }
    }

    close_pcm();
    return ok;
}

bool AlsaDriver::setup_pcm(unsigned int sample_rate) {
    int err;
    snd_pcm_hw_params_t* hw_params = nullptr;

    if ((err = snd_pcm_open(&pcm_handle_, device_name_.c_str(), SND_PCM_STREAM_PLAYBACK, 0)) < 0) {
        std::cerr << "ALSA: Cannot open audio device " << device_name_ << " (" << snd_strerror(err) << ")" << std::endl;
        pcm_handle_ = nullptr;
        return false;
    }

    if ((err = snd_pcm_hw_params_malloc(&hw_params)) < 0) {
        std::cerr << "ALSA: Cannot allocate hardware parameter structure (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    auto fail = [&](const char* what) {
        std::cerr << "ALSA: " << what << " (" << snd_strerror(err) << ")" << std::endl;
        snd_pcm_hw_params_free(hw_params);
        return false;
    };

    if ((err = snd_pcm_hw_params_any(pcm_handle_, hw_params)) < 0) {
        return fail("Cannot initialize hardware parameter structure");
    }

    if ((err = snd_pcm_hw_params_set_access(pcm_handle_, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        return fail("Cannot set access type");
    }

    if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params, SND_PCM_FORMAT_S8)) < 0) {
        return fail("Cannot set sample format S8");
    }

    if ((err = snd_pcm_hw_params_set_channels(pcm_handle_, hw_params, 1)) < 0) {
        return fail("Cannot set mono channel count");
    }

    unsigned int rate = sample_rate;
    if ((err = snd_pcm_hw_params_set_rate_near(pcm_handle_, hw_params, &rate, 0)) < 0) {
        return fail("Cannot set sample rate");
    }
    if (rate != sample_rate) {
        std::cerr << "ALSA: Requested " << sample_rate << " Hz, device runs at " << rate << " Hz" << std::endl;
    }

    snd_pcm_uframes_t frames = static_cast<snd_pcm_uframes_t>(period_frames_);
    if ((err = snd_pcm_hw_params_set_period_size_near(pcm_handle_, hw_params, &frames, 0)) < 0) {
        return fail("Cannot set period size");
    }
    period_frames_ = static_cast<int>(frames);

    unsigned int periods = 4;
    snd_pcm_hw_params_set_periods_near(pcm_handle_, hw_params, &periods, 0);

    if ((err = snd_pcm_hw_params(pcm_handle_, hw_params)) < 0) {
        return fail("Cannot set parameters");
    }

    snd_pcm_hw_params_free(hw_params);

    if ((err = snd_pcm_prepare(pcm_handle_)) < 0) {
        std::cerr << "ALSA: Cannot prepare audio interface for use (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    return true;
}

bool AlsaDriver::write_all(std::span<const int8_t> samples) {
    size_t offset = 0;
    while (offset < samples.size()) {
        const size_t chunk = std::min(samples.size() - offset, static_cast<size_t>(period_frames_));
        snd_pcm_sframes_t written = snd_pcm_writei(pcm_handle_, samples.data() + offset, chunk);
        if (written < 0) {
            if (!recover_pcm(static_cast<int>(written))) {
                std::cerr << "ALSA: Write failed (" << snd_strerror(static_cast<int>(written)) << ")" << std::endl;
                return false;
            }
            continue;
        }
        offset += static_cast<size_t>(written);
    }
    return true;
}

bool AlsaDriver::recover_pcm(int err) {
    if (err == -EPIPE) {
        soundwave::AudioLogger::instance().log_message("ALSA", "Underrun");
        return snd_pcm_prepare(pcm_handle_) >= 0;
    }
    if (err == -ESTRPIPE) {
        while ((err = snd_pcm_resume(pcm_handle_)) == -EAGAIN)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (err < 0) {
            return snd_pcm_prepare(pcm_handle_) >= 0;
        }
        return true;
    }
    if (err == -EAGAIN) {
        return true;
    }
    return false;
}

} // namespace hal

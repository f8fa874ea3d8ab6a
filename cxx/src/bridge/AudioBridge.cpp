/**
 * @file AudioBridge.cpp
 * @brief C-compatible API bridge for the synthesis core.
 */

#include "CInterface.h"
#include "Errors.hpp"
#include "Note.hpp"
#include "Player.hpp"
#include "Quantizer.hpp"
#include "ScoreLoader.hpp"
#include "Sound.hpp"
#include "alsa/AlsaDriver.hpp"
#include "routing/SequenceComposer.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <utility>
#include <span>
#include <string>
#include <vector>

// Internal handle structure (hidden from C API)
struct SoundHandleImpl {
    soundwave::Sound sound;

    explicit SoundHandleImpl(soundwave::Sound s)
        : sound(std::move(s))
    {
    }
};

namespace {

SoundHandleImpl* from_handle(SoundHandle handle) {
    return static_cast<SoundHandleImpl*>(handle);
}

// Exceptions must not cross the C boundary; map them to status codes.
template<typename Fn>
int translate(Fn&& fn) {
    try {
        return fn();
    } catch (const soundwave::InvalidKeyError& e) {
        std::cerr << "[AudioBridge] " << e.what() << std::endl;
        return SW_ERR_INVALID_KEY;
    } catch (const soundwave::SampleRateMismatchError& e) {
        std::cerr << "[AudioBridge] " << e.what() << std::endl;
        return SW_ERR_SAMPLE_RATE_MISMATCH;
    } catch (const soundwave::EmptyCompositionError& e) {
        std::cerr << "[AudioBridge] " << e.what() << std::endl;
        return SW_ERR_EMPTY_COMPOSITION;
    } catch (const soundwave::ScoreFileError& e) {
        std::cerr << "[AudioBridge] " << e.what() << std::endl;
        return SW_ERR_IO;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[AudioBridge] " << e.what() << std::endl;
        return SW_ERR_INVALID_ARGUMENT;
    } catch (const std::exception& e) {
        std::cerr << "[AudioBridge] Internal error: " << e.what() << std::endl;
        return SW_ERR_INTERNAL;
    }
}

int emit(soundwave::Sound sound, SoundHandle* out) {
    *out = static_cast<SoundHandle>(new SoundHandleImpl(std::move(sound)));
    return SW_OK;
}

} // namespace

extern "C" {

int sound_create_note(char white_key, char accidental, int octave, double duration_seconds, SoundHandle* out) {
    if (!out) return SW_ERR_INVALID_ARGUMENT;
    *out = nullptr;
    return translate([&] {
        return emit(soundwave::synthesize_note(white_key, accidental, octave, duration_seconds), out);
    });
}

int sound_load_score(const char* path, SoundHandle* out) {
    if (!path || !out) return SW_ERR_INVALID_ARGUMENT;
    *out = nullptr;
    return translate([&] {
        return emit(soundwave::load_score(std::string(path)), out);
    });
}

int sound_concatenate(const SoundHandle* sounds, size_t count, SoundHandle* out) {
    if (!out || (count > 0 && !sounds)) return SW_ERR_INVALID_ARGUMENT;
    *out = nullptr;
    return translate([&] {
        std::vector<const soundwave::Sound*> parts;
        parts.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            if (!sounds[i]) return static_cast<int>(SW_ERR_INVALID_ARGUMENT);
            parts.push_back(&from_handle(sounds[i])->sound);
        }
        return emit(soundwave::concatenate(std::span<const soundwave::Sound* const>(parts)), out);
    });
}

void sound_destroy(SoundHandle handle) {
    if (handle) {
        delete from_handle(handle);
    }
}

size_t sound_get_length(SoundHandle handle) {
    if (!handle) return 0;
    return from_handle(handle)->sound.size();
}

double sound_get_sample_rate(SoundHandle handle) {
    if (!handle) return 0.0;
    return from_handle(handle)->sound.sample_rate();
}

int sound_quantize(SoundHandle handle, int8_t* output, size_t capacity, size_t* written) {
    if (!handle || !written) return SW_ERR_INVALID_ARGUMENT;
    const auto& sound = from_handle(handle)->sound;
    if (capacity < sound.size() || (sound.size() > 0 && !output)) return SW_ERR_INVALID_ARGUMENT;
    return translate([&] {
        const auto bytes = soundwave::quantize(sound);
        std::copy(bytes.begin(), bytes.end(), output);
        *written = bytes.size();
        return static_cast<int>(SW_OK);
    });
}

int sound_play(SoundHandle handle) {
    if (!handle) return SW_ERR_INVALID_ARGUMENT;
    return translate([&] {
        soundwave::Player player(std::make_unique<hal::AlsaDriver>());
        player.start(from_handle(handle)->sound);
        return player.wait() ? static_cast<int>(SW_OK) : static_cast<int>(SW_ERR_DEVICE);
    });
}

} // extern "C"

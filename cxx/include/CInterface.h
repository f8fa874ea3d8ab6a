/**
 * @file CInterface.h
 * @brief C-compatible API over the synthesis core.
 *
 * All functions returning int return SW_OK (0) on success or a negative
 * SoundwaveStatus on failure. Handles are owned by the caller and released
 * with sound_destroy().
 *
 * Calls must not overlap across threads. sound_load_score() and sound_play()
 * write to the core's single-producer event log, so a host that plays on a
 * background thread must not load another score until sound_play() returns.
 */

#ifndef SOUNDWAVE_C_INTERFACE_H
#define SOUNDWAVE_C_INTERFACE_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

enum SoundwaveStatus {
    SW_OK = 0,
    SW_ERR_INVALID_ARGUMENT = -1,
    SW_ERR_INVALID_KEY = -2,
    SW_ERR_SAMPLE_RATE_MISMATCH = -3,
    SW_ERR_EMPTY_COMPOSITION = -4,
    SW_ERR_IO = -5,
    SW_ERR_DEVICE = -6,
    SW_ERR_INTERNAL = -7
};

// Opaque handle type
typedef void* SoundHandle;

// Construction
int sound_create_note(char white_key, char accidental, int octave, double duration_seconds, SoundHandle* out);
int sound_load_score(const char* path, SoundHandle* out);
int sound_concatenate(const SoundHandle* sounds, size_t count, SoundHandle* out);
void sound_destroy(SoundHandle handle);

// Queries (0 for a null handle)
size_t sound_get_length(SoundHandle handle);
double sound_get_sample_rate(SoundHandle handle);

// Quantize into caller storage; capacity must be at least sound_get_length()
int sound_quantize(SoundHandle handle, int8_t* output, size_t capacity, size_t* written);

// Blocking playback on the default ALSA device
int sound_play(SoundHandle handle);

#ifdef __cplusplus
}
#endif

#endif // SOUNDWAVE_C_INTERFACE_H

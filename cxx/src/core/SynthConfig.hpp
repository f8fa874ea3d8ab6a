/**
 * @file SynthConfig.hpp
 * @brief Human-readable JSON configuration for synthesis and playback.
 */

#ifndef SOUNDWAVE_SYNTH_CONFIG_HPP
#define SOUNDWAVE_SYNTH_CONFIG_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "Sound.hpp"
#include "oscillator/SineGenerator.hpp"

namespace soundwave {

using json = nlohmann::json;

/**
 * @brief Settings read by the driver. Keys missing from the JSON keep these defaults.
 */
struct SynthConfig {
    int version = 1;
    double sample_rate = Sound::DEFAULT_SAMPLE_RATE;
    double amplitude = Sound::MAX_AMPLITUDE;
    std::string device = "default";
    int period_frames = 512;

    NoteSettings note_settings() const {
        return NoteSettings{sample_rate, amplitude};
    }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(SynthConfig, version, sample_rate, amplitude, device, period_frames)
};

/**
 * @brief Manages saving and loading of SynthConfig.
 */
class ConfigStore {
public:
    static bool save_to_file(const SynthConfig& config, const std::string& path);
    static bool load_from_file(SynthConfig& config, const std::string& path);

    static std::string serialize(const SynthConfig& config) {
        json j = config;
        return j.dump(4);
    }

    /**
     * @brief Parse and validate a config. On failure config is left untouched.
     */
    static bool deserialize(SynthConfig& config, const std::string& data);

    static bool validate(const SynthConfig& config, std::string& reason);
};

} // namespace soundwave

#endif // SOUNDWAVE_SYNTH_CONFIG_HPP

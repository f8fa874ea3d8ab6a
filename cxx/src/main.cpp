/**
 * @file main.cpp
 * @brief soundwave_play: load a CSV score (or the scale demo) and play it through ALSA.
 *
 * Usage:
 *   soundwave_play <score.csv> [config.json]
 *   soundwave_play --scale [config.json]
 */

#include <iostream>
#include <memory>
#include <string>
#include "Errors.hpp"
#include "Logger.hpp"
#include "Note.hpp"
#include "Player.hpp"
#include "ScoreLoader.hpp"
#include "SynthConfig.hpp"
#include "alsa/AlsaDriver.hpp"

using namespace soundwave;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitDevice = 2;

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <score.csv> [config.json]\n"
              << "       " << argv0 << " --scale [config.json]" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    SynthConfig config;
    if (argc == 3 && !ConfigStore::load_from_file(config, argv[2])) {
        return kExitUsage;
    }

    const std::string source = argv[1];
    auto& logger = AudioLogger::instance();

    try {
        Sound sound = (source == "--scale")
            ? scale_demo(config.note_settings())
            : load_score(source, config.note_settings());

        std::cout << "Playing " << sound.size() << " samples ("
                  << sound.duration_seconds() << " s at " << sound.sample_rate() << " Hz)" << std::endl;

        Player player(std::make_unique<hal::AlsaDriver>(config.device, config.period_frames));
        player.start(sound);
        const bool ok = player.wait();
        logger.flush();

        if (!ok) {
            std::cerr << "Source data line unavailable" << std::endl;
            return kExitDevice;
        }
    } catch (const ScoreFileError& e) {
        std::cerr << e.what() << std::endl;
        return kExitUsage;
    } catch (const std::invalid_argument& e) {
        logger.flush();
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitUsage;
    } catch (const std::exception& e) {
        logger.flush();
        std::cerr << "Fatal: " << e.what() << std::endl;
        return kExitUsage;
    }

    return kExitOk;
}

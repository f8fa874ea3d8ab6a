#include "SynthConfig.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <iterator>

namespace soundwave {

bool ConfigStore::validate(const SynthConfig& config, std::string& reason) {
    if (!std::isfinite(config.sample_rate) || config.sample_rate <= 0.0) {
        reason = "sample_rate must be positive";
        return false;
    }
    if (!std::isfinite(config.amplitude) || config.amplitude <= 0.0) {
        reason = "amplitude must be positive";
        return false;
    }
    if (config.period_frames <= 0) {
        reason = "period_frames must be positive";
        return false;
    }
    if (config.device.empty()) {
        reason = "device must not be empty";
        return false;
    }
    return true;
}

bool ConfigStore::deserialize(SynthConfig& config, const std::string& data) {
    SynthConfig parsed;
    try {
        json j = json::parse(data);
        parsed = j.get<SynthConfig>();
    } catch (const json::exception& e) {
        std::cerr << "[SynthConfig] Invalid JSON: " << e.what() << std::endl;
        return false;
    }

    std::string reason;
    if (!validate(parsed, reason)) {
        std::cerr << "[SynthConfig] Rejected config: " << reason << std::endl;
        return false;
    }
    config = parsed;
    return true;
}

bool ConfigStore::save_to_file(const SynthConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[SynthConfig] Failed to open file for writing: " << path << std::endl;
        return false;
    }
    file << serialize(config);
    return static_cast<bool>(file);
}

bool ConfigStore::load_from_file(SynthConfig& config, const std::string& path) {
    std::cout << "[SynthConfig] Attempting to load: " << path << std::endl;
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[SynthConfig] Failed to open file: " << path << std::endl;
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    bool success = deserialize(config, content);
    if (success) {
        std::cout << "[SynthConfig] Loaded config: " << config.sample_rate << " Hz, device "
                  << config.device << std::endl;
    }
    return success;
}

} // namespace soundwave

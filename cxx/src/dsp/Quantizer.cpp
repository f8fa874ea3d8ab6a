#include "Quantizer.hpp"
#include <algorithm>
#include <cmath>

namespace soundwave {

std::vector<int8_t> quantize(std::span<const double> samples) {
    std::vector<int8_t> out(samples.size(), 0);
    if (samples.empty()) return out;
    if (!std::all_of(samples.begin(), samples.end(), [](double x) { return std::isfinite(x); })) {
        return out;
    }

    const auto [min_it, max_it] = std::minmax_element(samples.begin(), samples.end());
    const double min_s = *min_it;
    const double max_s = *max_it;
    if (!(max_s > min_s)) return out;

    const double new_range = Sound::MAX_AMPLITUDE * 2.0 - 1.0;
    const double new_min = -Sound::MAX_AMPLITUDE;

    // max - min can overflow for samples of opposite sign near DBL_MAX;
    // work on halved values in that case
    const bool halve = !std::isfinite(max_s - min_s);
    const double k = halve ? 0.5 : 1.0;
    const double origin = k * min_s;
    const double scale = new_range / (k * max_s - origin);

    for (size_t i = 0; i < samples.size(); ++i) {
        const double value = std::round((k * samples[i] - origin) * scale + new_min);
        out[i] = static_cast<int8_t>(std::clamp(value, -128.0, 127.0));
    }
    return out;
}

} // namespace soundwave

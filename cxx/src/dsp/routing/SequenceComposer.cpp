#include "SequenceComposer.hpp"
#include "Errors.hpp"
#include <vector>

namespace soundwave {

namespace {

template<typename Range, typename Deref>
Sound compose(const Range& sounds, Deref deref) {
    if (sounds.empty()) {
        throw EmptyCompositionError("Cannot concatenate an empty sequence of sounds");
    }

    const double sample_rate = deref(sounds[0]).sample_rate();
    size_t total = 0;
    for (const auto& item : sounds) {
        const Sound& s = deref(item);
        if (s.sample_rate() != sample_rate) {
            throw SampleRateMismatchError(sample_rate, s.sample_rate());
        }
        total += s.size();
    }

    std::vector<double> buffer;
    buffer.reserve(total);
    for (const auto& item : sounds) {
        const auto samples = deref(item).buffer();
        buffer.insert(buffer.end(), samples.begin(), samples.end());
    }
    return Sound::from_samples(std::move(buffer), sample_rate);
}

} // namespace

Sound concatenate(std::span<const Sound> sounds) {
    return compose(sounds, [](const Sound& s) -> const Sound& { return s; });
}

Sound concatenate(std::span<const Sound* const> sounds) {
    return compose(sounds, [](const Sound* s) -> const Sound& { return *s; });
}

} // namespace soundwave

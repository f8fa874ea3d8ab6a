#include "TuningSystem.hpp"
#include "Errors.hpp"
#include <cmath>

namespace soundwave {

Accidental accidental_from_char(char c) {
    switch (c) {
        case 'b': return Accidental::Flat;
        case '#': return Accidental::Sharp;
        default:  return Accidental::Natural;
    }
}

bool TwelveToneEqual::is_white_key(char c) {
    return c >= 'A' && c <= 'G';
}

int TwelveToneEqual::semitones_above_a(char c) {
    switch (c) {
        case 'A': return 0;
        case 'B': return 2;
        case 'C': return 3;
        case 'D': return 5;
        case 'E': return 7;
        case 'F': return 8;
        case 'G': return 10;
        default:
            throw InvalidKeyError(c);
    }
}

double TwelveToneEqual::get_frequency(const Pitch& pitch) const {
    double freq = reference_hz_;

    const int semitones = semitones_above_a(pitch.white_key);
    if (semitones != 0) {
        freq *= std::pow(2.0, semitones / 12.0);
    }

    switch (pitch.accidental) {
        case Accidental::Flat:
            freq *= std::pow(2.0, -1.0 / 12.0);
            break;
        case Accidental::Sharp:
            freq *= std::pow(2.0, 1.0 / 12.0);
            break;
        case Accidental::Natural:
            break;
    }

    // Scaling by a power of two is exact, so adjacent octaves differ by exactly 2x
    return std::ldexp(freq, pitch.octave);
}

double frequency(char white_key, char accidental, int octave) {
    static const TwelveToneEqual tuning;
    return tuning.get_frequency(Pitch{white_key, accidental_from_char(accidental), octave});
}

} // namespace soundwave

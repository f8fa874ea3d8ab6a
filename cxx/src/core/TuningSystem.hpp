/**
 * @file TuningSystem.hpp
 * @brief Equal-tempered mapping from white key, accidental and octave to Hz.
 */

#ifndef SOUNDWAVE_TUNING_SYSTEM_HPP
#define SOUNDWAVE_TUNING_SYSTEM_HPP

namespace soundwave {

enum class Accidental {
    Flat,
    Natural,
    Sharp
};

/**
 * @brief 'b' is flat, '#' is sharp, anything else is natural.
 */
Accidental accidental_from_char(char c);

/**
 * @brief A musical pitch relative to the A440 octave.
 *
 * Octave 0 is the A-G run that contains A440; negative octaves go down.
 */
struct Pitch {
    char white_key;
    Accidental accidental;
    int octave;
};

/**
 * @brief Standard 12-tone equal temperament anchored on A.
 *
 * f = reference_hz * 2^(semitones_above_a / 12) * 2^(accidental / 12) * 2^octave
 */
class TwelveToneEqual {
public:
    explicit TwelveToneEqual(double reference_hz = 440.0)
        : reference_hz_(reference_hz)
    {}

    /**
     * @throws InvalidKeyError if pitch.white_key is not one of A-G
     */
    double get_frequency(const Pitch& pitch) const;

    double reference_hz() const { return reference_hz_; }

    static bool is_white_key(char c);

    /**
     * @brief Semitones from A up to the given white key within one octave.
     * @throws InvalidKeyError if c is not one of A-G
     */
    static int semitones_above_a(char c);

private:
    double reference_hz_;
};

/**
 * @brief Frequency in Hz of a note in score notation, tuned to A440.
 * @throws InvalidKeyError if white_key is not one of A-G
 */
double frequency(char white_key, char accidental, int octave);

} // namespace soundwave

#endif // SOUNDWAVE_TUNING_SYSTEM_HPP

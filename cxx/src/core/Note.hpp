/**
 * @file Note.hpp
 * @brief Score records and single-note synthesis.
 */

#ifndef SOUNDWAVE_NOTE_HPP
#define SOUNDWAVE_NOTE_HPP

#include <optional>
#include <string_view>
#include "Sound.hpp"
#include "oscillator/SineGenerator.hpp"

namespace soundwave {

/**
 * @brief One line of a score: "<whiteKey>,<accidental>,<octave>,<durationSeconds>".
 */
struct NoteRecord {
    char white_key;
    char accidental;
    int octave;
    double duration_seconds;
};

/**
 * @brief Parse a single score line.
 *
 * Returns std::nullopt when the line does not have exactly four fields or
 * a field does not parse (empty key or accidental, non-integer octave,
 * non-numeric or negative duration). The white key is not validated here.
 */
std::optional<NoteRecord> parse_note_record(std::string_view line);

/**
 * @brief Sine tone for a note in score notation.
 * @throws InvalidKeyError if white_key is not one of A-G
 */
Sound synthesize_note(char white_key, char accidental, int octave, double duration_seconds,
                      const NoteSettings& settings = {});

inline Sound synthesize_note(const NoteRecord& record, const NoteSettings& settings = {}) {
    return synthesize_note(record.white_key, record.accidental, record.octave,
                           record.duration_seconds, settings);
}

/**
 * @brief A natural scale: A0 B0 C0 D0 E0 F0 G0 A1, a quarter second each.
 */
Sound scale_demo(const NoteSettings& settings = {});

} // namespace soundwave

#endif // SOUNDWAVE_NOTE_HPP

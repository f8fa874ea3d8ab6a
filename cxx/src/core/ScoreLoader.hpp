/**
 * @file ScoreLoader.hpp
 * @brief Builds one sound from a CSV score of notes.
 */

#ifndef SOUNDWAVE_SCORE_LOADER_HPP
#define SOUNDWAVE_SCORE_LOADER_HPP

#include <istream>
#include <string>
#include "Note.hpp"
#include "Sound.hpp"

namespace soundwave {

/**
 * @brief Reads "<whiteKey>,<accidental>,<octave>,<durationSeconds>" lines.
 *
 * Lines that are not a well-formed four-field record are skipped. Every
 * other line becomes one sine note, and the notes are concatenated in
 * file order.
 */
class ScoreLoader {
public:
    struct Stats {
        size_t notes_loaded = 0;
        size_t lines_skipped = 0;
    };

    explicit ScoreLoader(NoteSettings settings = {})
        : settings_(settings)
    {}

    /**
     * @throws InvalidKeyError if a record names a key outside A-G
     * @throws EmptyCompositionError if no line is a valid record
     */
    Sound load(std::istream& in);

    /**
     * @throws ScoreFileError if the file cannot be opened
     */
    Sound load_file(const std::string& path);

    const Stats& last_stats() const { return stats_; }

private:
    NoteSettings settings_;
    Stats stats_;
};

Sound load_score(std::istream& in, const NoteSettings& settings = {});
Sound load_score(const std::string& path, const NoteSettings& settings = {});

} // namespace soundwave

#endif // SOUNDWAVE_SCORE_LOADER_HPP

#include "ScoreLoader.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "TuningSystem.hpp"
#include "routing/SequenceComposer.hpp"
#include <fstream>
#include <iostream>
#include <vector>

namespace soundwave {

Sound ScoreLoader::load(std::istream& in) {
    stats_ = Stats{};
    std::vector<Sound> notes;

    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        auto record = parse_note_record(line);
        if (!record) {
            ++stats_.lines_skipped;
            continue;
        }
        if (!TwelveToneEqual::is_white_key(record->white_key)) {
            throw InvalidKeyError(record->white_key, line_number);
        }
        notes.push_back(synthesize_note(*record, settings_));
    }
    stats_.notes_loaded = notes.size();

    auto& logger = AudioLogger::instance();
    logger.log_event("SCORE_NOTES", static_cast<double>(stats_.notes_loaded));
    logger.log_event("SCORE_SKIPPED", static_cast<double>(stats_.lines_skipped));

    if (notes.empty()) {
        throw EmptyCompositionError("Score contains no valid note records");
    }
    return concatenate(std::span<const Sound>(notes));
}

Sound ScoreLoader::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ScoreLoader] Failed to open file: " << path << std::endl;
        throw ScoreFileError(path);
    }
    return load(file);
}

Sound load_score(std::istream& in, const NoteSettings& settings) {
    ScoreLoader loader(settings);
    return loader.load(in);
}

Sound load_score(const std::string& path, const NoteSettings& settings) {
    ScoreLoader loader(settings);
    return loader.load_file(path);
}

} // namespace soundwave

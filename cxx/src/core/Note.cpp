#include "Note.hpp"
#include "TuningSystem.hpp"
#include "routing/SequenceComposer.hpp"
#include <array>
#include <cmath>
#include <stdexcept>
#include <span>
#include <string>
#include <vector>

namespace soundwave {

namespace {

std::string_view trim(std::string_view s) {
    const char* ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

bool parse_int(std::string_view field, int& out) {
    if (field.empty()) return false;
    const std::string text(field);
    try {
        size_t pos = 0;
        out = std::stoi(text, &pos);
        return pos == text.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parse_double(std::string_view field, double& out) {
    if (field.empty()) return false;
    const std::string text(field);
    try {
        size_t pos = 0;
        out = std::stod(text, &pos);
        return pos == text.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace

std::optional<NoteRecord> parse_note_record(std::string_view line) {
    constexpr size_t kFields = 4;
    std::array<std::string_view, kFields> fields;

    size_t count = 0;
    size_t start = 0;
    while (true) {
        const size_t comma = line.find(',', start);
        if (count == kFields) return std::nullopt; // too many fields
        fields[count++] = trim(line.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start));
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    if (count != kFields) return std::nullopt;

    if (fields[0].empty() || fields[1].empty()) return std::nullopt;

    NoteRecord record{};
    record.white_key = fields[0].front();
    record.accidental = fields[1].front();
    if (!parse_int(fields[2], record.octave)) return std::nullopt;
    if (!parse_double(fields[3], record.duration_seconds)) return std::nullopt;
    if (!std::isfinite(record.duration_seconds) || record.duration_seconds < 0.0) return std::nullopt;

    return record;
}

Sound synthesize_note(char white_key, char accidental, int octave, double duration_seconds,
                      const NoteSettings& settings) {
    return sine_wave(duration_seconds, frequency(white_key, accidental, octave), settings);
}

Sound scale_demo(const NoteSettings& settings) {
    std::vector<Sound> scale;
    for (int i = 0; i < 8; ++i) {
        const char key = static_cast<char>('A' + i % 7);
        scale.push_back(synthesize_note(key, 'n', i / 7, 0.25, settings));
    }
    return concatenate(std::span<const Sound>(scale));
}

} // namespace soundwave

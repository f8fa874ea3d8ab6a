#include <gtest/gtest.h>
#include "ScoreLoader.hpp"
#include "Note.hpp"
#include "Errors.hpp"
#include "routing/SequenceComposer.hpp"
#include "../TestHelper.hpp"
#include <cstddef>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace soundwave;

namespace {
std::vector<double> samples(const Sound& s) {
    return std::vector<double>(s.buffer().begin(), s.buffer().end());
}
}

TEST(NoteRecordTest, ParsesFourFields) {
    auto record = parse_note_record("C,#,1,0.2");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->white_key, 'C');
    EXPECT_EQ(record->accidental, '#');
    EXPECT_EQ(record->octave, 1);
    EXPECT_DOUBLE_EQ(record->duration_seconds, 0.2);
}

TEST(NoteRecordTest, ToleratesWhitespaceAndCarriageReturn) {
    auto record = parse_note_record(" D , b , -2 , 0.5\r");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->white_key, 'D');
    EXPECT_EQ(record->accidental, 'b');
    EXPECT_EQ(record->octave, -2);
    EXPECT_DOUBLE_EQ(record->duration_seconds, 0.5);
}

TEST(NoteRecordTest, RejectsMalformedLines) {
    EXPECT_FALSE(parse_note_record(""));
    EXPECT_FALSE(parse_note_record("garbage"));
    EXPECT_FALSE(parse_note_record("A,n,0"));
    EXPECT_FALSE(parse_note_record("A,n,0,0.1,extra"));
    EXPECT_FALSE(parse_note_record("A,n,0,0.1,"));
    EXPECT_FALSE(parse_note_record(",n,0,0.1"));
    EXPECT_FALSE(parse_note_record("A,,0,0.1"));
    EXPECT_FALSE(parse_note_record("A,n,one,0.1"));
    EXPECT_FALSE(parse_note_record("A,n,1.5,0.1"));
    EXPECT_FALSE(parse_note_record("A,n,0,fast"));
    EXPECT_FALSE(parse_note_record("A,n,0,-0.1"));
    EXPECT_FALSE(parse_note_record("A,n,0,inf"));
}

TEST(NoteRecordTest, KeyIsNotValidatedByParser) {
    auto record = parse_note_record("H,n,0,0.1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->white_key, 'H');
}

TEST(ScoreLoaderTest, SkipsMalformedLines) {
    std::istringstream score("A,n,0,0.1\ngarbage\nC,#,1,0.2\n");
    ScoreLoader loader;
    Sound sound = loader.load(score);

    Sound expected = concatenate(synthesize_note('A', 'n', 0, 0.1), synthesize_note('C', '#', 1, 0.2));
    EXPECT_EQ(sound.size(), 4410u + 8820u);
    EXPECT_EQ(samples(sound), samples(expected));
    EXPECT_EQ(sound.sample_rate(), Sound::DEFAULT_SAMPLE_RATE);
    EXPECT_EQ(loader.last_stats().notes_loaded, 2u);
    EXPECT_EQ(loader.last_stats().lines_skipped, 1u);
}

TEST(ScoreLoaderTest, KeepsRecordOrder) {
    std::istringstream score("E,n,0,0.01\nD,n,0,0.02\nC,n,0,0.03\n");
    Sound sound = load_score(score);
    Sound expected = concatenate(synthesize_note('E', 'n', 0, 0.01),
                                 synthesize_note('D', 'n', 0, 0.02),
                                 synthesize_note('C', 'n', 0, 0.03));
    EXPECT_EQ(samples(sound), samples(expected));
}

TEST(ScoreLoaderTest, NoValidRecordsThrows) {
    std::istringstream empty("");
    EXPECT_THROW(load_score(empty), EmptyCompositionError);

    std::istringstream junk("header\n\nA;n;0;1\n");
    EXPECT_THROW(load_score(junk), EmptyCompositionError);
}

TEST(ScoreLoaderTest, InvalidKeyThrows) {
    std::istringstream score("A,n,0,0.1\nH,n,0,0.1\n");
    try {
        load_score(score);
        FAIL() << "expected InvalidKeyError";
    } catch (const InvalidKeyError& e) {
        EXPECT_EQ(e.key(), 'H');
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos);
    }
}

TEST(ScoreLoaderTest, HugeDurationThrows) {
    std::istringstream score("A,n,0,0.1\nA,n,0,1e300\n");
    try {
        load_score(score);
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("too long"), std::string::npos);
    }
}

TEST(ScoreLoaderTest, UsesNoteSettings) {
    std::istringstream score("A,n,0,0.5\n");
    Sound sound = load_score(score, NoteSettings{8000.0, 1.0});
    EXPECT_EQ(sound.sample_rate(), 8000.0);
    EXPECT_EQ(sound.size(), 4000u);
}

TEST(ScoreLoaderTest, LogsSummary) {
    test::drain_logger();
    std::istringstream score("A,n,0,0.01\nbad\nbad\n");
    ScoreLoader loader;
    loader.load(score);

    auto& logger = AudioLogger::instance();
    auto notes = logger.pop_entry();
    ASSERT_TRUE(notes.has_value());
    EXPECT_STREQ(notes->tag, "SCORE_NOTES");
    EXPECT_EQ(notes->value, 1.0);
    auto skipped = logger.pop_entry();
    ASSERT_TRUE(skipped.has_value());
    EXPECT_STREQ(skipped->tag, "SCORE_SKIPPED");
    EXPECT_EQ(skipped->value, 2.0);
}

TEST(ScoreLoaderTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "soundwave_score.csv";
    {
        std::ofstream out(path);
        out << "G,b,-1,0.05\nnot,a,note\nB,n,0,0.05\n";
    }
    Sound sound = load_score(path);
    EXPECT_EQ(sound.size(), 2u * 2205u);
    std::remove(path.c_str());
}

TEST(ScoreLoaderTest, MissingFileThrows) {
    EXPECT_THROW(load_score(std::string("/nonexistent/soundwave/score.csv")), ScoreFileError);
}

TEST(ScaleDemoTest, EightQuarterSecondNotes) {
    Sound scale = scale_demo();
    constexpr size_t kNoteLength = 11025;
    ASSERT_EQ(scale.size(), 8 * kNoteLength);
    EXPECT_EQ(scale.sample_rate(), Sound::DEFAULT_SAMPLE_RATE);

    const auto all = samples(scale);
    for (int i = 0; i < 8; ++i) {
        const char key = static_cast<char>('A' + i % 7);
        Sound note = synthesize_note(key, 'n', i / 7, 0.25);
        ASSERT_EQ(note.size(), kNoteLength);
        const auto begin = all.begin() + static_cast<std::ptrdiff_t>(i * kNoteLength);
        EXPECT_EQ(std::vector<double>(begin, begin + static_cast<std::ptrdiff_t>(kNoteLength)), samples(note))
            << "note " << i;
    }
}

TEST(ScaleDemoTest, UsesNoteSettings) {
    Sound scale = scale_demo(NoteSettings{8000.0, 1.0});
    EXPECT_EQ(scale.sample_rate(), 8000.0);
    EXPECT_EQ(scale.size(), 8u * 2000u);
}

#include <gtest/gtest.h>
#include "CInterface.h"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

class BridgeTest : public ::testing::Test {
protected:
    std::vector<SoundHandle> handles;

    void TearDown() override {
        for (SoundHandle h : handles) {
            sound_destroy(h);
        }
    }

    SoundHandle keep(SoundHandle h) {
        handles.push_back(h);
        return h;
    }
};

TEST_F(BridgeTest, NoteLifecycle) {
    SoundHandle note = nullptr;
    ASSERT_EQ(sound_create_note('A', 'n', 0, 0.1, &note), SW_OK);
    keep(note);
    ASSERT_NE(note, nullptr);

    EXPECT_EQ(sound_get_length(note), 4410u);
    EXPECT_EQ(sound_get_sample_rate(note), 44100.0);

    std::vector<int8_t> bytes(sound_get_length(note));
    size_t written = 0;
    ASSERT_EQ(sound_quantize(note, bytes.data(), bytes.size(), &written), SW_OK);
    EXPECT_EQ(written, bytes.size());

    int8_t lo = 0, hi = 0;
    for (int8_t b : bytes) {
        lo = std::min(lo, b);
        hi = std::max(hi, b);
    }
    EXPECT_EQ(lo, -128);
    EXPECT_EQ(hi, 127);
}

TEST_F(BridgeTest, InvalidKey) {
    SoundHandle note = reinterpret_cast<SoundHandle>(0x1);
    EXPECT_EQ(sound_create_note('X', 'n', 0, 0.1, &note), SW_ERR_INVALID_KEY);
    EXPECT_EQ(note, nullptr);
}

TEST_F(BridgeTest, Concatenate) {
    SoundHandle a = nullptr, b = nullptr, joined = nullptr;
    ASSERT_EQ(sound_create_note('C', '#', 1, 0.01, &a), SW_OK);
    keep(a);
    ASSERT_EQ(sound_create_note('D', 'b', -1, 0.02, &b), SW_OK);
    keep(b);

    SoundHandle parts[] = {a, b};
    ASSERT_EQ(sound_concatenate(parts, 2, &joined), SW_OK);
    keep(joined);
    EXPECT_EQ(sound_get_length(joined), sound_get_length(a) + sound_get_length(b));

    SoundHandle none = nullptr;
    EXPECT_EQ(sound_concatenate(parts, 0, &none), SW_ERR_EMPTY_COMPOSITION);
    EXPECT_EQ(none, nullptr);
}

TEST_F(BridgeTest, LoadScore) {
    const std::string path = ::testing::TempDir() + "soundwave_bridge_score.csv";
    {
        std::ofstream out(path);
        out << "A,n,0,0.1\ngarbage\nC,#,1,0.2\n";
    }

    SoundHandle score = nullptr;
    ASSERT_EQ(sound_load_score(path.c_str(), &score), SW_OK);
    keep(score);
    EXPECT_EQ(sound_get_length(score), 4410u + 8820u);
    std::remove(path.c_str());

    SoundHandle missing = nullptr;
    EXPECT_EQ(sound_load_score("/nonexistent/score.csv", &missing), SW_ERR_IO);
    EXPECT_EQ(missing, nullptr);
}

TEST_F(BridgeTest, ArgumentChecks) {
    EXPECT_EQ(sound_create_note('A', 'n', 0, 0.1, nullptr), SW_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(sound_load_score(nullptr, nullptr), SW_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(sound_get_length(nullptr), 0u);
    EXPECT_EQ(sound_get_sample_rate(nullptr), 0.0);
    EXPECT_EQ(sound_play(nullptr), SW_ERR_INVALID_ARGUMENT);

    SoundHandle note = nullptr;
    ASSERT_EQ(sound_create_note('A', 'n', 0, 0.01, &note), SW_OK);
    keep(note);
    int8_t small[4];
    size_t written = 0;
    EXPECT_EQ(sound_quantize(note, small, sizeof(small), &written), SW_ERR_INVALID_ARGUMENT);

    SoundHandle negative = nullptr;
    EXPECT_EQ(sound_create_note('A', 'n', 0, -1.0, &negative), SW_ERR_INVALID_ARGUMENT);
}

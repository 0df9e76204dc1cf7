#include "fake_audio_host.hpp"

#include "voicemimic/errors.hpp"
#include "voicemimic/session.hpp"
#include "voicemimic/wav.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

SampleBuffer sine(int rate, size_t n, float amp) {
    SampleBuffer s;
    s.sampleRate = rate;
    s.samples.resize(n);
    for (size_t i = 0; i < n; i++) s.samples[i] = amp * std::sin(static_cast<float>(i) * 0.03f);
    return s;
}

class SessionTest : public ::testing::Test {
protected:
    SessionTest() : log_(logs_, LogLevel::Debug) {}

    void SetUp() override {
        cfg_.baseDir = fs::temp_directory_path() /
                       ("voicemimic_session_" +
                        std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(cfg_.baseDir);
        cfg_.audio.chunkSize = 512;
    }
    void TearDown() override { fs::remove_all(cfg_.baseDir); }

    void add_reference(const std::string& name) {
        fs::create_directories(cfg_.references_dir());
        save_wav_float(cfg_.references_dir() / (name + ".wav"), sine(44100, 8000, 0.6f));
    }

    FakeAudioHost host_;
    Config cfg_;
    std::ostringstream logs_;
    Logger log_;
};

} // namespace

TEST_F(SessionTest, CreatesDirectoriesAndPicksMicrophone) {
    Session s(host_, cfg_, log_);
    EXPECT_TRUE(fs::is_directory(cfg_.references_dir()));
    EXPECT_TRUE(fs::is_directory(cfg_.temp_dir()));
    EXPECT_TRUE(fs::is_directory(cfg_.recordings_dir()));
    EXPECT_EQ(s.input_device().index, 1);
}

TEST_F(SessionTest, ConfiguredInputDeviceMustRecord) {
    cfg_.inputDevice = 2; // speakers
    EXPECT_THROW({ Session s(host_, cfg_, log_); }, DeviceError);
}

TEST_F(SessionTest, InvalidConfigIsRejected) {
    cfg_.analysis.frameSize = 0;
    EXPECT_THROW({ Session s(host_, cfg_, log_); }, std::invalid_argument);
}

TEST_F(SessionTest, ListReferencesReturnsSortedStems) {
    add_reference("zeta");
    add_reference("alpha");
    std::ofstream(cfg_.references_dir() / "notes.txt") << "x";

    EXPECT_EQ(list_references(cfg_.references_dir()), (std::vector<std::string>{"alpha", "zeta"}));
    EXPECT_TRUE(list_references(cfg_.baseDir / "missing").empty());
}

TEST_F(SessionTest, MissingReferenceThrows) {
    Session s(host_, cfg_, log_);
    EXPECT_THROW(s.reference_path("nobody"), std::runtime_error);
    EXPECT_THROW(s.listen("nobody"), std::runtime_error);
}

TEST_F(SessionTest, RecordSaveVisualize) {
    add_reference("freeman");
    Session s(host_, cfg_, log_);

    s.listen("freeman");
    ASSERT_TRUE(s.playback().wait(2000ms));
    EXPECT_EQ(host_.outputs.back()->framesWritten.load(), 8000u);

    s.start_recording();
    EXPECT_TRUE(s.is_recording());
    SampleBuffer take = sine(44100, 3000, 0.4f);
    for (size_t i = 0; i < take.samples.size(); i += 1000) {
        host_.push_input(std::vector<float>(take.samples.begin() + static_cast<long>(i),
                                            take.samples.begin() + static_cast<long>(i + 1000)));
    }
    fs::path saved = s.stop_recording();
    EXPECT_FALSE(s.is_recording());
    EXPECT_FALSE(s.last_warning().has_value());
    EXPECT_EQ(saved.string(), (cfg_.recordings_dir() / "attempt_1.wav").string());

    AudioBuffer back = load_wav_to_float(saved);
    EXPECT_EQ(back.channels, 1);
    EXPECT_EQ(back.sampleRate, 44100);
    EXPECT_EQ(back.data, take.samples);

    s.play_attempt();
    ASSERT_TRUE(s.playback().wait(2000ms));

    fs::path svg = s.visualize("freeman");
    EXPECT_EQ(svg.string(), (cfg_.temp_dir() / "freeman_comparison.svg").string());
    std::ifstream in(svg);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("<svg"), std::string::npos);
}

TEST_F(SessionTest, EmptyRecordingIsNotSaved) {
    Session s(host_, cfg_, log_);
    s.start_recording();
    EXPECT_THROW(s.stop_recording(), CaptureError);
    ASSERT_TRUE(s.last_warning().has_value());
    EXPECT_EQ(s.last_warning()->reason, LowSignalWarning::Reason::NoAudio);
    EXPECT_FALSE(s.attempt().has_value());
    EXPECT_TRUE(fs::is_empty(cfg_.recordings_dir()));
}

TEST_F(SessionTest, PlaybackAndVisualizeNeedAnAttempt) {
    add_reference("freeman");
    Session s(host_, cfg_, log_);
    EXPECT_THROW(s.play_attempt(), std::runtime_error);
    EXPECT_THROW(s.visualize("freeman"), std::runtime_error);
}

TEST_F(SessionTest, AttemptNumbersSkipExistingFiles) {
    fs::create_directories(cfg_.recordings_dir());
    EXPECT_EQ(next_attempt_path(cfg_.recordings_dir()).filename().string(), "attempt_1.wav");

    save_wav_float(cfg_.recordings_dir() / "attempt_2.wav", sine(44100, 10, 0.5f));
    // one file present -> tries attempt_2, which is taken
    EXPECT_EQ(next_attempt_path(cfg_.recordings_dir()).filename().string(), "attempt_3.wav");
}

TEST_F(SessionTest, CompareRecordingsWithoutDevices) {
    add_reference("freeman");
    fs::create_directories(cfg_.recordings_dir());
    fs::path att = cfg_.recordings_dir() / "mine.wav";
    save_wav_float(att, sine(44100, 20000, 0.3f));

    RenderedFigure fig = compare_recordings(cfg_.references_dir() / "freeman.wav", att, cfg_, log_);
    EXPECT_EQ(fig.panels[kWaveformPanel].reference.y.size(), 8000u);
    EXPECT_EQ(fig.panels[kWaveformPanel].attempt.y.size(), 20000u);
    EXPECT_EQ(fig.panels[kEnvelopePanel].attempt.y.size(), (20000u + 2047u) / 2048u);
}

TEST_F(SessionTest, TrimmingASilentTakeStillRenders) {
    add_reference("freeman");
    fs::create_directories(cfg_.recordings_dir());
    fs::path att = cfg_.recordings_dir() / "silent.wav";
    save_wav_float(att, SampleBuffer{44100, std::vector<float>(6000, 0.0f)});

    cfg_.analysis.trimBeforeCompare = true;
    RenderedFigure fig = compare_recordings(cfg_.references_dir() / "freeman.wav", att, cfg_, log_);
    const Series& wave = fig.panels[kWaveformPanel].attempt;
    EXPECT_EQ(wave.y.size(), 6000u);
    for (double v : wave.y) EXPECT_EQ(v, 0.0);
}

TEST_F(SessionTest, CompareRecordingsCanTrimSilence) {
    fs::create_directories(cfg_.references_dir());
    SampleBuffer padded = sine(44100, 4096, 0.5f);
    padded.samples.insert(padded.samples.begin(), 8192, 0.0f);
    padded.samples.insert(padded.samples.end(), 8192, 0.0f);
    fs::path ref = cfg_.references_dir() / "padded.wav";
    save_wav_float(ref, padded);

    cfg_.analysis.trimBeforeCompare = true;
    RenderedFigure fig = compare_recordings(ref, ref, cfg_, log_);
    EXPECT_LT(fig.panels[kWaveformPanel].reference.y.size(), padded.samples.size());
}

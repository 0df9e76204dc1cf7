#include "voicemimic/cli_parsing.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

Options parse(std::vector<std::string> args) {
    args.insert(args.begin(), "voicemimic");
    std::vector<char*> argv;
    for (std::string& a : args) argv.push_back(a.data());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(ParseArgs, ReferenceWithDefaults) {
    Options opt = parse({"--reference", "mr_freeman"});
    ASSERT_TRUE(opt.reference.has_value());
    EXPECT_EQ(*opt.reference, "mr_freeman");
    EXPECT_TRUE(opt.listen);
    EXPECT_FALSE(opt.playback);
    EXPECT_EQ(opt.baseDir.string(), ".");

    Config cfg = to_config(opt);
    EXPECT_EQ(cfg.audio.sampleRate, 44100);
    EXPECT_EQ(cfg.audio.channels, 1);
    EXPECT_EQ(cfg.audio.chunkSize, 1024u);
    EXPECT_EQ(cfg.analysis.frameSize, 2048u);
    EXPECT_EQ(cfg.inputDevice, -1);
    EXPECT_EQ(cfg.plot.width_px(), 1000);
    EXPECT_EQ(cfg.plot.height_px(), 600);
}

TEST(ParseArgs, AllOptions) {
    Options opt = parse({"--reference", "x", "--attempt", "a.wav", "--base-dir", "/tmp/vm",
                         "--input-device", "3", "--output-device", "4", "--sample-rate", "48000",
                         "--frame-size", "1024", "--no-listen", "--playback", "--trim", "--verbose"});
    EXPECT_EQ(opt.attempt->string(), "a.wav");
    EXPECT_FALSE(opt.listen);
    EXPECT_TRUE(opt.playback);
    EXPECT_TRUE(opt.verbose);

    Config cfg = to_config(opt);
    EXPECT_EQ(cfg.baseDir.string(), "/tmp/vm");
    EXPECT_EQ(cfg.references_dir().string(), "/tmp/vm/references");
    EXPECT_EQ(cfg.inputDevice, 3);
    EXPECT_EQ(cfg.outputDevice, 4);
    EXPECT_EQ(cfg.audio.sampleRate, 48000);
    EXPECT_EQ(cfg.analysis.frameSize, 1024u);
    EXPECT_TRUE(cfg.analysis.trimBeforeCompare);
}

TEST(ParseArgs, ListingNeedsNoReference) {
    EXPECT_TRUE(parse({"--list-references"}).listReferences);
    EXPECT_TRUE(parse({"--list-devices"}).listDevices);
}

TEST(ParseArgs, Errors) {
    EXPECT_THROW(parse({"--reference"}), std::runtime_error);
    EXPECT_THROW(parse({"--bogus"}), std::runtime_error);
    EXPECT_THROW(parse({"--no-listen"}), std::runtime_error);
    EXPECT_THROW(parse({"--reference", "x", "--frame-size", "0"}), std::runtime_error);
    EXPECT_THROW(parse({"--reference", "x", "--sample-rate", "fast"}), std::runtime_error);
    EXPECT_THROW(parse({"--reference", "x", "--input-device", "2b"}), std::runtime_error);
    EXPECT_THROW(parse({"--reference", ""}), std::runtime_error);
}

TEST(ValidateConfig, RejectsBadValues) {
    Config cfg;
    EXPECT_NO_THROW(validate(cfg));
    cfg.audio.channels = 3;
    EXPECT_THROW(validate(cfg), std::invalid_argument);
    cfg = Config();
    cfg.audio.chunkSize = 0;
    EXPECT_THROW(validate(cfg), std::invalid_argument);
    cfg = Config();
    cfg.plot.dpi = 0;
    EXPECT_THROW(validate(cfg), std::invalid_argument);
}

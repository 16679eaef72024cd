#include "holly/tts_proxy/FormatSniffer.h"

#include <gtest/gtest.h>

#include <string>

using namespace holly::tts_proxy;
using Verdict = FormatSniffer::Verdict;

static std::string bytes(std::initializer_list<unsigned char> b) {
    return std::string(b.begin(), b.end());
}

TEST(FormatSnifferTests, Mp3Id3TagIsValid) {
    EXPECT_TRUE(FormatSniffer::classify("ID3\x04\x00", AudioFormat::Mp3).valid());
}

TEST(FormatSnifferTests, Mp3FrameSyncIsValid) {
    EXPECT_TRUE(FormatSniffer::classify(bytes({0xFF, 0xFB, 0x90, 0x64}), AudioFormat::Mp3).valid());
    EXPECT_TRUE(FormatSniffer::classify(bytes({0xFF, 0xE0}), AudioFormat::Mp3).valid());
    EXPECT_TRUE(FormatSniffer::classify(bytes({0xFF, 0xF3}), AudioFormat::Mp3).valid());
}

TEST(FormatSnifferTests, Mp3RejectsZeroBytesAndBadSync) {
    const auto zeros = FormatSniffer::classify(bytes({0x00, 0x00, 0x01}), AudioFormat::Mp3);
    EXPECT_EQ(zeros.verdict, Verdict::Invalid);
    EXPECT_FALSE(zeros.reason.empty());

    // 第二字节高 3 位不全为 1
    EXPECT_EQ(FormatSniffer::classify(bytes({0xFF, 0xC0}), AudioFormat::Mp3).verdict, Verdict::Invalid);
    EXPECT_EQ(FormatSniffer::classify("IDX", AudioFormat::Mp3).verdict, Verdict::Invalid);
    EXPECT_EQ(FormatSniffer::classify("{\"error\":1}", AudioFormat::Mp3).verdict, Verdict::Invalid);
}

TEST(FormatSnifferTests, ShortPrefixNeedsMoreUntilEndOfStream) {
    EXPECT_EQ(FormatSniffer::classify("I", AudioFormat::Mp3).verdict, Verdict::NeedMore);
    EXPECT_EQ(FormatSniffer::classify("ID", AudioFormat::Mp3).verdict, Verdict::NeedMore);
    EXPECT_EQ(FormatSniffer::classify(bytes({0xFF}), AudioFormat::Mp3).verdict, Verdict::NeedMore);
    EXPECT_EQ(FormatSniffer::classify("", AudioFormat::Mp3).verdict, Verdict::NeedMore);

    EXPECT_EQ(FormatSniffer::classify("ID", AudioFormat::Mp3, true).verdict, Verdict::Invalid);
    EXPECT_EQ(FormatSniffer::classify(bytes({0xFF}), AudioFormat::Mp3, true).verdict, Verdict::Invalid);
    EXPECT_EQ(FormatSniffer::classify("", AudioFormat::Mp3, true).verdict, Verdict::Invalid);
}

TEST(FormatSnifferTests, WavNeedsRiffAndWave) {
    const std::string header = std::string("RIFF") + bytes({0x24, 0x08, 0x00, 0x00}) + "WAVEfmt ";
    EXPECT_TRUE(FormatSniffer::classify(header, AudioFormat::Wav).valid());
    EXPECT_EQ(FormatSniffer::classify("RIFF\x24\x08", AudioFormat::Wav).verdict, Verdict::NeedMore);

    const std::string avi = std::string("RIFF") + bytes({0x24, 0x08, 0x00, 0x00}) + "AVI ";
    EXPECT_EQ(FormatSniffer::classify(avi, AudioFormat::Wav).verdict, Verdict::Invalid);
    EXPECT_EQ(FormatSniffer::classify("RIFX", AudioFormat::Wav).verdict, Verdict::Invalid);
}

TEST(FormatSnifferTests, OggFlacAndPcm) {
    EXPECT_TRUE(FormatSniffer::classify("OggS\x00\x02", AudioFormat::Ogg).valid());
    EXPECT_EQ(FormatSniffer::classify("Ogg", AudioFormat::Ogg).verdict, Verdict::NeedMore);
    EXPECT_EQ(FormatSniffer::classify("OpusHead", AudioFormat::Ogg).verdict, Verdict::Invalid);

    EXPECT_TRUE(FormatSniffer::classify("fLaC\x00", AudioFormat::Flac).valid());
    EXPECT_EQ(FormatSniffer::classify("flac", AudioFormat::Flac).verdict, Verdict::Invalid);

    EXPECT_TRUE(FormatSniffer::classify(bytes({0x00, 0x00}), AudioFormat::Pcm).valid());
}

TEST(FormatSnifferTests, FormatNamesAndContentTypes) {
    EXPECT_EQ(FormatSniffer::parseFormat("MP3"), AudioFormat::Mp3);
    EXPECT_EQ(FormatSniffer::parseFormat("wave"), AudioFormat::Wav);
    EXPECT_FALSE(FormatSniffer::parseFormat("aac").has_value());

    EXPECT_STREQ(FormatSniffer::contentType(AudioFormat::Mp3), "audio/mpeg");
    EXPECT_STREQ(FormatSniffer::contentType(AudioFormat::Wav), "audio/wav");
    EXPECT_STREQ(FormatSniffer::fileExtension(AudioFormat::Ogg), "ogg");
}

TEST(FormatSnifferTests, HexPrefix) {
    EXPECT_EQ(FormatSniffer::hexPrefix(bytes({0xFF, 0xFB, 0x00})), "fffb00");
    EXPECT_EQ(FormatSniffer::hexPrefix(std::string(20, 'A')).size(), 20u);
    EXPECT_EQ(FormatSniffer::hexPrefix(""), "");
}

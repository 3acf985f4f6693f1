#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "core/Errors.hpp"
#include "core/server/CapabilityProfile.hpp"
#include "core/server/MediaInspector.hpp"
#include "core/server/TranscodePlanner.hpp"

using namespace homestream::core;
using namespace homestream::core::server;

namespace {

MediaInfo mpeg2Program(int width, int height, double aspect) {
    MediaInfo info;
    info.container = "mpeg";
    info.videoCodec = "mpeg2video";
    info.width = width;
    info.height = height;
    info.aspectRatio = aspect;
    info.videoBitrate = 6000000;
    info.audioCodec = "ac3";
    info.audioBitrate = 384000;
    info.audioSampleRate = 48000;
    info.durationMs = 60000;
    info.bitrate = 6400000;
    return info;
}

MediaInfo h264Matroska() {
    MediaInfo info;
    info.container = "matroska,webm";
    info.videoCodec = "h264";
    info.width = 1920;
    info.height = 1080;
    info.aspectRatio = 16.0 / 9.0;
    info.videoBitrate = 8000000;
    info.audioCodec = "aac";
    info.audioBitrate = 128000;
    info.audioSampleRate = 48000;
    info.durationMs = 120000;
    return info;
}

bool hasOption(const TranscodeDecision& d, const std::string& name, const std::string& value) {
    for (size_t i = 0; i + 1 < d.options.size(); ++i) {
        if (d.options[i] == name && d.options[i + 1] == value) return true;
    }
    return false;
}

} // namespace

TEST(CapabilityProfileTest, ProfileFromSerialNumber) {
    EXPECT_EQ(profileForTsn("8490001234567890"), CapabilityProfile::UltraHighDefinition);
    EXPECT_EQ(profileForTsn("8f90001234567890"), CapabilityProfile::UltraHighDefinition);
    EXPECT_EQ(profileForTsn("7460001234567890"), CapabilityProfile::HighDefinitionTs);
    EXPECT_EQ(profileForTsn("6630001234567890"), CapabilityProfile::HighDefinitionTs);
    EXPECT_EQ(profileForTsn("6520001234567890"), CapabilityProfile::HighDefinition);
    EXPECT_EQ(profileForTsn("6490001234567890"), CapabilityProfile::StandardDefinition);
    EXPECT_EQ(profileForTsn("5400001234567890"), CapabilityProfile::StandardDefinition);
    EXPECT_EQ(profileForTsn(""), CapabilityProfile::StandardDefinition);
}

TEST(CapabilityProfileTest, LimitsTable) {
    const auto& sd = limitsFor(CapabilityProfile::StandardDefinition);
    EXPECT_EQ(sd.maxWidth, 544);
    EXPECT_EQ(sd.maxHeight, 480);
    EXPECT_TRUE(sd.padWidescreen);
    EXPECT_FALSE(sd.transportStream);

    const auto& uhd = limitsFor(CapabilityProfile::UltraHighDefinition);
    EXPECT_EQ(uhd.maxWidth, 3840);
    EXPECT_TRUE(uhd.acceptsVideo("hevc"));
    EXPECT_FALSE(limitsFor(CapabilityProfile::HighDefinition).acceptsVideo("h264"));
    EXPECT_STREQ(toString(CapabilityProfile::HighDefinitionTs), "HD-TS");
}

TEST(TranscodePlannerTest, NearestFrameSizes) {
    EXPECT_EQ(TranscodePlanner::nearestWidth(1920, 1920), 1920);
    EXPECT_EQ(TranscodePlanner::nearestWidth(1000, 1920), 1280);
    EXPECT_EQ(TranscodePlanner::nearestWidth(720, 544), 544);
    EXPECT_EQ(TranscodePlanner::nearestHeight(600, 1080), 720);
    EXPECT_EQ(TranscodePlanner::nearestHeight(2160, 1080), 1080);
    // 900 is equally far from 1080 and 720: the larger wins
    EXPECT_EQ(TranscodePlanner::nearestHeight(900, 1080), 1080);
}

TEST(TranscodePlannerTest, AudioRatesAreMultiplesOf64k) {
    EXPECT_EQ(TranscodePlanner::trunc64(448000), 448000);
    EXPECT_EQ(TranscodePlanner::trunc64(200000), 192000);
    EXPECT_EQ(TranscodePlanner::trunc64(1000), 64000);
}

TEST(TranscodePlannerTest, CompatibleProgramStreamPassesThrough) {
    TranscodePlanner planner;
    auto d = planner.plan(mpeg2Program(1920, 1080, 16.0 / 9.0), CapabilityProfile::HighDefinition,
                          kMimeTivoPs, 5000000);

    EXPECT_TRUE(d.passThrough);
    EXPECT_EQ(d.reason, "compatible");
    EXPECT_EQ(d.estimatedSize, 5000000);
    EXPECT_TRUE(d.options.empty());
}

TEST(TranscodePlannerTest, OversizedFrameIsScaledDown) {
    TranscodePlanner planner;
    auto d = planner.plan(mpeg2Program(1920, 1080, 16.0 / 9.0), CapabilityProfile::StandardDefinition,
                          kMimeTivoPs, 5000000);

    EXPECT_FALSE(d.passThrough);
    EXPECT_NE(d.reason.find("frame size"), std::string::npos);
    EXPECT_TRUE(hasOption(d, "-vcodec", "mpeg2video"));
    EXPECT_TRUE(hasOption(d, "-b:v", "4096k"));
    EXPECT_TRUE(hasOption(d, "-bufsize", "1024k"));
    // Widescreen on a 4:3 receiver is letterboxed
    EXPECT_TRUE(hasOption(d, "-vf", "scale=544:360,pad=544:480:0:60"));
    EXPECT_TRUE(hasOption(d, "-aspect", "4:3"));
    // Audio is already fine
    EXPECT_TRUE(hasOption(d, "-acodec", "copy"));
    EXPECT_TRUE(hasOption(d, "-f", "vob"));
}

TEST(TranscodePlannerTest, WidescreenNeedsLetterboxOnStandardDefinition) {
    TranscodePlanner planner;
    auto d = planner.plan(mpeg2Program(544, 480, 16.0 / 9.0), CapabilityProfile::StandardDefinition,
                          kMimeTivoPs, 1000);
    EXPECT_FALSE(d.passThrough);
    EXPECT_EQ(d.reason, "16:9 source needs letterboxing");

    auto narrow = planner.plan(mpeg2Program(544, 480, 4.0 / 3.0), CapabilityProfile::StandardDefinition,
                               kMimeTivoPs, 1000);
    EXPECT_TRUE(narrow.passThrough);
}

TEST(TranscodePlannerTest, TransportStreamReceiverTakesH264) {
    TranscodePlanner planner;

    MediaInfo info = h264Matroska();
    info.container = "mpegts";
    auto d = planner.plan(info, CapabilityProfile::HighDefinitionTs, kMimeTivoTs, 1000);
    EXPECT_TRUE(d.passThrough);
    EXPECT_EQ(d.format, OutputFormat::MpegTs);

    // Same stream asked for as a program stream needs MPEG-2
    auto ps = planner.plan(info, CapabilityProfile::HighDefinitionTs, kMimeTivoPs, 1000);
    EXPECT_FALSE(ps.passThrough);
    EXPECT_TRUE(hasOption(ps, "-f", "vob"));
}

TEST(TranscodePlannerTest, IncompatibleContainerIsTranscoded) {
    TranscodePlanner planner;
    auto d = planner.plan(h264Matroska(), CapabilityProfile::HighDefinition, kMimeTivoPs, 1000);

    EXPECT_FALSE(d.passThrough);
    EXPECT_NE(d.reason.find("container"), std::string::npos);
    EXPECT_TRUE(hasOption(d, "-vf", "scale=1920:1080"));
    EXPECT_TRUE(hasOption(d, "-aspect", "16:9"));
    EXPECT_TRUE(hasOption(d, "-acodec", "ac3"));
    EXPECT_TRUE(hasOption(d, "-b:a", "448k"));
    EXPECT_TRUE(hasOption(d, "-ar", "48000"));

    // 120 s at 16384k video + 448k audio, plus 2%
    const double expected = 120.0 * (16384000.0 + 448000.0) * 1.02 / 8.0;
    EXPECT_NEAR(static_cast<double>(d.estimatedSize), expected, 1.0);
}

TEST(TranscodePlannerTest, AudioOnlyFileIsRejected) {
    TranscodePlanner planner;
    MediaInfo info;
    info.container = "mp3";
    info.audioCodec = "mp3";
    auto d = planner.plan(info, CapabilityProfile::HighDefinition, kMimeTivoPs, 1000);
    EXPECT_FALSE(d.passThrough);
    EXPECT_EQ(d.reason, "no video stream");
}

TEST(TranscodePlannerTest, OverridesReplaceProfileRates) {
    TranscodeSettings settings = TranscodeSettings::fromJson(nlohmann::json::parse(
        R"({"videoBitrate": "8M", "maxVideoBitrate": "12M", "audioBitrate": "200k", "tsFlag": "false"})"));
    TranscodePlanner planner(settings);

    auto limits = planner.limits(CapabilityProfile::HighDefinition);
    EXPECT_EQ(limits.videoBitrate, 8000000);
    EXPECT_EQ(limits.maxVideoBitrate, 12000000);

    auto d = planner.plan(h264Matroska(), CapabilityProfile::HighDefinition, kMimeTivoPs, 1000);
    EXPECT_TRUE(hasOption(d, "-b:v", "8000k"));
    EXPECT_TRUE(hasOption(d, "-b:a", "192k"));

    EXPECT_FALSE(planner.useTransportStream(CapabilityProfile::HighDefinitionTs, "/v/show.mkv"));
}

TEST(TranscodePlannerTest, TransportStreamChoiceFollowsExtension) {
    TranscodePlanner planner;
    EXPECT_TRUE(planner.useTransportStream(CapabilityProfile::HighDefinitionTs, "/v/show.MKV"));
    EXPECT_FALSE(planner.useTransportStream(CapabilityProfile::HighDefinitionTs, "/v/show.mpg"));
    EXPECT_FALSE(planner.useTransportStream(CapabilityProfile::HighDefinition, "/v/show.ts"));
}

TEST(TranscodePlannerTest, CommandWritesToStdout) {
    TranscodePlanner planner;
    auto d = planner.plan(h264Matroska(), CapabilityProfile::HighDefinition, kMimeTivoPs, 1000);
    auto cmd = planner.command("/v/show.mkv", d);

    ASSERT_GE(cmd.size(), 7u);
    EXPECT_EQ(cmd.front(), "ffmpeg");
    EXPECT_EQ(cmd[5], "/v/show.mkv");
    EXPECT_EQ(cmd.back(), "-");
}

TEST(TranscodePlannerTest, BadSettingsThrow) {
    EXPECT_THROW(TranscodeSettings::fromJson(nlohmann::json{{"tsFlag", "maybe"}}), ConfigError);
    EXPECT_THROW(TranscodeSettings::fromJson(nlohmann::json{{"videoBitrate", "fast"}}), ConfigError);
}

TEST(FfprobeInspectorTest, ParsesProbeOutput) {
    const char* output = R"({
        "streams": [
            {"codec_type": "video", "codec_name": "mpeg2video", "width": 720, "height": 480,
             "display_aspect_ratio": "16:9", "bit_rate": "5000000"},
            {"codec_type": "audio", "codec_name": "ac3", "sample_rate": "48000", "bit_rate": "384000"}
        ],
        "format": {"format_name": "mpeg", "duration": "1800.500000", "bit_rate": "5500000"}
    })";

    auto info = FfprobeInspector::parse(output);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->container, "mpeg");
    EXPECT_EQ(info->videoCodec, "mpeg2video");
    EXPECT_EQ(info->width, 720);
    EXPECT_EQ(info->height, 480);
    EXPECT_TRUE(info->isWidescreen());
    EXPECT_EQ(info->videoBitrate, 5000000);
    EXPECT_EQ(info->audioCodec, "ac3");
    EXPECT_EQ(info->audioSampleRate, 48000);
    EXPECT_EQ(info->durationMs, 1800500);
    EXPECT_EQ(info->bitrate, 5500000);

    EXPECT_FALSE(FfprobeInspector::parse("not json").has_value());
}

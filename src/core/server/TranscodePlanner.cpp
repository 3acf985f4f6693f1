/**
 * TranscodePlanner.cpp
 */

#include "TranscodePlanner.hpp"
#include "../Errors.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <filesystem>

namespace homestream::core::server {

using utils::StringUtils;

namespace {

constexpr std::array<int, 9> kValidWidths{3840, 1920, 1440, 1280, 720, 704, 544, 480, 352};
constexpr std::array<int, 4> kValidHeights{2160, 1080, 720, 480};

// Extensions that most likely hold a transport stream already
const std::vector<std::string> kLikelyTs{
    ".ts", ".tp", ".trp", ".3g2", ".3gp", ".3gp2", ".3gpp", ".m2t", ".m2ts", ".mts",
    ".mp4", ".m4v", ".flv", ".mkv", ".mov", ".wtv", ".dvr-ms", ".webm"
};

template<size_t N>
int nearest(int value, int maxValue, const std::array<int, N>& candidates) {
    int best = 0;
    for (int candidate : candidates) {
        if (candidate > maxValue) continue;
        if (best == 0) {
            best = candidate;
            continue;
        }
        int dBest = std::abs(value - best);
        int dCandidate = std::abs(value - candidate);
        if (dCandidate < dBest || (dCandidate == dBest && candidate > best)) {
            best = candidate;
        }
    }
    return best;
}

std::string kbps(int64_t bitsPerSecond) {
    return std::to_string(bitsPerSecond / 1000) + "k";
}

std::optional<int64_t> rateField(const nlohmann::json& section, const char* key) {
    if (!section.contains(key) || section[key].is_null()) {
        return std::nullopt;
    }
    const auto& value = section[key];
    if (value.is_number()) {
        return value.get<int64_t>();
    }
    if (value.is_string()) {
        if (value.get<std::string>().empty()) return std::nullopt;
        if (auto rate = StringUtils::parseBitrate(value.get<std::string>())) {
            return static_cast<int64_t>(*rate);
        }
    }
    throw ConfigError(std::string("transcode.") + key + " is not a bit rate");
}

} // namespace

const char* toString(OutputFormat format) {
    return format == OutputFormat::MpegTs ? "mpegts" : "vob";
}

TranscodeSettings TranscodeSettings::fromJson(const nlohmann::json& section) {
    TranscodeSettings settings;
    if (!section.is_object()) {
        return settings;
    }

    settings.ffmpegPath = section.value("ffmpeg", settings.ffmpegPath);
    settings.tsFlag = StringUtils::toLower(section.value("tsFlag", settings.tsFlag));
    if (settings.tsFlag != "auto" && settings.tsFlag != "true" && settings.tsFlag != "false") {
        throw ConfigError("transcode.tsFlag must be auto, true or false");
    }

    if (auto rate = rateField(section, "audioBitrate")) settings.audioBitrate = *rate;
    settings.maxAudioBitrate = rateField(section, "maxAudioBitrate");
    settings.videoBitrate = rateField(section, "videoBitrate");
    settings.maxVideoBitrate = rateField(section, "maxVideoBitrate");
    settings.bufferSize = rateField(section, "bufferSize");
    return settings;
}

TranscodePlanner::TranscodePlanner(TranscodeSettings settings)
    : m_settings(std::move(settings)) {
}

int TranscodePlanner::nearestWidth(int width, int maxWidth) {
    return nearest(width, maxWidth, kValidWidths);
}

int TranscodePlanner::nearestHeight(int height, int maxHeight) {
    return nearest(height, maxHeight, kValidHeights);
}

int64_t TranscodePlanner::trunc64(int64_t bitsPerSecond) {
    return std::max<int64_t>(bitsPerSecond / 64000, 1) * 64000;
}

ProfileLimits TranscodePlanner::limits(CapabilityProfile profile) const {
    ProfileLimits limits = limitsFor(profile);
    if (m_settings.maxVideoBitrate) limits.maxVideoBitrate = *m_settings.maxVideoBitrate;
    if (m_settings.videoBitrate) limits.videoBitrate = *m_settings.videoBitrate;
    if (m_settings.bufferSize) limits.bufferSize = *m_settings.bufferSize;
    if (m_settings.maxAudioBitrate) limits.maxAudioBitrate = trunc64(*m_settings.maxAudioBitrate);
    limits.videoBitrate = std::min(limits.videoBitrate, limits.maxVideoBitrate);
    return limits;
}

bool TranscodePlanner::useTransportStream(CapabilityProfile profile, const std::string& path) const {
    if (!limitsFor(profile).transportStream) {
        return false;
    }
    if (m_settings.tsFlag == "true") return true;
    if (m_settings.tsFlag == "false") return false;

    std::string ext = StringUtils::toLower(std::filesystem::path(path).extension().string());
    return std::find(kLikelyTs.begin(), kLikelyTs.end(), ext) != kLikelyTs.end();
}

TranscodeDecision TranscodePlanner::plan(const MediaInfo& info, CapabilityProfile profile,
                                         const std::string& mime, int64_t fileSize) const {
    const ProfileLimits lim = limits(profile);
    const bool wantTs = mime == kMimeTivoTs && lim.transportStream;

    TranscodeDecision decision;
    decision.format = wantTs ? OutputFormat::MpegTs : OutputFormat::Vob;

    const bool isTsContainer = info.container.find("mpegts") != std::string::npos;
    const bool isPsContainer = !isTsContainer &&
        (info.container.find("mpeg") != std::string::npos || info.container.find("vob") != std::string::npos);

    const bool videoCodecOk = wantTs ? lim.acceptsVideo(info.videoCodec) : info.videoCodec == "mpeg2video";
    const bool sizeOk = info.width > 0 && info.height > 0 &&
                        info.width <= lim.maxWidth && info.height <= lim.maxHeight;
    const int64_t videoRate = info.videoBitrate > 0 ? info.videoBitrate : info.bitrate;
    const bool rateOk = videoRate <= lim.maxVideoBitrate;
    const bool needsPadding = lim.padWidescreen && info.isWidescreen();

    const bool audioCodecOk = info.audioCodec.empty() ||
        (wantTs ? lim.acceptsAudio(info.audioCodec) : (info.audioCodec == "ac3" || info.audioCodec == "mp2"));
    const bool audioRateOk = info.audioBitrate <= lim.maxAudioBitrate;

    if (!info.hasVideo()) {
        decision.reason = "no video stream";
    } else if (wantTs ? !isTsContainer : !isPsContainer) {
        decision.reason = "container " + info.container + " not accepted";
    } else if (!videoCodecOk) {
        decision.reason = "video codec " + info.videoCodec + " not accepted";
    } else if (!sizeOk) {
        decision.reason = "frame size " + std::to_string(info.width) + "x" + std::to_string(info.height) + " not accepted";
    } else if (!rateOk) {
        decision.reason = "video bit rate " + kbps(videoRate) + " over " + kbps(lim.maxVideoBitrate);
    } else if (needsPadding) {
        decision.reason = "16:9 source needs letterboxing";
    } else if (!audioCodecOk) {
        decision.reason = "audio codec " + info.audioCodec + " not accepted";
    } else if (!audioRateOk) {
        decision.reason = "audio bit rate " + kbps(info.audioBitrate) + " over " + kbps(lim.maxAudioBitrate);
    } else {
        decision.passThrough = true;
        decision.reason = "compatible";
        decision.estimatedSize = fileSize;
        return decision;
    }

    decision.passThrough = false;
    auto& opts = decision.options;

    // Video
    const bool copyVideo = info.hasVideo() && videoCodecOk && info.videoCodec == "mpeg2video" &&
                           sizeOk && rateOk && !needsPadding;
    int64_t videoOut = lim.videoBitrate;
    if (copyVideo) {
        opts.insert(opts.end(), {"-vcodec", "copy"});
        videoOut = videoRate;
    } else {
        int width = nearestWidth(info.width > 0 ? std::min(info.width, lim.maxWidth) : lim.maxWidth, lim.maxWidth);
        int height = nearestHeight(info.height > 0 ? std::min(info.height, lim.maxHeight) : lim.maxHeight, lim.maxHeight);

        opts.insert(opts.end(), {
            "-vcodec", "mpeg2video",
            "-b:v", kbps(lim.videoBitrate),
            "-maxrate", kbps(lim.maxVideoBitrate),
            "-bufsize", kbps(lim.bufferSize)
        });

        if (needsPadding) {
            int scaled = (height * 3 / 4) & ~1;
            int top = ((height - scaled) / 2) & ~1;
            opts.insert(opts.end(), {
                "-vf", "scale=" + std::to_string(width) + ":" + std::to_string(scaled) +
                       ",pad=" + std::to_string(width) + ":" + std::to_string(height) +
                       ":0:" + std::to_string(top),
                "-aspect", "4:3"
            });
        } else {
            opts.insert(opts.end(), {
                "-vf", "scale=" + std::to_string(width) + ":" + std::to_string(height),
                "-aspect", info.isWidescreen() ? "16:9" : "4:3"
            });
        }
    }

    // Audio
    const int64_t audioTarget = std::min(trunc64(m_settings.audioBitrate), lim.maxAudioBitrate);
    int64_t audioOut = audioTarget;
    if (!info.audioCodec.empty() && audioCodecOk && audioRateOk) {
        opts.insert(opts.end(), {"-acodec", "copy"});
        audioOut = info.audioBitrate;
    } else {
        opts.insert(opts.end(), {"-acodec", "ac3", "-b:a", kbps(audioTarget), "-ar", "48000"});
    }

    opts.insert(opts.end(), {"-f", toString(decision.format)});

    decision.estimatedSize = static_cast<int64_t>(
        (static_cast<double>(info.durationMs) / 1000.0) *
        (static_cast<double>(videoOut + audioOut) * 1.02 / 8.0));
    return decision;
}

std::vector<std::string> TranscodePlanner::command(const std::string& input, const TranscodeDecision& decision) const {
    std::vector<std::string> cmd{m_settings.ffmpegPath, "-hide_banner", "-loglevel", "error", "-i", input};
    cmd.insert(cmd.end(), decision.options.begin(), decision.options.end());
    cmd.push_back("-");
    return cmd;
}

} // namespace homestream::core::server

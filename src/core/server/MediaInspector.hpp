#pragma once

/**
 * MediaInspector.hpp
 *
 * Stream facts about a media file, as reported by an external inspector.
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace homestream::core::server {

struct MediaInfo {
    std::string container;        // format name, e.g. "mpeg", "mpegts", "matroska,webm"
    std::string videoCodec;
    int width{0};
    int height{0};
    double aspectRatio{0.0};      // display aspect; 0 if unknown
    int64_t videoBitrate{0};      // bits per second; 0 if unknown
    std::string audioCodec;
    int64_t audioBitrate{0};
    int audioSampleRate{0};
    int64_t durationMs{0};
    int64_t bitrate{0};           // overall

    bool hasVideo() const { return !videoCodec.empty(); }
    bool isWidescreen() const { return aspectRatio >= 1.7; }
};

/**
 * MediaInspector - media inspection interface
 */
class MediaInspector {
public:
    virtual ~MediaInspector() = default;

    /**
     * @return Stream facts, nullopt if the file cannot be inspected
     */
    virtual std::optional<MediaInfo> inspect(const std::string& path) = 0;
};

/**
 * FfprobeInspector - runs ffprobe with JSON output
 */
class FfprobeInspector : public MediaInspector {
public:
    explicit FfprobeInspector(std::string ffprobePath = "ffprobe");

    std::optional<MediaInfo> inspect(const std::string& path) override;

    /**
     * Parse "ffprobe -print_format json -show_format -show_streams" output
     */
    static std::optional<MediaInfo> parse(const std::string& output);

private:
    std::string m_ffprobePath;
};

} // namespace homestream::core::server

#pragma once

/**
 * TranscodePlanner.hpp
 *
 * Decides whether a file can be sent to a receiver as-is and, if not,
 * which transcoder options make it playable.
 */

#include "CapabilityProfile.hpp"
#include "MediaInspector.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace homestream::core::server {

inline constexpr const char* kMimeTivoPs = "video/x-tivo-mpeg";
inline constexpr const char* kMimeTivoTs = "video/x-tivo-mpeg-ts";
inline constexpr const char* kMimeMpeg = "video/mpeg";

enum class OutputFormat {
    Vob,
    MpegTs
};

const char* toString(OutputFormat format);

/**
 * "transcode" configuration section. Overrides replace the profile's
 * default rates when set.
 */
struct TranscodeSettings {
    std::string ffmpegPath{"ffmpeg"};
    std::string tsFlag{"auto"};                // auto | true | false
    int64_t audioBitrate{448000};
    std::optional<int64_t> maxAudioBitrate;
    std::optional<int64_t> videoBitrate;
    std::optional<int64_t> maxVideoBitrate;
    std::optional<int64_t> bufferSize;

    /**
     * @throws ConfigError on unparsable rates or an unknown tsFlag
     */
    static TranscodeSettings fromJson(const nlohmann::json& section);
};

struct TranscodeDecision {
    bool passThrough{true};
    std::string reason;
    OutputFormat format{OutputFormat::Vob};
    std::vector<std::string> options;          // transcoder arguments between input and output
    int64_t estimatedSize{0};
};

/**
 * TranscodePlanner - per-profile pass-through / transcode decisions
 */
class TranscodePlanner {
public:
    explicit TranscodePlanner(TranscodeSettings settings = {});

    /**
     * @param info Inspection result for the source
     * @param profile Requesting receiver's profile
     * @param mime Requested output mime type (TS or PS flavour)
     * @param fileSize Source size in bytes
     */
    TranscodeDecision plan(const MediaInfo& info, CapabilityProfile profile,
                           const std::string& mime, int64_t fileSize) const;

    /**
     * Full transcoder command line writing to stdout
     */
    std::vector<std::string> command(const std::string& input, const TranscodeDecision& decision) const;

    /**
     * Whether a non-.tivo file is offered to this receiver as a transport stream
     */
    bool useTransportStream(CapabilityProfile profile, const std::string& path) const;

    /**
     * Limits for a profile with the configured overrides applied
     */
    ProfileLimits limits(CapabilityProfile profile) const;

    const TranscodeSettings& settings() const { return m_settings; }

    // Nearest receiver frame size no larger than the given maximum;
    // ties go to the larger value
    static int nearestWidth(int width, int maxWidth);
    static int nearestHeight(int height, int maxHeight);

    // Round down to a non-zero multiple of 64 kbps
    static int64_t trunc64(int64_t bitsPerSecond);

private:
    TranscodeSettings m_settings;
};

} // namespace homestream::core::server

// HomeStream - Receiver capability profiles
// Closed set of receiver classes and what each one can play without transcoding

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace homestream::core::server {

/**
 * @brief Receiver class, derived from the serial number (TSN)
 */
enum class CapabilityProfile {
    StandardDefinition,
    HighDefinition,
    HighDefinitionTs,       // HD receiver that also takes transport streams
    UltraHighDefinition
};

const char* toString(CapabilityProfile profile);

/**
 * @brief Decision table row for one profile
 *
 * Bitrates are bits per second.
 */
struct ProfileLimits {
    int maxWidth;
    int maxHeight;
    int64_t videoBitrate;        // default when transcoding
    int64_t maxVideoBitrate;
    int64_t bufferSize;
    int64_t maxAudioBitrate;
    bool transportStream;
    bool padWidescreen;          // receiver shows 4:3 only; 16:9 sources get letterboxed
    std::vector<std::string> videoCodecs;   // pass-through capable
    std::vector<std::string> audioCodecs;

    bool acceptsVideo(const std::string& codec) const;
    bool acceptsAudio(const std::string& codec) const;
};

/**
 * @brief Profile for a receiver serial number
 *
 * 849/8F9 prefix: UHD. First digit 7 or above, or prefix 663: HD with
 * transport streams. First digit 6 or above except 649: HD. Anything
 * else, including an empty serial: SD.
 */
CapabilityProfile profileForTsn(const std::string& tsn);

const ProfileLimits& limitsFor(CapabilityProfile profile);

} // namespace homestream::core::server

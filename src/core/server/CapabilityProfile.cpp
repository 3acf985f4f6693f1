// HomeStream - Receiver capability profiles

#include "CapabilityProfile.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>

namespace homestream::core::server {

using utils::StringUtils;

const char* toString(CapabilityProfile profile) {
    switch (profile) {
        case CapabilityProfile::StandardDefinition:  return "SD";
        case CapabilityProfile::HighDefinition:      return "HD";
        case CapabilityProfile::HighDefinitionTs:    return "HD-TS";
        case CapabilityProfile::UltraHighDefinition: return "UHD";
    }
    return "SD";
}

bool ProfileLimits::acceptsVideo(const std::string& codec) const {
    return std::find(videoCodecs.begin(), videoCodecs.end(), codec) != videoCodecs.end();
}

bool ProfileLimits::acceptsAudio(const std::string& codec) const {
    return std::find(audioCodecs.begin(), audioCodecs.end(), codec) != audioCodecs.end();
}

CapabilityProfile profileForTsn(const std::string& tsn) {
    if (tsn.empty()) {
        return CapabilityProfile::StandardDefinition;
    }

    std::string prefix = StringUtils::toUpper(tsn.substr(0, 3));
    char first = tsn[0];

    if (prefix == "849" || prefix == "8F9") {
        return CapabilityProfile::UltraHighDefinition;
    }
    if (first >= '7' || prefix == "663") {
        return CapabilityProfile::HighDefinitionTs;
    }
    if (first >= '6' && prefix != "649") {
        return CapabilityProfile::HighDefinition;
    }
    return CapabilityProfile::StandardDefinition;
}

const ProfileLimits& limitsFor(CapabilityProfile profile) {
    static const ProfileLimits sd{
        544, 480,
        4096000, 30000000, 1024000, 448000,
        false, true,
        {"mpeg2video"},
        {"ac3", "mp2"}
    };
    static const ProfileLimits hd{
        1920, 1080,
        16384000, 30000000, 4096000, 448000,
        false, false,
        {"mpeg2video"},
        {"ac3", "mp2"}
    };
    static const ProfileLimits hdTs{
        1920, 1080,
        16384000, 30000000, 4096000, 448000,
        true, false,
        {"mpeg2video", "h264"},
        {"ac3", "mp2", "aac"}
    };
    static const ProfileLimits uhd{
        3840, 2160,
        30000000, 30000000, 8192000, 448000,
        true, false,
        {"mpeg2video", "h264", "hevc"},
        {"ac3", "eac3", "mp2", "aac"}
    };

    switch (profile) {
        case CapabilityProfile::StandardDefinition:  return sd;
        case CapabilityProfile::HighDefinition:      return hd;
        case CapabilityProfile::HighDefinitionTs:    return hdTs;
        case CapabilityProfile::UltraHighDefinition: return uhd;
    }
    return sd;
}

} // namespace homestream::core::server

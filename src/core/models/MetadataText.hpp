// HomeStream - Metadata sidecar files
// "key: value" text kept next to a recording as "<file>.txt"

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "Recording.hpp"

namespace homestream {

/**
 * Parsed sidecar. Keys starting with 'v' (vActor, vProgramGenre...) may
 * repeat; every other key keeps its last value.
 */
using MetadataFields = std::map<std::string, std::vector<std::string>>;

class MetadataText {
public:
    /**
     * "<mediaPath>.txt"
     */
    static std::string sidecarPath(const std::string& mediaPath);

    static std::string render(const Recording& recording);

    /**
     * Writes render() to path
     * @return false if the file cannot be written
     */
    static bool write(const Recording& recording, const std::string& path);

    /**
     * Lines without ':' and lines starting with '#' are skipped, as is a
     * leading byte order mark.
     */
    static MetadataFields parse(const std::string& text);

    /**
     * @return nullopt if there is no readable file at path
     */
    static std::optional<MetadataFields> read(const std::string& path);

    /**
     * Overlay the fields HomeStream understands onto recording
     */
    static void apply(const MetadataFields& fields, Recording& recording);

    // "PT1H30M0S" <-> seconds
    static std::string formatDuration(int64_t seconds);
    static std::optional<int64_t> parseDuration(const std::string& value);
};

} // namespace homestream

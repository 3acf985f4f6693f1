// HomeStream - Recording model
// An item available for transfer, either a local file or a show on a receiver

#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace homestream {

using json = nlohmann::json;
using TimePoint = std::chrono::system_clock::time_point;

enum class StreamKind {
    TS,
    PS
};

const char* toString(StreamKind kind);
std::optional<StreamKind> parseStreamKind(const std::string& value);

/**
 * @brief How to address the bytes of a recording
 */
struct SourceLocator {
    enum class Type {
        LocalPath,
        Receiver
    };

    Type type{Type::LocalPath};
    std::string path;       // LocalPath: file on disk
    std::string receiver;   // Receiver: unit id (serial number)
    std::string url;        // Receiver: show download reference
    bool encrypted{false};  // Delivered inside an encrypted container

    json toJson() const;
    static SourceLocator fromJson(const json& j);
};

/**
 * @brief Recording metadata
 *
 * Optional fields stay unset when the source does not provide them; the
 * naming templates define how an unset value renders. movieYear being set
 * is the only thing that selects movie naming.
 */
struct Recording {
    std::string id;
    std::string title;
    std::string episodeTitle;
    std::string description;
    std::string seriesId;
    std::string programId;
    std::optional<int> season;
    std::optional<int> episode;
    std::optional<TimePoint> dateRecorded;
    std::optional<TimePoint> originalAirDate;
    std::string callsign;
    std::string channel;
    std::optional<int> movieYear;
    std::optional<int64_t> durationSeconds;
    StreamKind streamKind{StreamKind::TS};
    std::optional<uint64_t> sizeBytes;
    SourceLocator source;

    bool isMovie() const { return movieYear.has_value(); }

    /**
     * Unit the bytes come from ("local" for files on this host)
     */
    std::string unit() const;

    json toJson() const;
    static Recording fromJson(const json& j);
};

} // namespace homestream

#pragma once

/**
 * NamingResolver.hpp
 *
 * Turns recording metadata into an output file stem using the movie and
 * episode naming templates.
 */

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../models/Recording.hpp"

namespace homestream::core {

/**
 * Movie and episode naming templates
 */
struct NamingConfig {
    std::string movieTemplate{"{title} ({movie_year})"};
    std::string episodeTemplate{"{title} - s{season}e{episode} - {episode_title} ({date_recorded},{callsign})"};

    static NamingConfig fromJson(const nlohmann::json& j);
};

/**
 * NamingResolver - compiled naming templates
 *
 * Grammar:
 *   literal text, {field}, {field:format}, "{{" and "}}" for literal braces
 *
 * Fields:
 *   title, episode_title, callsign, channel, stream_kind   strings, no format
 *   season, episode, movie_year                           integers, format [0][width][d]
 *   date_recorded, original_air_date                      dates, format is a strftime pattern
 *
 * season and episode default to two zero-padded digits; unset integers
 * render as 0 and unset dates as 1900-01-01. Substituted values are made
 * safe for file names; literal template text is kept as written.
 *
 * Both templates are checked in the constructor, which throws
 * TemplateFieldError for an unknown field, an unterminated brace or a
 * format the field does not accept.
 */
class NamingResolver {
public:
    NamingResolver(const std::string& movieTemplate, const std::string& episodeTemplate);
    explicit NamingResolver(const NamingConfig& config);

    /**
     * Resolve the file stem (no directory, no extension) for a recording.
     * The movie template is used iff movieYear is set.
     */
    std::string resolve(const Recording& recording) const;

    const NamingConfig& config() const { return m_config; }

private:
    enum class Field {
        Title,
        Season,
        Episode,
        EpisodeTitle,
        DateRecorded,
        Callsign,
        Channel,
        MovieYear,
        OriginalAirDate,
        StreamKind
    };

    struct Segment {
        bool literal{true};
        std::string text;           // literal text, or the strftime format of a date field
        Field field{Field::Title};
        int width{0};
        bool zeroPad{false};
    };

    static std::vector<Segment> compile(const std::string& tmpl);
    static Segment compileField(const std::string& name, const std::string& format, bool hasFormat);
    static std::string render(const std::vector<Segment>& segments, const Recording& recording);

    NamingConfig m_config;
    std::vector<Segment> m_movie;
    std::vector<Segment> m_episode;
};

} // namespace homestream::core

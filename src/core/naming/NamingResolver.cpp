/**
 * NamingResolver.cpp
 */

#include "NamingResolver.hpp"
#include "../Errors.hpp"
#include "../../utils/StringUtils.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace homestream::core {

using utils::StringUtils;

NamingConfig NamingConfig::fromJson(const nlohmann::json& j) {
    NamingConfig config;
    if (j.is_object()) {
        config.movieTemplate = j.value("movie", config.movieTemplate);
        config.episodeTemplate = j.value("episode", config.episodeTemplate);
    }
    return config;
}

NamingResolver::NamingResolver(const std::string& movieTemplate, const std::string& episodeTemplate)
    : m_config{movieTemplate, episodeTemplate}
    , m_movie(compile(movieTemplate))
    , m_episode(compile(episodeTemplate)) {
}

NamingResolver::NamingResolver(const NamingConfig& config)
    : NamingResolver(config.movieTemplate, config.episodeTemplate) {
}

std::string NamingResolver::resolve(const Recording& recording) const {
    return render(recording.isMovie() ? m_movie : m_episode, recording);
}

// -- Compilation --

std::vector<NamingResolver::Segment> NamingResolver::compile(const std::string& tmpl) {
    std::vector<Segment> segments;
    std::string literal;

    auto flushLiteral = [&]() {
        if (!literal.empty()) {
            Segment seg;
            seg.literal = true;
            seg.text = std::move(literal);
            segments.push_back(std::move(seg));
            literal.clear();
        }
    };

    size_t i = 0;
    while (i < tmpl.size()) {
        char c = tmpl[i];

        if (c == '{') {
            if (i + 1 < tmpl.size() && tmpl[i + 1] == '{') {
                literal += '{';
                i += 2;
                continue;
            }

            size_t close = tmpl.find('}', i + 1);
            if (close == std::string::npos) {
                std::string partial = tmpl.substr(i + 1);
                throw TemplateFieldError(partial, "unterminated field in naming template '" + tmpl + "'");
            }

            std::string body = tmpl.substr(i + 1, close - i - 1);
            if (body.find('{') != std::string::npos) {
                throw TemplateFieldError(body, "nested brace in naming template '" + tmpl + "'");
            }

            auto colon = body.find(':');
            std::string name = StringUtils::trim(body.substr(0, colon));
            std::string format = colon == std::string::npos ? "" : body.substr(colon + 1);

            flushLiteral();
            segments.push_back(compileField(name, format, colon != std::string::npos));
            i = close + 1;
            continue;
        }

        if (c == '}') {
            if (i + 1 < tmpl.size() && tmpl[i + 1] == '}') {
                literal += '}';
                i += 2;
                continue;
            }
            throw TemplateFieldError("}", "single '}' in naming template '" + tmpl + "'");
        }

        literal += c;
        ++i;
    }

    flushLiteral();
    return segments;
}

NamingResolver::Segment NamingResolver::compileField(const std::string& name,
                                                     const std::string& format,
                                                     bool hasFormat) {
    static const std::unordered_map<std::string, Field> fields = {
        {"title", Field::Title},
        {"season", Field::Season},
        {"episode", Field::Episode},
        {"episode_title", Field::EpisodeTitle},
        {"date_recorded", Field::DateRecorded},
        {"callsign", Field::Callsign},
        {"channel", Field::Channel},
        {"movie_year", Field::MovieYear},
        {"original_air_date", Field::OriginalAirDate},
        {"stream_kind", Field::StreamKind}
    };

    auto it = fields.find(name);
    if (it == fields.end()) {
        throw TemplateFieldError(name, "unknown naming template field '" + name + "'");
    }

    Segment seg;
    seg.literal = false;
    seg.field = it->second;

    switch (seg.field) {
        case Field::Season:
        case Field::Episode:
        case Field::MovieYear: {
            bool paddedByDefault = seg.field != Field::MovieYear;
            seg.zeroPad = paddedByDefault;
            seg.width = paddedByDefault ? 2 : 0;

            // [0][width][d]
            size_t pos = 0;
            bool zero = false;
            if (pos < format.size() && format[pos] == '0') {
                zero = true;
                ++pos;
            }
            size_t digitsStart = pos;
            while (pos < format.size() && std::isdigit(static_cast<unsigned char>(format[pos]))) {
                ++pos;
            }
            std::string digits = format.substr(digitsStart, pos - digitsStart);
            if (pos < format.size() && format[pos] == 'd') {
                ++pos;
            }
            if (pos != format.size() || (zero && digits.empty())) {
                throw TemplateFieldError(name, "invalid integer format '" + format + "' for field '" + name + "'");
            }
            if (!digits.empty()) {
                seg.width = StringUtils::parseInt(digits);
                seg.zeroPad = zero;
            }
            break;
        }

        case Field::DateRecorded:
        case Field::OriginalAirDate:
            if (hasFormat && StringUtils::trim(format).empty()) {
                throw TemplateFieldError(name, "empty date format for field '" + name + "'");
            }
            seg.text = hasFormat ? format : "%Y-%m-%d";
            break;

        default:
            if (hasFormat) {
                throw TemplateFieldError(name, "field '" + name + "' does not take a format");
            }
            break;
    }

    return seg;
}

// -- Rendering --

namespace {

std::string renderInt(int value, int width, bool zeroPad) {
    std::ostringstream oss;
    if (width > 0) {
        oss << std::setw(width) << std::setfill(zeroPad ? '0' : ' ');
    }
    oss << value;
    return oss.str();
}

std::string renderDate(const std::optional<TimePoint>& value, const std::string& format) {
    std::tm tm{};
    if (value) {
        auto tt = std::chrono::system_clock::to_time_t(*value);
        gmtime_r(&tt, &tm);
    } else {
        tm.tm_year = 0;   // 1900
        tm.tm_mon = 0;
        tm.tm_mday = 1;
    }
    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str());
    return oss.str();
}

} // namespace

std::string NamingResolver::render(const std::vector<Segment>& segments, const Recording& recording) {
    std::string out;

    for (const auto& seg : segments) {
        if (seg.literal) {
            out += seg.text;
            continue;
        }

        std::string value;
        switch (seg.field) {
            case Field::Title:           value = recording.title; break;
            case Field::EpisodeTitle:    value = recording.episodeTitle; break;
            case Field::Callsign:        value = recording.callsign; break;
            case Field::Channel:         value = recording.channel; break;
            case Field::StreamKind:      value = toString(recording.streamKind); break;
            case Field::Season:          value = renderInt(recording.season.value_or(0), seg.width, seg.zeroPad); break;
            case Field::Episode:         value = renderInt(recording.episode.value_or(0), seg.width, seg.zeroPad); break;
            case Field::MovieYear:       value = renderInt(recording.movieYear.value_or(0), seg.width, seg.zeroPad); break;
            case Field::DateRecorded:    value = renderDate(recording.dateRecorded, seg.text); break;
            case Field::OriginalAirDate: value = renderDate(recording.originalAirDate, seg.text); break;
        }

        out += StringUtils::sanitizeFileName(value);
    }

    return out;
}

} // namespace homestream::core

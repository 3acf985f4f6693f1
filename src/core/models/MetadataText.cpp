// HomeStream - Metadata sidecar files

#include "MetadataText.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <cctype>
#include <sstream>

namespace homestream {

using utils::FileUtils;
using utils::StringUtils;

namespace {

void line(std::ostringstream& out, const char* key, const std::string& value) {
    if (!value.empty()) {
        out << key << ": " << value << "\n";
    }
}

const std::string* single(const MetadataFields& fields, const std::string& key) {
    auto it = fields.find(key);
    if (it == fields.end() || it->second.empty()) return nullptr;
    return &it->second.back();
}

} // namespace

std::string MetadataText::sidecarPath(const std::string& mediaPath) {
    return mediaPath + ".txt";
}

std::string MetadataText::formatDuration(int64_t seconds) {
    if (seconds < 0) seconds = 0;
    return "PT" + std::to_string(seconds / 3600) + "H" + std::to_string((seconds / 60) % 60) + "M" +
           std::to_string(seconds % 60) + "S";
}

std::optional<int64_t> MetadataText::parseDuration(const std::string& value) {
    std::string s = StringUtils::toUpper(StringUtils::trim(value));
    if (!StringUtils::startsWith(s, "PT") || s.size() < 4) {
        return std::nullopt;
    }

    int64_t total = 0;
    std::string digits;
    for (size_t i = 2; i < s.size(); ++i) {
        char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
            continue;
        }
        if (digits.empty()) return std::nullopt;
        auto n = StringUtils::parseLong(digits);
        if (!n) return std::nullopt;
        switch (c) {
            case 'H': total += *n * 3600; break;
            case 'M': total += *n * 60; break;
            case 'S': total += *n; break;
            default: return std::nullopt;
        }
        digits.clear();
    }
    if (!digits.empty()) return std::nullopt;
    return total;
}

std::string MetadataText::render(const Recording& r) {
    std::ostringstream out;

    line(out, "title", r.title);
    if (!r.isMovie()) {
        line(out, "seriesTitle", r.title);
    }
    line(out, "episodeTitle", r.episodeTitle);
    line(out, "description", r.description);
    if (r.episode) {
        int number = r.season ? *r.season * 100 + *r.episode : *r.episode;
        line(out, "episodeNumber", std::to_string(number));
    }
    if (r.movieYear) {
        line(out, "movieYear", std::to_string(*r.movieYear));
    }
    if (r.dateRecorded) {
        line(out, "time", StringUtils::formatIsoTimestamp(*r.dateRecorded));
    }
    if (r.originalAirDate) {
        line(out, "originalAirDate", StringUtils::formatIsoTimestamp(*r.originalAirDate));
    }
    if (r.durationSeconds) {
        line(out, "iso_duration", formatDuration(*r.durationSeconds));
    }
    line(out, "callsign", r.callsign);

    if (!r.channel.empty()) {
        auto sep = r.channel.find_first_of("-.");
        line(out, "displayMajorNumber", r.channel.substr(0, sep));
        if (sep != std::string::npos) {
            line(out, "displayMinorNumber", r.channel.substr(sep + 1));
        }
    }

    line(out, "isEpisode", r.isMovie() ? "false" : "true");
    line(out, "seriesId", r.seriesId);
    line(out, "programId", r.programId);
    return out.str();
}

bool MetadataText::write(const Recording& recording, const std::string& path) {
    return FileUtils::writeFile(path, render(recording));
}

MetadataFields MetadataText::parse(const std::string& text) {
    MetadataFields fields;

    std::string body = text;
    if (StringUtils::startsWith(body, "\xEF\xBB\xBF")) {
        body.erase(0, 3);
    }

    std::istringstream in(body);
    std::string raw;
    while (std::getline(in, raw)) {
        std::string entry = StringUtils::trim(raw);
        if (entry.empty() || entry[0] == '#') continue;

        auto colon = entry.find(':');
        if (colon == std::string::npos) continue;

        std::string key = StringUtils::trim(entry.substr(0, colon));
        std::string value = StringUtils::trim(entry.substr(colon + 1));
        if (key.empty() || value.empty()) continue;

        if (key[0] == 'v') {
            fields[key].push_back(value);
        } else {
            fields[key] = {value};
        }
    }
    return fields;
}

std::optional<MetadataFields> MetadataText::read(const std::string& path) {
    auto text = FileUtils::readFile(path);
    if (!text) {
        return std::nullopt;
    }
    return parse(*text);
}

void MetadataText::apply(const MetadataFields& fields, Recording& r) {
    if (auto v = single(fields, "title")) r.title = *v;
    if (auto v = single(fields, "episodeTitle")) r.episodeTitle = *v;
    if (auto v = single(fields, "description")) r.description = *v;
    if (auto v = single(fields, "callsign")) r.callsign = *v;
    if (auto v = single(fields, "seriesId")) r.seriesId = *v;
    if (auto v = single(fields, "programId")) r.programId = *v;

    if (auto v = single(fields, "episodeNumber")) {
        if (auto n = StringUtils::parseLong(*v); n && *n >= 0) {
            if (*n >= 100) {
                r.season = static_cast<int>(*n / 100);
                r.episode = static_cast<int>(*n % 100);
            } else {
                r.episode = static_cast<int>(*n);
            }
        }
    }
    if (auto v = single(fields, "movieYear")) {
        if (auto n = StringUtils::parseLong(*v); n && *n > 0) {
            r.movieYear = static_cast<int>(*n);
        }
    }
    if (auto v = single(fields, "time")) {
        if (auto t = StringUtils::parseIsoTimestamp(*v)) r.dateRecorded = t;
    }
    if (auto v = single(fields, "originalAirDate")) {
        if (auto t = StringUtils::parseIsoTimestamp(*v)) r.originalAirDate = t;
    }
    if (auto v = single(fields, "iso_duration")) {
        if (auto d = parseDuration(*v)) r.durationSeconds = d;
    }

    if (auto major = single(fields, "displayMajorNumber")) {
        r.channel = *major;
        auto minor = single(fields, "displayMinorNumber");
        if (minor && *minor != "0") {
            r.channel += "-" + *minor;
        }
    }
}

} // namespace homestream

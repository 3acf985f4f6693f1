// HomeStream - Recording model

#include "Recording.hpp"
#include "../../utils/StringUtils.hpp"

namespace homestream {

using utils::StringUtils;

const char* toString(StreamKind kind) {
    return kind == StreamKind::PS ? "PS" : "TS";
}

std::optional<StreamKind> parseStreamKind(const std::string& value) {
    std::string upper = StringUtils::toUpper(StringUtils::trim(value));
    if (upper == "TS") return StreamKind::TS;
    if (upper == "PS") return StreamKind::PS;
    return std::nullopt;
}

namespace {

template<typename T>
void putOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template<typename T>
std::optional<T> readOptional(const json& j, const char* key) {
    if (j.contains(key) && !j.at(key).is_null()) {
        return j.at(key).get<T>();
    }
    return std::nullopt;
}

void putDate(json& j, const char* key, const std::optional<TimePoint>& value) {
    if (value) {
        j[key] = StringUtils::formatIsoTimestamp(*value);
    }
}

std::optional<TimePoint> readDate(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string()) {
        return std::nullopt;
    }
    return StringUtils::parseIsoTimestamp(j.at(key).get<std::string>());
}

} // namespace

json SourceLocator::toJson() const {
    json j;
    j["type"] = type == Type::Receiver ? "receiver" : "local";
    if (type == Type::LocalPath) {
        j["path"] = path;
    } else {
        j["receiver"] = receiver;
        j["url"] = url;
    }
    j["encrypted"] = encrypted;
    return j;
}

SourceLocator SourceLocator::fromJson(const json& j) {
    SourceLocator locator;
    locator.type = j.value("type", "local") == "receiver" ? Type::Receiver : Type::LocalPath;
    locator.path = j.value("path", "");
    locator.receiver = j.value("receiver", "");
    locator.url = j.value("url", "");
    locator.encrypted = j.value("encrypted", false);
    return locator;
}

std::string Recording::unit() const {
    if (source.type == SourceLocator::Type::Receiver && !source.receiver.empty()) {
        return source.receiver;
    }
    return "local";
}

json Recording::toJson() const {
    json j;
    j["id"] = id;
    j["title"] = title;
    j["episodeTitle"] = episodeTitle;
    if (!description.empty()) j["description"] = description;
    if (!seriesId.empty()) j["seriesId"] = seriesId;
    if (!programId.empty()) j["programId"] = programId;
    putOptional(j, "season", season);
    putOptional(j, "episode", episode);
    putDate(j, "dateRecorded", dateRecorded);
    putDate(j, "originalAirDate", originalAirDate);
    j["callsign"] = callsign;
    j["channel"] = channel;
    putOptional(j, "movieYear", movieYear);
    putOptional(j, "durationSeconds", durationSeconds);
    j["streamKind"] = toString(streamKind);
    putOptional(j, "sizeBytes", sizeBytes);
    j["source"] = source.toJson();
    return j;
}

Recording Recording::fromJson(const json& j) {
    Recording rec;
    rec.id = j.value("id", "");
    rec.title = j.value("title", "");
    rec.episodeTitle = j.value("episodeTitle", "");
    rec.description = j.value("description", "");
    rec.seriesId = j.value("seriesId", "");
    rec.programId = j.value("programId", "");
    rec.season = readOptional<int>(j, "season");
    rec.episode = readOptional<int>(j, "episode");
    rec.dateRecorded = readDate(j, "dateRecorded");
    rec.originalAirDate = readDate(j, "originalAirDate");
    rec.callsign = j.value("callsign", "");
    rec.channel = j.value("channel", "");
    rec.movieYear = readOptional<int>(j, "movieYear");
    rec.durationSeconds = readOptional<int64_t>(j, "durationSeconds");
    rec.streamKind = parseStreamKind(j.value("streamKind", "TS")).value_or(StreamKind::TS);
    rec.sizeBytes = readOptional<uint64_t>(j, "sizeBytes");
    if (j.contains("source")) {
        rec.source = SourceLocator::fromJson(j.at("source"));
    }
    return rec;
}

} // namespace homestream

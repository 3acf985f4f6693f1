// HomeStream - Now playing list documents

#include "NowPlayingList.hpp"
#include "../models/MetadataText.hpp"
#include "../../utils/StringUtils.hpp"

#include <chrono>
#include <sstream>

namespace homestream::core::server {

using utils::StringUtils;

namespace {

void element(std::ostringstream& out, const char* name, const std::string& value) {
    if (value.empty()) {
        out << "<" << name << "/>";
    } else {
        out << "<" << name << ">" << StringUtils::escapeXml(value) << "</" << name << ">";
    }
}

std::string captureDate(const Recording& recording) {
    if (!recording.dateRecorded) {
        return "";
    }
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        recording.dateRecorded->time_since_epoch()).count();
    return StringUtils::toHex(static_cast<uint64_t>(seconds < 0 ? 0 : seconds));
}

void renderFolder(std::ostringstream& out, const ContainerEntry& entry) {
    out << "<Item><Details>";
    element(out, "Title", entry.recording.title);
    element(out, "ContentType", kVideoContainerType);
    element(out, "SourceFormat", kFolderFormat);
    element(out, "TotalItems", std::to_string(entry.totalItems));
    out << "</Details><Links><Content>";
    element(out, "Url", entry.url);
    element(out, "ContentType", kVideoContainerType);
    out << "</Content></Links></Item>\n";
}

void renderItem(std::ostringstream& out, const ContainerEntry& entry) {
    const Recording& r = entry.recording;

    out << "<Item><Details>";
    element(out, "Title", r.title);
    element(out, "ContentType", entry.mime);
    element(out, "SourceFormat", entry.mime);
    if (r.sizeBytes) {
        element(out, "SourceSize", std::to_string(*r.sizeBytes));
    }
    element(out, "CaptureDate", captureDate(r));
    if (!r.episodeTitle.empty()) {
        element(out, "EpisodeTitle", r.episodeTitle);
    }
    if (!r.description.empty()) {
        element(out, "Description", r.description);
    }
    if (r.durationSeconds) {
        element(out, "Duration", std::to_string(*r.durationSeconds * 1000));
    }
    if (r.episode) {
        element(out, "EpisodeNumber", std::to_string(*r.episode));
    }
    if (!r.callsign.empty()) {
        element(out, "SourceStation", r.callsign);
    }
    if (!r.channel.empty()) {
        element(out, "SourceChannel", r.channel);
    }
    out << "</Details><Links><Content>";
    element(out, "Url", entry.url);
    element(out, "ContentType", entry.mime);
    out << "</Content>";
    if (!entry.detailsUrl.empty()) {
        out << "<TiVoVideoDetails>";
        element(out, "Url", entry.detailsUrl);
        element(out, "ContentType", "text/xml");
        element(out, "AcceptsParams", "No");
        out << "</TiVoVideoDetails>";
    }
    out << "</Links></Item>\n";
}

const char* kTvBusNamespaces =
    " xmlns:xs=\"http://www.w3.org/2001/XMLSchema-instance\""
    " xmlns:TvBusMarshalledStruct=\"http://tivo.com/developer/xml/idl/TvBusMarshalledStruct\""
    " xmlns:TvPgdRecording=\"http://tivo.com/developer/xml/idl/TvPgdRecording\""
    " xmlns:TvBusDuration=\"http://tivo.com/developer/xml/idl/TvBusDuration\""
    " xmlns:TvPgdShowing=\"http://tivo.com/developer/xml/idl/TvPgdShowing\""
    " xmlns:TvBusDateTime=\"http://tivo.com/developer/xml/idl/TvBusDateTime\""
    " xmlns:TvPgdProgram=\"http://tivo.com/developer/xml/idl/TvPgdProgram\""
    " xmlns:TvPgdSeries=\"http://tivo.com/developer/xml/idl/TvPgdSeries\""
    " xmlns:TvPgdChannel=\"http://tivo.com/developer/xml/idl/TvPgdChannel\"";

void optionalElement(std::ostringstream& out, const char* name, const std::string& value) {
    if (!value.empty()) {
        element(out, name, value);
    }
}

} // namespace

std::string NowPlayingList::render(const ContainerPage& page) {
    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";
    out << "<TiVoContainer xmlns=\"http://www.tivo.com/developer/calypso-protocol-1.6/\">\n";
    out << "<Details>";
    element(out, "Title", page.title);
    element(out, "ContentType", page.contentType);
    element(out, "SourceFormat", kFolderFormat);
    element(out, "TotalItems", std::to_string(page.totalItems));
    out << "</Details>\n";

    for (const auto& entry : page.entries) {
        if (entry.isFolder) {
            renderFolder(out, entry);
        } else {
            renderItem(out, entry);
        }
    }

    element(out, "ItemStart", std::to_string(page.itemStart));
    element(out, "ItemCount", std::to_string(page.entries.size()));
    out << "\n</TiVoContainer>\n";
    return out.str();
}

std::string NowPlayingList::serverInfo(const std::string& name, const std::string& version) {
    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<TiVoServer>\n";
    element(out, "Version", version);
    out << "\n";
    element(out, "InternalName", name);
    out << "\n";
    element(out, "InternalVersion", version);
    out << "\n";
    element(out, "Organization", name);
    out << "\n</TiVoServer>";
    return out.str();
}

std::string NowPlayingList::formats(bool transportStream) {
    std::string xml = "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<TiVoFormats>\n"
                      "<Format><ContentType>video/x-tivo-mpeg</ContentType><Description/></Format>\n";
    if (transportStream) {
        xml += "<Format><ContentType>video/x-tivo-mpeg-ts</ContentType><Description/></Format>\n";
    }
    xml += "</TiVoFormats>";
    return xml;
}

std::string NowPlayingList::tvBusDetails(const Recording& r, bool valid) {
    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";
    out << "<TvBusMarshalledStruct:TvBusEnvelope" << kTvBusNamespaces
        << " xs:type=\"TvPgdRecording:TvPgdRecording\">\n";

    if (valid) {
        const std::string duration = MetadataText::formatDuration(r.durationSeconds.value_or(0));
        const std::string time = r.dateRecorded ? StringUtils::formatIsoTimestamp(*r.dateRecorded) : "";

        element(out, "recordedDuration", duration);
        out << "\n<showing><showingBits value=\"0\"/>";
        optionalElement(out, "time", time);
        element(out, "duration", duration);

        out << "<program>";
        optionalElement(out, "description", r.description);
        optionalElement(out, "episodeTitle", r.episodeTitle);
        if (r.episode) {
            int number = r.season ? *r.season * 100 + *r.episode : *r.episode;
            element(out, "episodeNumber", std::to_string(number));
        }
        element(out, "isEpisode", r.isMovie() ? "false" : "true");
        if (r.movieYear) {
            element(out, "movieYear", std::to_string(*r.movieYear));
        }
        if (r.originalAirDate) {
            element(out, "originalAirDate", StringUtils::formatIsoTimestamp(*r.originalAirDate));
        }
        out << "<series>";
        element(out, "isEpisodic", r.isMovie() ? "false" : "true");
        element(out, "seriesTitle", r.title);
        optionalElement(out, "uniqueId", r.seriesId);
        out << "</series>";
        element(out, "title", r.title);
        optionalElement(out, "uniqueId", r.programId);
        out << "</program>";

        std::string major = "0";
        std::string minor = "0";
        if (!r.channel.empty()) {
            auto sep = r.channel.find_first_of("-.");
            major = r.channel.substr(0, sep);
            if (sep != std::string::npos) minor = r.channel.substr(sep + 1);
        }
        out << "<channel>";
        element(out, "displayMajorNumber", major);
        element(out, "displayMinorNumber", minor);
        element(out, "callsign", r.callsign);
        out << "</channel></showing>\n";

        if (r.dateRecorded) {
            auto stop = *r.dateRecorded + std::chrono::seconds(r.durationSeconds.value_or(0));
            element(out, "startTime", time);
            element(out, "stopTime", StringUtils::formatIsoTimestamp(stop));
        }
        out << "\n";
    }

    out << "</TvBusMarshalledStruct:TvBusEnvelope>\n";
    return out.str();
}

} // namespace homestream::core::server

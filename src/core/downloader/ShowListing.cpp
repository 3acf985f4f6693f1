/**
 * ShowListing.cpp
 */

#include "ShowListing.hpp"
#include "../Logger.hpp"
#include "../../utils/HttpClient.hpp"
#include "../../utils/StringUtils.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <initializer_list>
#include <memory>
#include <set>
#include <libxml/parser.h>
#include <libxml/tree.h>

namespace homestream::core::downloader {

using utils::HttpClient;
using utils::HttpOptions;
using utils::StringUtils;

namespace {

const char* kNowPlayingPath = "/TiVoConnect?Command=QueryContainer&Container=/NowPlaying";

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

bool isElement(const xmlNode* node, const char* name) {
    return node->type == XML_ELEMENT_NODE &&
           std::strcmp(reinterpret_cast<const char*>(node->name), name) == 0;
}

const xmlNode* child(const xmlNode* parent, const char* name) {
    if (!parent) return nullptr;
    for (const xmlNode* node = parent->children; node; node = node->next) {
        if (isElement(node, name)) return node;
    }
    return nullptr;
}

// Text of parent/a/b/..., empty when any step is missing
std::string text(xmlDoc* doc, const xmlNode* parent, std::initializer_list<const char*> path) {
    const xmlNode* node = parent;
    for (const char* name : path) {
        node = child(node, name);
        if (!node) return "";
    }

    xmlChar* value = xmlNodeListGetString(doc, node->children, 1);
    if (!value) return "";
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return StringUtils::trim(result);
}

std::optional<uint64_t> parseHex(const std::string& value) {
    std::string digits = StringUtils::toLower(value);
    if (StringUtils::startsWith(digits, "0x")) digits = digits.substr(2);
    if (digits.empty()) return std::nullopt;

    char* end = nullptr;
    unsigned long long n = std::strtoull(digits.c_str(), &end, 16);
    if (!end || *end != '\0') return std::nullopt;
    return static_cast<uint64_t>(n);
}

// "...&id=4711" -> "4711"
std::string contentId(const std::string& url) {
    auto pos = url.find("id=");
    while (pos != std::string::npos && pos > 0 && url[pos - 1] != '?' && url[pos - 1] != '&') {
        pos = url.find("id=", pos + 3);
    }
    if (pos == std::string::npos) return "";
    auto end = url.find('&', pos);
    return url.substr(pos + 3, end == std::string::npos ? std::string::npos : end - pos - 3);
}

std::string iconFor(const std::string& customIcon, bool copyProtected) {
    if (copyProtected) return "protected";

    static const std::pair<const char*, const char*> kIcons[] = {
        {"urn:tivo:image:expires-soon-recording", "expiring"},
        {"urn:tivo:image:expired-recording", "expired"},
        {"urn:tivo:image:save-until-i-delete-recording", "kuid"},
        {"urn:tivo:image:suggestion-recording", "suggestion"},
        {"urn:tivo:image:in-progress-recording", "inprogress"},
    };
    for (const auto& [urn, icon] : kIcons) {
        if (customIcon == urn) return icon;
    }
    return "normal";
}

ShowEntry parseItem(xmlDoc* doc, const xmlNode* item, const std::string& unit, const std::string& baseUrl) {
    ShowEntry show;
    Recording& r = show.recording;

    r.title = text(doc, item, {"Details", "Title"});
    r.episodeTitle = text(doc, item, {"Details", "EpisodeTitle"});
    r.description = text(doc, item, {"Details", "Description"});
    r.seriesId = text(doc, item, {"Details", "SeriesId"});
    r.programId = text(doc, item, {"Details", "ProgramId"});
    r.callsign = text(doc, item, {"Details", "SourceStation"});
    r.channel = text(doc, item, {"Details", "SourceChannel"});

    if (auto captured = parseHex(text(doc, item, {"Details", "CaptureDate"}))) {
        r.dateRecorded = std::chrono::system_clock::time_point(std::chrono::seconds(*captured));
    }
    if (auto ms = StringUtils::parseLong(text(doc, item, {"Details", "Duration"})); ms && *ms > 0) {
        r.durationSeconds = *ms / 1000;
    }
    if (auto size = StringUtils::parseLong(text(doc, item, {"Details", "SourceSize"})); size && *size >= 0) {
        r.sizeBytes = static_cast<uint64_t>(*size);
    }
    if (auto number = StringUtils::parseLong(text(doc, item, {"Details", "EpisodeNumber"})); number && *number > 0) {
        if (*number >= 100) {
            r.season = static_cast<int>(*number / 100);
            r.episode = static_cast<int>(*number % 100);
        } else {
            r.episode = static_cast<int>(*number);
        }
    }

    const std::string url = text(doc, item, {"Links", "Content", "Url"});
    const std::string contentType = text(doc, item, {"Links", "Content", "ContentType"});

    r.source.type = SourceLocator::Type::Receiver;
    r.source.receiver = unit;
    r.source.url = ShowListing::resolveUrl(baseUrl, url);
    r.source.encrypted = true;
    r.streamKind = contentType.find("tts") != std::string::npos ? StreamKind::TS : StreamKind::PS;
    r.id = contentId(url);

    show.detailsUrl = ShowListing::resolveUrl(baseUrl, text(doc, item, {"Links", "TiVoVideoDetails", "Url"}));
    show.inProgress = text(doc, item, {"Details", "InProgress"}) == "Yes";
    show.copyProtected = text(doc, item, {"Details", "CopyProtected"}) == "Yes";
    show.icon = iconFor(text(doc, item, {"Links", "CustomIcon", "Url"}), show.copyProtected);
    return show;
}

} // namespace

// -- ShowEntry --

nlohmann::json ShowEntry::toJson() const {
    return {
        {"recording", recording.toJson()},
        {"detailsUrl", detailsUrl},
        {"inProgress", inProgress},
        {"copyProtected", copyProtected},
        {"icon", icon}
    };
}

// -- ShowListing --

std::string ShowListing::baseUrl(const ReceiverSettings& receiver) {
    return receiver.protocol + "://" + receiver.address + ":" + std::to_string(receiver.port) + kNowPlayingPath;
}

std::string ShowListing::resolveUrl(const std::string& baseUrl, const std::string& url) {
    if (url.empty() || url.find("://") != std::string::npos) {
        return url;
    }

    auto schemeEnd = baseUrl.find("://");
    auto hostEnd = schemeEnd == std::string::npos ? std::string::npos : baseUrl.find('/', schemeEnd + 3);
    std::string origin = hostEnd == std::string::npos ? baseUrl : baseUrl.substr(0, hostEnd);

    if (StringUtils::startsWith(url, "/")) {
        return origin + url;
    }
    return origin + "/" + url;
}

ShowPage ShowListing::parse(const std::string& xml, const std::string& unit, const std::string& baseUrl) {
    XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "NowPlaying.xml", nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        throw ConnectError("unreadable Now Playing list from " + unit);
    }

    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!root || !isElement(root, "TiVoContainer")) {
        throw ConnectError("unexpected Now Playing document from " + unit);
    }

    ShowPage page;
    page.totalItems = StringUtils::parseInt(text(doc.get(), root, {"Details", "TotalItems"}), 0);
    page.lastChangeDate = text(doc.get(), root, {"Details", "LastChangeDate"});
    page.itemCount = StringUtils::parseInt(text(doc.get(), root, {"ItemCount"}), 0);

    for (const xmlNode* node = root->children; node; node = node->next) {
        if (!isElement(node, "Item")) continue;
        ++page.itemsSeen;

        std::string contentType = text(doc.get(), node, {"Details", "ContentType"});
        if (StringUtils::startsWith(contentType, "x-container/")) continue;

        page.shows.push_back(parseItem(doc.get(), node, unit, baseUrl));
    }
    return page;
}

// -- ShowListClient --

ShowListClient::ShowListClient(std::map<std::string, ReceiverSettings> receivers, PageFetcher fetcher)
    : m_receivers(std::move(receivers))
    , m_fetcher(fetcher ? std::move(fetcher) : PageFetcher(&ShowListClient::fetchWithDigest)) {
}

std::string ShowListClient::fetchWithDigest(const std::string& url, const std::string& mak) {
    HttpOptions options;
    options.digestUser = "tivo";
    options.digestPassword = mak;
    options.cookies["sid"] = "ADEADDA7EDEBAC1E";
    options.verifySSL = false;   // receivers use self-signed certificates

    std::string body;
    HttpClient client;
    auto result = client.streamGet(url, options, [&body](const char* data, size_t len) {
        body.append(data, len);
        return true;
    });

    if (!result.error.empty()) {
        throw ConnectError(result.error);
    }
    if (!result.isSuccess()) {
        throw ConnectError("HTTP " + std::to_string(result.statusCode) + " from " + url);
    }
    return body;
}

void ShowListClient::invalidate(const std::string& unit) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.erase(unit);
}

std::vector<ShowEntry> ShowListClient::shows(const std::string& unit) {
    auto it = m_receivers.find(unit);
    if (it == m_receivers.end() || it->second.address.empty()) {
        throw ConfigError("no address configured for receiver " + unit);
    }
    const ReceiverSettings& receiver = it->second;
    const std::string base = ShowListing::baseUrl(receiver);

    // Total count and change date only
    ShowPage head = ShowListing::parse(m_fetcher(base + "&Recurse=Yes&ItemCount=0", receiver.mak), unit, base);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto cached = m_cache.find(unit);
        if (cached != m_cache.end() && !head.lastChangeDate.empty() &&
            cached->second.lastChangeDate == head.lastChangeDate) {
            LOG_DEBUG("Now Playing list of {} unchanged, {} show(s) from cache", unit, cached->second.shows.size());
            return cached->second.shows;
        }
    }

    std::vector<ShowEntry> shows;
    std::set<std::string> ids;
    int generated = 0;
    int got = 0;

    while (got < head.totalItems) {
        LOG_DEBUG("Retrieving shows {}-{} of {} from {}", got, got + kPageSize, head.totalItems, receiver.name);
        std::string url = base + "&Recurse=Yes&ItemCount=" + std::to_string(kPageSize) +
                          "&AnchorOffset=" + std::to_string(got);

        ShowPage page = ShowListing::parse(m_fetcher(url, receiver.mak), unit, base);
        if (page.itemsSeen == 0) {
            break;
        }

        for (auto& show : page.shows) {
            std::string& id = show.recording.id;
            if (id.empty()) id = show.recording.programId;
            while (id.empty() || ids.count(id)) {
                char buffer[16];
                std::snprintf(buffer, sizeof(buffer), "EP%08d", generated++);
                id = buffer;
            }
            ids.insert(id);
            shows.push_back(std::move(show));
        }

        got += page.itemCount > 0 ? page.itemCount : page.itemsSeen;
    }

    LOG_INFO("Read {} show(s) from {}", shows.size(), receiver.name);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache[unit] = CachedList{head.lastChangeDate, shows};
    return shows;
}

} // namespace homestream::core::downloader

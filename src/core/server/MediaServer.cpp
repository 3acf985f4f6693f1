/**
 * MediaServer.cpp
 *
 * Implementation of the serve-side request handler.
 */

#include "MediaServer.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"
#include "../models/MetadataText.hpp"
#include "../stream/TivoHeader.hpp"
#include "../transfer/StreamSource.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/HashUtils.hpp"
#include "../../utils/HttpClient.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <filesystem>

namespace homestream::core::server {

namespace fs = std::filesystem;
using utils::FileUtils;
using utils::HashUtils;
using utils::HttpClient;
using utils::StringUtils;

namespace {

const std::vector<std::string> kVideoExtensions{
    ".tivo", ".mpg", ".mpeg", ".m2v", ".m2p", ".vob", ".ts", ".tp", ".trp", ".m2t", ".m2ts", ".mts",
    ".mp4", ".m4v", ".mkv", ".avi", ".wmv", ".asf", ".mov", ".qt", ".flv", ".f4v", ".webm",
    ".3gp", ".3g2", ".divx", ".dv", ".dvr-ms", ".wtv", ".ogm", ".nuv", ".rm", ".rmvb"
};

const std::vector<std::string> kTransportExtensions{
    ".ts", ".tp", ".trp", ".m2t", ".m2ts", ".mts"
};

std::string lowerExtension(const std::string& path) {
    return StringUtils::toLower(fs::path(path).extension().string());
}

// "/Share/sub/file.mpg" with every segment escaped
std::string contentUrl(const std::vector<std::string>& segments) {
    std::string url;
    for (const auto& segment : segments) {
        url += "/" + HttpClient::urlEncode(segment);
    }
    return url;
}

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> segments;
    for (auto& part : StringUtils::split(path, '/')) {
        if (!part.empty()) segments.push_back(part);
    }
    return segments;
}

} // namespace

// -- MediaServerConfig --

MediaServerConfig MediaServerConfig::fromJson(const nlohmann::json& server,
                                              const nlohmann::json& shares,
                                              const nlohmann::json& transcode) {
    MediaServerConfig config;

    try {
        if (server.is_object()) {
            config.name = server.value("name", config.name);
        }

        if (shares.is_object()) {
            for (const auto& [name, value] : shares.items()) {
                Share share;
                share.name = name;
                share.path = value.is_string() ? value.get<std::string>() : value.value("path", "");
                if (share.path.empty()) {
                    throw ConfigError("shares." + name + " has no path");
                }
                config.shares.push_back(share);
            }
        }

        if (transcode.is_object()) {
            config.cacheCapacity = transcode.value("cacheCapacity", config.cacheCapacity);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid server settings: ") + e.what());
    }

    config.transcode = TranscodeSettings::fromJson(transcode);
    return config;
}

// -- TransferEntry --

nlohmann::json MediaServer::TransferEntry::toJson() const {
    return {
        {"active", active},
        {"transcoding", transcoding},
        {"offset", offset},
        {"start", StringUtils::formatIsoTimestamp(start)},
        {"end", StringUtils::formatIsoTimestamp(end)},
        {"rate", rate},
        {"size", size},
        {"output", output},
        {"error", error}
    };
}

// -- MediaServer --

MediaServer::MediaServer(MediaServerConfig config, std::shared_ptr<MediaInspector> inspector)
    : m_config(std::move(config))
    , m_inspector(std::move(inspector))
    , m_planner(m_config.transcode)
    , m_decisions(m_config.cacheCapacity)
    , m_details(m_config.cacheCapacity) {
    LOG_INFO("MediaServer initialized with {} share(s), decision cache of {}",
             m_config.shares.size(), m_decisions.capacity());
}

const Share* MediaServer::findShare(const std::string& name) const {
    for (const auto& share : m_config.shares) {
        if (share.name == name) return &share;
    }
    return nullptr;
}

std::optional<std::string> MediaServer::resolvePath(const std::string& container, const std::string& relative) const {
    const Share* share = findShare(container);
    if (!share) {
        return std::nullopt;
    }

    fs::path path(share->path);
    for (const auto& segment : splitPath(relative)) {
        if (segment == "..") {
            return std::nullopt;
        }
        path /= segment;
    }
    return path.string();
}

bool MediaServer::isVideoFile(const std::string& path) {
    std::string ext = lowerExtension(path);
    return std::find(kVideoExtensions.begin(), kVideoExtensions.end(), ext) != kVideoExtensions.end();
}

int MediaServer::countItems(const std::string& dir) const {
    int count = 0;
    for (const auto& entry : FileUtils::listDirectory(dir)) {
        std::string name = entry.filename().string();
        if (StringUtils::startsWith(name, ".")) continue;
        if (FileUtils::directoryExists(entry) || isVideoFile(name)) ++count;
    }
    return count;
}

std::string MediaServer::fingerprint(const std::string& path) const {
    std::string key = path + "|" + std::to_string(FileUtils::getFileSize(path));
    if (auto modified = FileUtils::getLastModified(path)) {
        key += "|" + std::to_string(modified->time_since_epoch().count());
    }
    return HashUtils::sha1String(key);
}

Recording MediaServer::recordingFor(const std::string& path) const {
    Recording recording;
    recording.id = HashUtils::sha1String(path).substr(0, 16);
    recording.title = fs::path(path).stem().string();
    recording.dateRecorded = FileUtils::getLastModified(path);

    int64_t size = FileUtils::getFileSize(path);
    if (size >= 0) {
        recording.sizeBytes = static_cast<uint64_t>(size);
    }

    std::string ext = lowerExtension(path);
    recording.source.type = SourceLocator::Type::LocalPath;
    recording.source.path = path;
    recording.source.encrypted = ext == ".tivo";

    if (ext == ".tivo") {
        auto header = stream::TivoHeader::readFile(path);
        recording.streamKind = header && header->transportStream ? StreamKind::TS : StreamKind::PS;
    } else {
        bool ts = std::find(kTransportExtensions.begin(), kTransportExtensions.end(), ext) != kTransportExtensions.end();
        recording.streamKind = ts ? StreamKind::TS : StreamKind::PS;
    }

    if (auto fields = MetadataText::read(MetadataText::sidecarPath(path))) {
        MetadataText::apply(*fields, recording);
    }
    return recording;
}

std::string MediaServer::defaultMime(const std::string& path, CapabilityProfile profile) const {
    if (lowerExtension(path) == ".tivo") {
        auto header = stream::TivoHeader::readFile(path);
        bool ts = header && header->transportStream && limitsFor(profile).transportStream;
        return ts ? kMimeTivoTs : kMimeTivoPs;
    }
    return m_planner.useTransportStream(profile, path) ? kMimeTivoTs : kMimeTivoPs;
}

std::optional<std::string> MediaServer::queryContainer(const std::string& container, const std::string& tsn,
                                                       int start, int count) const {
    ContainerPage page;
    std::vector<ContainerEntry> all;

    auto segments = splitPath(container);

    if (segments.empty()) {
        page.title = m_config.name;
        page.contentType = "x-container/tivo-server";
        for (const auto& share : m_config.shares) {
            ContainerEntry entry;
            entry.isFolder = true;
            entry.recording.title = share.name;
            entry.totalItems = countItems(share.path);
            entry.url = "/TiVoConnect?Command=QueryContainer&Container=" + HttpClient::urlEncode(share.name);
            all.push_back(std::move(entry));
        }
    } else {
        std::vector<std::string> rest(segments.begin() + 1, segments.end());
        auto dir = resolvePath(segments.front(), StringUtils::join(rest, "/"));
        if (!dir || !FileUtils::directoryExists(*dir)) {
            return std::nullopt;
        }

        page.title = segments.back();
        const CapabilityProfile profile = profileForTsn(tsn);

        std::vector<ContainerEntry> folders;
        std::vector<ContainerEntry> items;

        for (const auto& path : FileUtils::listDirectory(*dir)) {
            std::string name = path.filename().string();
            if (StringUtils::startsWith(name, ".")) continue;

            std::vector<std::string> itemSegments = segments;
            itemSegments.push_back(name);

            ContainerEntry entry;
            if (FileUtils::directoryExists(path)) {
                entry.isFolder = true;
                entry.recording.title = name;
                entry.totalItems = countItems(path.string());
                entry.url = "/TiVoConnect?Command=QueryContainer&Container=" +
                            HttpClient::urlEncode(StringUtils::join(itemSegments, "/"));
                folders.push_back(std::move(entry));
            } else if (isVideoFile(name)) {
                entry.recording = recordingFor(path.string());
                entry.mime = defaultMime(path.string(), profile);
                entry.url = contentUrl(itemSegments);
                entry.detailsUrl = "/TiVoConnect?Command=TVBusQuery&Container=" +
                                   HttpClient::urlEncode(segments.front()) + "&File=" +
                                   HttpClient::urlEncode(StringUtils::join(
                                       std::vector<std::string>(itemSegments.begin() + 1, itemSegments.end()), "/"));
                items.push_back(std::move(entry));
            }
        }

        all = std::move(folders);
        all.insert(all.end(), std::make_move_iterator(items.begin()), std::make_move_iterator(items.end()));
    }

    page.totalItems = static_cast<int>(all.size());
    page.itemStart = std::clamp(start, 0, page.totalItems);

    int end = count < 0 ? page.totalItems : std::min(page.totalItems, page.itemStart + count);
    for (int i = page.itemStart; i < end; ++i) {
        page.entries.push_back(std::move(all[static_cast<size_t>(i)]));
    }

    return NowPlayingList::render(page);
}

std::string MediaServer::queryServer() const {
    return NowPlayingList::serverInfo(m_config.name, m_config.version);
}

std::string MediaServer::queryFormats(const std::string& tsn) const {
    return NowPlayingList::formats(limitsFor(profileForTsn(tsn)).transportStream);
}

std::optional<std::string> MediaServer::tvBusQuery(const std::string& container, const std::string& file,
                                                   const std::string& tsn) {
    auto path = resolvePath(container, file);
    if (!path || !FileUtils::fileExists(*path) || FileUtils::directoryExists(*path)) {
        return std::nullopt;
    }

    const std::string key = tsn + "|" + fingerprint(*path);
    return m_details.getOrCompute(key, [&]() {
        Recording recording = recordingFor(*path);

        bool valid = lowerExtension(*path) == ".tivo";
        if (!valid && isVideoFile(*path) && m_inspector) {
            if (auto info = m_inspector->inspect(*path)) {
                valid = true;
                if (!recording.durationSeconds && info->durationMs > 0) {
                    recording.durationSeconds = info->durationMs / 1000;
                }
            }
        }
        LOG_DEBUG("Details for {} ({})", *path, valid ? "valid" : "unsupported");
        return NowPlayingList::tvBusDetails(recording, valid);
    });
}

std::optional<TranscodeDecision> MediaServer::decide(const std::string& path, CapabilityProfile profile,
                                                     const std::string& mime) {
    DecisionKey key{path, fingerprint(path), profile, mime};

    return m_decisions.getOrCompute(key, [&]() -> std::optional<TranscodeDecision> {
        auto info = m_inspector ? m_inspector->inspect(path) : std::nullopt;
        if (!info) {
            return std::nullopt;
        }

        auto decision = m_planner.plan(*info, profile, mime, FileUtils::getFileSize(path));
        LOG_DEBUG("{} for {} ({}): {} - {}", fs::path(path).filename().string(), toString(profile), mime,
                  decision.passThrough ? "pass-through" : "transcode", decision.reason);
        return decision;
    });
}

void MediaServer::invalidate(const std::string& path) {
    size_t removed = m_decisions.eraseIf([&path](const DecisionKey& key) {
        return key.path == path;
    });
    LOG_DEBUG("Invalidated {} cached decision(s) for {}", removed, path);
}

ServePlan MediaServer::prepare(const ServeRequest& request) {
    pruneStatus();

    auto path = resolvePath(request.container, request.path);
    if (!path || !FileUtils::fileExists(*path) || FileUtils::directoryExists(*path)) {
        throw ServeError(404, "not found: " + request.container + "/" + request.path);
    }

    ServePlan plan;
    plan.path = *path;
    plan.device = request.device;
    plan.profile = profileForTsn(request.tsn);
    plan.offset = request.offset;
    plan.fileSize = static_cast<uint64_t>(std::max<int64_t>(0, FileUtils::getFileSize(*path)));

    plan.mime = request.mime.empty() ? defaultMime(*path, plan.profile) : request.mime;
    if (plan.mime == kMimeTivoTs && !limitsFor(plan.profile).transportStream) {
        plan.mime = kMimeTivoPs;
    }
    if (plan.mime != kMimeTivoTs && plan.mime != kMimeTivoPs && plan.mime != kMimeMpeg) {
        throw ServeError(415, "unsupported format " + plan.mime);
    }

    if (lowerExtension(*path) == ".tivo") {
        // Receiver recordings go back as recorded; the receiver holds the key
        if (plan.mime == kMimeMpeg) {
            throw ServeError(415, "decrypting on serve is not supported");
        }
        plan.decision.passThrough = true;
        plan.decision.reason = "receiver recording";
        plan.decision.estimatedSize = static_cast<int64_t>(plan.fileSize);
    } else {
        auto decision = decide(*path, plan.profile, plan.mime);
        if (!decision) {
            throw ServeError(415, "cannot read media info for " + request.path);
        }
        plan.decision = *decision;
        if (!plan.decision.passThrough) {
            plan.command = m_planner.command(*path, plan.decision);
        }
    }

    if (plan.offset > 0) {
        if (!plan.passThrough()) {
            throw ServeError(416, "transcoded output is not resumable");
        }
        if (plan.offset >= plan.fileSize) {
            throw ServeError(416, "offset past end of " + request.path);
        }

        std::lock_guard<std::mutex> lock(m_statusMutex);
        auto device = m_status.find(plan.device);
        if (device != m_status.end()) {
            auto entry = device->second.find(plan.path);
            if (entry != device->second.end() && entry->second.offset == plan.offset) {
                // Keeps the receiver from looping over the same spot
                entry->second.error = "Repeat offset call";
                throw ServeError(416, "repeat offset call");
            }
        }
    }

    if (plan.passThrough()) {
        plan.contentLength = plan.fileSize - plan.offset;
    }
    return plan;
}

TransferResult MediaServer::stream(const ServePlan& plan, CallbackSink::Writer writer,
                                   const std::atomic<bool>* cancel) {
    std::unique_ptr<StreamSource> source;
    if (plan.passThrough()) {
        source = std::make_unique<FileSource>(plan.path);
    } else {
        source = std::make_unique<ProcessSource>(plan.command);
    }
    CallbackSink sink(std::move(writer), plan.device);

    SessionOptions options;
    options.direction = Direction::Serve;
    options.streamKind = plan.mime == kMimeTivoTs ? StreamKind::TS : StreamKind::PS;
    options.validate = false;
    options.startOffset = plan.passThrough() ? plan.offset : 0;
    options.expectedBytes = plan.contentLength;
    options.label = "\"" + fs::path(plan.path).filename().string() + "\" to " + plan.device;

    auto started = std::chrono::system_clock::now();
    {
        std::lock_guard<std::mutex> lock(m_statusMutex);
        TransferEntry& entry = m_status[plan.device][plan.path];
        entry.active = true;
        entry.transcoding = !plan.passThrough();
        entry.offset = plan.offset;
        entry.start = started;
        entry.end = started;
        entry.size = plan.contentLength ? *plan.contentLength : static_cast<uint64_t>(plan.decision.estimatedSize);
        entry.output = 0;
        entry.rate = 0.0;
        entry.error.clear();
    }

    LOG_INFO("Start sending {} ({})", options.label, plan.passThrough() ? "pass-through" : "transcoding");

    TransferSession session(*source, sink, options, cancel);
    session.setProgressListener([this, &plan, started](uint64_t bytes) {
        std::lock_guard<std::mutex> lock(m_statusMutex);
        TransferEntry& entry = m_status[plan.device][plan.path];
        entry.output = bytes;
        auto secs = std::chrono::duration<double>(std::chrono::system_clock::now() - started).count();
        if (secs > 0) entry.rate = static_cast<double>(bytes) * 8.0 / secs;
    });

    TransferResult result = session.run();

    {
        std::lock_guard<std::mutex> lock(m_statusMutex);
        TransferEntry& entry = m_status[plan.device][plan.path];
        entry.active = false;
        entry.end = std::chrono::system_clock::now();
        entry.output = result.bytes;
        if (!result.success()) entry.error = result.error;
    }

    if (result.success()) {
        LOG_INFO("Done sending {} ({})", options.label,
                 StringUtils::formatBytes(static_cast<int64_t>(result.bytes)));
    } else {
        LOG_WARN("Sending {} stopped after {}: {}", options.label,
                 StringUtils::formatBytes(static_cast<int64_t>(result.bytes)), result.error);
    }
    return result;
}

size_t MediaServer::activeTransferCount() const {
    std::lock_guard<std::mutex> lock(m_statusMutex);
    size_t count = 0;
    for (const auto& [device, files] : m_status) {
        for (const auto& [path, entry] : files) {
            if (entry.active) ++count;
        }
    }
    return count;
}

nlohmann::json MediaServer::transferStatus() const {
    std::lock_guard<std::mutex> lock(m_statusMutex);
    nlohmann::json status = nlohmann::json::object();
    for (const auto& [device, files] : m_status) {
        nlohmann::json perDevice = nlohmann::json::object();
        for (const auto& [path, entry] : files) {
            perDevice[path] = entry.toJson();
        }
        status[device] = perDevice;
    }
    return status;
}

size_t MediaServer::pruneStatus(std::chrono::seconds maxAge) {
    std::lock_guard<std::mutex> lock(m_statusMutex);
    auto cutoff = std::chrono::system_clock::now() - maxAge;
    size_t removed = 0;

    for (auto device = m_status.begin(); device != m_status.end(); ) {
        auto& files = device->second;
        for (auto it = files.begin(); it != files.end(); ) {
            if (!it->second.active && it->second.end <= cutoff) {
                it = files.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        device = files.empty() ? m_status.erase(device) : std::next(device);
    }
    return removed;
}

} // namespace homestream::core::server

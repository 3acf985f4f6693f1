#pragma once

/**
 * MediaServer.hpp
 *
 * Serve side of the receiver protocol: browses shares and streams files
 * to receivers, either as-is or through the transcoder.
 */

#include "CapabilityProfile.hpp"
#include "MediaInspector.hpp"
#include "NowPlayingList.hpp"
#include "TranscodePlanner.hpp"
#include "../cache/LRUCache.hpp"
#include "../transfer/StreamSink.hpp"
#include "../transfer/TransferSession.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace homestream::core::server {

/**
 * Named container mapped to a local directory
 */
struct Share {
    std::string name;
    std::string path;
};

struct MediaServerConfig {
    std::string name{"HomeStream"};
    std::string version{"1.0.0"};
    std::vector<Share> shares;
    long cacheCapacity{256};
    TranscodeSettings transcode;

    /**
     * @throws ConfigError for a share without a path
     */
    static MediaServerConfig fromJson(const nlohmann::json& server,
                                      const nlohmann::json& shares,
                                      const nlohmann::json& transcode);
};

/**
 * Request refused before any byte was sent; carries the HTTP status
 */
class ServeError : public std::runtime_error {
public:
    ServeError(int status, const std::string& message)
        : std::runtime_error(message), m_status(status) {}

    int status() const { return m_status; }

private:
    int m_status;
};

/**
 * Decision cache key
 */
struct DecisionKey {
    std::string path;
    std::string fingerprint;    // path, size and modification time
    CapabilityProfile profile{CapabilityProfile::StandardDefinition};
    std::string mime;

    bool operator==(const DecisionKey& other) const {
        return fingerprint == other.fingerprint && profile == other.profile &&
               mime == other.mime && path == other.path;
    }
};

struct DecisionKeyHash {
    size_t operator()(const DecisionKey& key) const {
        size_t h = std::hash<std::string>{}(key.fingerprint);
        h ^= std::hash<std::string>{}(key.mime) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= static_cast<size_t>(key.profile) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

struct ServeRequest {
    std::string container;    // share name
    std::string path;         // relative to the share
    std::string tsn;          // receiver serial, may be empty
    std::string device;       // receiver name or peer address
    std::string mime;         // requested Format, empty for the default
    uint64_t offset{0};
};

struct ServePlan {
    std::string path;
    std::string device;
    CapabilityProfile profile{CapabilityProfile::StandardDefinition};
    std::string mime;
    TranscodeDecision decision;
    uint64_t offset{0};
    uint64_t fileSize{0};
    std::optional<uint64_t> contentLength;   // pass-through only
    std::vector<std::string> command;        // transcode only

    bool passThrough() const { return decision.passThrough; }
};

/**
 * MediaServer - HMO/GoBack request handler
 *
 * Thread-safe: one instance serves all concurrent requests. Transcode
 * decisions are memoized per (file fingerprint, profile, mime); a file
 * changed in place keeps its decision until invalidate() is called.
 */
class MediaServer {
public:
    MediaServer(MediaServerConfig config, std::shared_ptr<MediaInspector> inspector);

    MediaServer(const MediaServer&) = delete;
    MediaServer& operator=(const MediaServer&) = delete;

    const std::vector<Share>& shares() const { return m_config.shares; }

    /**
     * Map "<share>" + relative path to a local path; rejects ".." segments
     */
    std::optional<std::string> resolvePath(const std::string& container, const std::string& relative) const;

    /**
     * Now playing list for "<share>[/sub/dir]", or the share list for "/"
     * @param count Page size, negative for everything
     * @return nullopt for an unknown container
     */
    std::optional<std::string> queryContainer(const std::string& container, const std::string& tsn,
                                              int start, int count) const;

    std::string queryServer() const;
    std::string queryFormats(const std::string& tsn) const;

    /**
     * TvBusMarshalledStruct details of one file, cached per receiver and
     * file fingerprint
     * @return nullopt for an unknown container or missing file
     */
    std::optional<std::string> tvBusQuery(const std::string& container, const std::string& file,
                                          const std::string& tsn);

    /**
     * Resolve and decide
     * @throws ServeError (404 unknown item, 415 unplayable, 416 bad offset)
     */
    ServePlan prepare(const ServeRequest& request);

    /**
     * Send the planned bytes through writer
     */
    TransferResult stream(const ServePlan& plan, CallbackSink::Writer writer,
                          const std::atomic<bool>* cancel = nullptr);

    /**
     * Cached (or freshly computed) decision for a file
     * @return nullopt if the file cannot be inspected
     */
    std::optional<TranscodeDecision> decide(const std::string& path, CapabilityProfile profile,
                                            const std::string& mime);

    /**
     * Drop cached decisions for a file
     */
    void invalidate(const std::string& path);

    size_t activeTransferCount() const;
    nlohmann::json transferStatus() const;

    /**
     * Forget finished transfers older than maxAge
     */
    size_t pruneStatus(std::chrono::seconds maxAge = std::chrono::hours(24));

    /**
     * Mime offered to this receiver for a file
     */
    std::string defaultMime(const std::string& path, CapabilityProfile profile) const;

    static bool isVideoFile(const std::string& path);

    const TranscodePlanner& planner() const { return m_planner; }
    size_t cachedDecisions() const { return m_decisions.size(); }
    uint64_t decisionHits() const { return m_decisions.hitCount(); }

private:
    struct TransferEntry {
        bool active{false};
        bool transcoding{false};
        uint64_t offset{0};
        std::chrono::system_clock::time_point start;
        std::chrono::system_clock::time_point end;
        uint64_t size{0};
        uint64_t output{0};
        double rate{0.0};     // bits per second
        std::string error;

        nlohmann::json toJson() const;
    };

    const Share* findShare(const std::string& name) const;
    std::string fingerprint(const std::string& path) const;
    /**
     * File name and attributes, overlaid with "<file>.txt" metadata when present
     */
    Recording recordingFor(const std::string& path) const;
    int countItems(const std::string& dir) const;

    MediaServerConfig m_config;
    std::shared_ptr<MediaInspector> m_inspector;
    TranscodePlanner m_planner;
    LRUCache<DecisionKey, std::optional<TranscodeDecision>, DecisionKeyHash> m_decisions;
    LRUCache<std::string, std::string> m_details;   // "<tsn>|<fingerprint>" -> xml

    // device -> path -> entry
    std::map<std::string, std::map<std::string, TransferEntry>> m_status;
    mutable std::mutex m_statusMutex;
};

} // namespace homestream::core::server

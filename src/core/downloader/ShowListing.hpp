#pragma once

/**
 * ShowListing.hpp
 *
 * Reads the Now Playing list of a receiver unit so its recordings can be
 * queued for transfer.
 */

#include "DownloadManager.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace homestream::core::downloader {

/**
 * One show on a receiver
 */
struct ShowEntry {
    Recording recording;       // ready to hand to DownloadManager::enqueue
    std::string detailsUrl;
    bool inProgress{false};
    bool copyProtected{false};  // the receiver refuses to send these
    std::string icon{"normal"};

    nlohmann::json toJson() const;
};

/**
 * One QueryContainer response
 */
struct ShowPage {
    int totalItems{0};
    int itemCount{0};          // as reported; 0 if missing
    int itemsSeen{0};          // <Item> elements, shows and folders
    std::string lastChangeDate;
    std::vector<ShowEntry> shows;
};

class ShowListing {
public:
    /**
     * Parse a TiVoContainer document. Relative content links are resolved
     * against baseUrl.
     * @throws ConnectError if the body is not a TiVoContainer
     */
    static ShowPage parse(const std::string& xml, const std::string& unit, const std::string& baseUrl);

    /**
     * "<protocol>://<address>:<port>/TiVoConnect?Command=QueryContainer&Container=/NowPlaying"
     */
    static std::string baseUrl(const ReceiverSettings& receiver);

    static std::string resolveUrl(const std::string& baseUrl, const std::string& url);
};

/**
 * GET url with the unit's media access key; returns the body
 * @throws ConnectError on transport or HTTP errors
 */
using PageFetcher = std::function<std::string(const std::string& url, const std::string& mak)>;

/**
 * ShowListClient - paged Now Playing list reader
 *
 * The receiver answers at most 50 items per request. A full list is kept
 * per unit and reused while the receiver reports the same LastChangeDate.
 */
class ShowListClient {
public:
    static constexpr int kPageSize = 50;

    explicit ShowListClient(std::map<std::string, ReceiverSettings> receivers, PageFetcher fetcher = {});

    /**
     * @throws ConfigError for a unit without an address, ConnectError when
     *         the receiver cannot be read
     */
    std::vector<ShowEntry> shows(const std::string& unit);

    void invalidate(const std::string& unit);

    static std::string fetchWithDigest(const std::string& url, const std::string& mak);

private:
    struct CachedList {
        std::string lastChangeDate;
        std::vector<ShowEntry> shows;
    };

    std::map<std::string, ReceiverSettings> m_receivers;
    PageFetcher m_fetcher;

    std::map<std::string, CachedList> m_cache;
    std::mutex m_mutex;
};

} // namespace homestream::core::downloader

#pragma once

/**
 * HttpFrontend.hpp
 *
 * HTTP listener for receivers and local clients. Dispatches TiVoConnect
 * commands and file requests to MediaServer and DownloadManager.
 */

#include "MediaServer.hpp"
#include "../downloader/DownloadManager.hpp"
#include "../downloader/ShowListing.hpp"
#include "../naming/NamingResolver.hpp"

#include <atomic>
#include <map>
#include <string>
#include <thread>
#include <httplib.h>
#include <nlohmann/json.hpp>

namespace homestream::core::server {

struct HttpFrontendConfig {
    std::string address{"0.0.0.0"};
    int port{9032};
    int threads{8};
    int requestTimeoutSec{180};

    // Pull defaults for ToGo requests
    std::string destination;
    NamingConfig naming;
    downloader::ErrorMode errorMode{downloader::ErrorMode::First};

    // Receiver serial -> display name
    std::map<std::string, std::string> receiverNames;

    /**
     * @throws ConfigError on a bad port, error mode or naming template
     */
    static HttpFrontendConfig fromJson(const nlohmann::json& server,
                                       const nlohmann::json& togo,
                                       const nlohmann::json& receivers);
};

/**
 * HttpFrontend - receiver protocol endpoint
 *
 *   GET      /TiVoConnect?Command=...   browse, status and pull commands
 *   POST     /TiVoConnect?Command=ToGo  queue a pull (JSON body)
 *   GET      /TiVoConnect?Command=ToGoShows&Unit=<tsn>  a receiver's recordings
 *   GET      /<share>/<path>            stream a file ("Range: bytes=N-" to resume)
 */
class HttpFrontend {
public:
    /**
     * @param shows May be null; ToGoShows then answers 503
     */
    HttpFrontend(HttpFrontendConfig config, MediaServer& mediaServer,
                 downloader::DownloadManager& downloads,
                 downloader::ShowListClient* shows = nullptr);
    ~HttpFrontend();

    HttpFrontend(const HttpFrontend&) = delete;
    HttpFrontend& operator=(const HttpFrontend&) = delete;

    /**
     * Bind and start listening on a background thread
     * @return false if the address cannot be bound
     */
    bool start();
    void stop();

    bool isRunning() const { return m_server.is_running(); }
    int port() const { return m_boundPort; }

    // Request handlers, callable without a socket
    void handleCommand(const httplib::Request& req, httplib::Response& res);
    void handleFile(const httplib::Request& req, httplib::Response& res);

private:
    void queryContainer(const httplib::Request& req, httplib::Response& res, const std::string& tsn);
    void toGo(const httplib::Request& req, httplib::Response& res);
    void toGoStatus(const httplib::Request& req, httplib::Response& res);
    void toGoStop(const httplib::Request& req, httplib::Response& res);
    void toGoList(httplib::Response& res);
    void toGoShows(const httplib::Request& req, httplib::Response& res);
    void unqueue(const httplib::Request& req, httplib::Response& res);
    void unqueueAll(const httplib::Request& req, httplib::Response& res);
    void tvBusQuery(const httplib::Request& req, httplib::Response& res, const std::string& tsn);

    std::string deviceName(const httplib::Request& req, const std::string& tsn) const;

    static std::string receiverSerial(const httplib::Request& req);
    static void sendXml(httplib::Response& res, const std::string& xml);
    static void sendJson(httplib::Response& res, const nlohmann::json& body, int status = 200);
    static void sendError(httplib::Response& res, int status, const std::string& message);

    HttpFrontendConfig m_config;
    MediaServer& m_mediaServer;
    downloader::DownloadManager& m_downloads;
    downloader::ShowListClient* m_shows;

    httplib::Server m_server;
    std::thread m_thread;
    std::atomic<bool> m_stopping{false};
    int m_boundPort{0};
};

} // namespace homestream::core::server

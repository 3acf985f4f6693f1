/**
 * HttpFrontend.cpp
 */

#include "HttpFrontend.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <memory>

namespace homestream::core::server {

using json = nlohmann::json;
using utils::StringUtils;

// -- HttpFrontendConfig --

HttpFrontendConfig HttpFrontendConfig::fromJson(const json& server, const json& togo, const json& receivers) {
    HttpFrontendConfig config;

    try {
        if (server.is_object()) {
            config.address = server.value("address", config.address);
            config.port = server.value("port", config.port);
            config.threads = server.value("threads", config.threads);
            config.requestTimeoutSec = server.value("requestTimeoutSec", config.requestTimeoutSec);
        }
        if (togo.is_object()) {
            config.destination = togo.value("destination", "");
            config.errorMode = downloader::parseErrorMode(togo.value("errorMode", "first"));
            if (togo.contains("naming")) {
                config.naming = NamingConfig::fromJson(togo["naming"]);
            }
            // A template with an unknown field stops startup here
            NamingResolver validated(config.naming);
        }
        if (receivers.is_object()) {
            for (const auto& [tsn, settings] : receivers.items()) {
                config.receiverNames[tsn] = settings.value("name", tsn);
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid server settings: ") + e.what());
    }

    if (config.port < 0 || config.port > 65535) {
        throw ConfigError("server.port out of range: " + std::to_string(config.port));
    }
    if (config.threads < 1) {
        throw ConfigError("server.threads must be at least 1");
    }
    return config;
}

// -- HttpFrontend --

HttpFrontend::HttpFrontend(HttpFrontendConfig config, MediaServer& mediaServer,
                           downloader::DownloadManager& downloads,
                           downloader::ShowListClient* shows)
    : m_config(std::move(config))
    , m_mediaServer(mediaServer)
    , m_downloads(downloads)
    , m_shows(shows) {

    const int threads = m_config.threads;
    m_server.new_task_queue = [threads] { return new httplib::ThreadPool(static_cast<size_t>(threads)); };
    m_server.set_read_timeout(m_config.requestTimeoutSec, 0);
    m_server.set_write_timeout(m_config.requestTimeoutSec, 0);

    m_server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LOG_DEBUG("{} {} {} -> {}", req.remote_addr, req.method, req.target, res.status);
    });

    m_server.Get("/TiVoConnect", [this](const httplib::Request& req, httplib::Response& res) {
        handleCommand(req, res);
    });
    m_server.Post("/TiVoConnect", [this](const httplib::Request& req, httplib::Response& res) {
        handleCommand(req, res);
    });
    m_server.Get(R"(/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
        handleFile(req, res);
    });
}

HttpFrontend::~HttpFrontend() {
    stop();
}

bool HttpFrontend::start() {
    if (m_config.port == 0) {
        m_boundPort = m_server.bind_to_any_port(m_config.address);
        if (m_boundPort <= 0) {
            LOG_ERROR("Cannot bind {}", m_config.address);
            return false;
        }
    } else {
        if (!m_server.bind_to_port(m_config.address, m_config.port)) {
            LOG_ERROR("Cannot bind {}:{}", m_config.address, m_config.port);
            return false;
        }
        m_boundPort = m_config.port;
    }

    m_stopping = false;
    m_thread = std::thread([this]() {
        if (!m_server.listen_after_bind()) {
            LOG_ERROR("HTTP listener on port {} stopped unexpectedly", m_boundPort);
        }
    });

    LOG_INFO("Listening on {}:{} ({} worker threads)", m_config.address, m_boundPort, m_config.threads);
    return true;
}

void HttpFrontend::stop() {
    m_stopping = true;
    if (m_server.is_running()) {
        m_server.stop();
    }
    if (m_thread.joinable()) {
        m_thread.join();
        LOG_INFO("HTTP listener stopped");
    }
}

// -- Helpers --

std::string HttpFrontend::receiverSerial(const httplib::Request& req) {
    if (req.has_header("TiVo_TCD_ID")) {
        return req.get_header_value("TiVo_TCD_ID");
    }
    return req.get_header_value("tsn");
}

std::string HttpFrontend::deviceName(const httplib::Request& req, const std::string& tsn) const {
    if (!tsn.empty()) {
        auto it = m_config.receiverNames.find(tsn);
        return it != m_config.receiverNames.end() ? it->second : tsn;
    }
    return req.remote_addr;
}

void HttpFrontend::sendXml(httplib::Response& res, const std::string& xml) {
    res.status = 200;
    res.set_header("Cache-Control", "no-cache");
    res.set_content(xml, "text/xml");
}

void HttpFrontend::sendJson(httplib::Response& res, const json& body, int status) {
    res.status = status;
    res.set_header("Cache-Control", "no-cache");
    // Titles and file names may not be UTF-8
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void HttpFrontend::sendError(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(message, "text/plain");
}

// -- Commands --

void HttpFrontend::handleCommand(const httplib::Request& req, httplib::Response& res) {
    const std::string command = req.get_param_value("Command");
    const std::string tsn = receiverSerial(req);

    if (command == "QueryContainer") {
        queryContainer(req, res, tsn);
    } else if (command == "TVBusQuery") {
        tvBusQuery(req, res, tsn);
    } else if (command == "QueryServer") {
        sendXml(res, m_mediaServer.queryServer());
    } else if (command == "QueryFormats" &&
               StringUtils::startsWith(req.get_param_value("SourceFormat"), "video")) {
        sendXml(res, m_mediaServer.queryFormats(tsn));
    } else if (command == "GetActiveTransferCount") {
        sendJson(res, {{"count", m_mediaServer.activeTransferCount()}});
    } else if (command == "GetTransferStatus") {
        sendJson(res, m_mediaServer.transferStatus());
    } else if (command == "ToGo") {
        toGo(req, res);
    } else if (command == "ToGoStatus") {
        toGoStatus(req, res);
    } else if (command == "ToGoStop") {
        toGoStop(req, res);
    } else if (command == "ToGoList") {
        toGoList(res);
    } else if (command == "ToGoShows") {
        toGoShows(req, res);
    } else if (command == "Unqueue") {
        unqueue(req, res);
    } else if (command == "UnqueueAll") {
        unqueueAll(req, res);
    } else if (command == "FlushServer" || command == "ResetServer") {
        res.status = 200;
    } else {
        LOG_DEBUG("Unsupported command '{}' from {}", command, req.remote_addr);
        sendError(res, 400, "Unsupported Command");
    }
}

void HttpFrontend::queryContainer(const httplib::Request& req, httplib::Response& res, const std::string& tsn) {
    std::string container = req.has_param("Container") ? req.get_param_value("Container") : "/";
    int start = StringUtils::parseInt(req.get_param_value("ItemStart"), 0);
    int count = req.has_param("ItemCount") ? StringUtils::parseInt(req.get_param_value("ItemCount"), -1) : -1;

    auto xml = m_mediaServer.queryContainer(container, tsn, start, count);
    if (!xml) {
        sendError(res, 404, "No such container: " + container);
        return;
    }
    sendXml(res, *xml);
}

void HttpFrontend::toGo(const httplib::Request& req, httplib::Response& res) {
    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("recording")) {
        sendError(res, 400, "expected a JSON object with a \"recording\"");
        return;
    }

    try {
        Recording recording = Recording::fromJson(body["recording"]);
        std::string destination = body.value("destination", m_config.destination);
        downloader::ErrorMode errorMode = body.contains("errorMode")
            ? downloader::parseErrorMode(body["errorMode"].get<std::string>())
            : m_config.errorMode;

        downloader::DownloadOptions options;
        options.maxAttempts = body.value("maxAttempts", m_downloads.config().maxAttempts);
        options.retryDelay = m_downloads.config().retryDelay;
        options.decode = body.value("decode", false);
        options.syncAction = body.contains("tsErrorMode")
            ? downloader::parseSyncErrorAction(body["tsErrorMode"].get<std::string>())
            : m_downloads.config().syncAction;
        options.saveMetadata = body.value("saveMetadata", m_downloads.config().saveMetadata);

        std::string id = m_downloads.enqueue(recording, destination, m_config.naming, errorMode, options);
        sendJson(res, {{"id", id}}, 202);
    } catch (const ConfigError& e) {
        sendError(res, 400, e.what());
    } catch (const json::exception& e) {
        sendError(res, 400, std::string("bad recording: ") + e.what());
    }
}

void HttpFrontend::toGoStatus(const httplib::Request& req, httplib::Response& res) {
    auto status = m_downloads.status(req.get_param_value("Id"));
    if (!status) {
        sendError(res, 404, "unknown task");
        return;
    }
    sendJson(res, status->toJson());
}

void HttpFrontend::toGoStop(const httplib::Request& req, httplib::Response& res) {
    bool cancelled = m_downloads.cancel(req.get_param_value("Id"));
    sendJson(res, {{"cancelled", cancelled}});
}

void HttpFrontend::toGoList(httplib::Response& res) {
    json tasks = json::array();
    for (const auto& status : m_downloads.list()) {
        tasks.push_back(status.toJson());
    }
    sendJson(res, tasks);
}

void HttpFrontend::toGoShows(const httplib::Request& req, httplib::Response& res) {
    if (!m_shows) {
        sendError(res, 503, "receiver browsing is not configured");
        return;
    }

    try {
        json shows = json::array();
        for (const auto& show : m_shows->shows(req.get_param_value("Unit"))) {
            shows.push_back(show.toJson());
        }
        sendJson(res, shows);
    } catch (const ConfigError& e) {
        sendError(res, 404, e.what());
    } catch (const ConnectError& e) {
        LOG_WARN("Cannot read shows from {}: {}", req.get_param_value("Unit"), e.what());
        sendError(res, 502, e.what());
    }
}

void HttpFrontend::unqueue(const httplib::Request& req, httplib::Response& res) {
    bool removed = m_downloads.unqueue(req.get_param_value("Id"));
    sendJson(res, {{"removed", removed}});
}

void HttpFrontend::unqueueAll(const httplib::Request& req, httplib::Response& res) {
    size_t removed = m_downloads.unqueueAll(req.get_param_value("Unit"));
    sendJson(res, {{"removed", removed}});
}

void HttpFrontend::tvBusQuery(const httplib::Request& req, httplib::Response& res, const std::string& tsn) {
    const std::string container = req.get_param_value("Container");
    const std::string file = req.get_param_value("File");

    auto xml = m_mediaServer.tvBusQuery(container, file, tsn);
    if (!xml) {
        sendError(res, 404, "not found: " + container + "/" + file);
        return;
    }
    sendXml(res, *xml);
}

// -- Files --

void HttpFrontend::handleFile(const httplib::Request& req, httplib::Response& res) {
    auto segments = StringUtils::split(req.path, '/');
    segments.erase(std::remove(segments.begin(), segments.end(), std::string()), segments.end());
    if (segments.size() < 2) {
        sendError(res, 404, "Not Found");
        return;
    }

    const std::string tsn = receiverSerial(req);

    ServeRequest request;
    request.container = segments.front();
    request.path = StringUtils::join(std::vector<std::string>(segments.begin() + 1, segments.end()), "/");
    request.tsn = tsn;
    request.device = deviceName(req, tsn);
    request.mime = req.get_param_value("Format");

    // "bytes=N-"
    std::string range = req.get_header_value("Range");
    if (StringUtils::startsWith(range, "bytes=") && StringUtils::endsWith(range, "-")) {
        auto offset = StringUtils::parseLong(range.substr(6, range.size() - 7));
        if (offset && *offset > 0) {
            request.offset = static_cast<uint64_t>(*offset);
        }
    }

    std::shared_ptr<ServePlan> plan;
    try {
        plan = std::make_shared<ServePlan>(m_mediaServer.prepare(request));
    } catch (const ServeError& e) {
        LOG_INFO("Refused {}/{} for {}: {}", request.container, request.path, request.device, e.what());
        sendError(res, e.status(), e.what());
        return;
    }

    auto provider = [this, plan](httplib::DataSink& sink) {
        auto result = m_mediaServer.stream(*plan, [&sink](const char* data, size_t len) {
            return sink.is_writable() && sink.write(data, len);
        }, &m_stopping);
        return result.success();
    };

    if (plan->passThrough()) {
        // httplib answers the Range header itself and starts us at that offset
        res.status = 200;
        res.set_content_provider(
            static_cast<size_t>(plan->fileSize), plan->mime,
            [provider, plan](size_t offset, size_t, httplib::DataSink& sink) {
                // Only open-ended ranges ("bytes=N-") are served
                if (offset != plan->offset) return false;
                return provider(sink);
            });
    } else {
        res.status = 206;
        res.set_chunked_content_provider(
            plan->mime,
            [provider](size_t, httplib::DataSink& sink) {
                bool ok = provider(sink);
                if (ok) sink.done();
                return ok;
            });
    }
}

} // namespace homestream::core::server

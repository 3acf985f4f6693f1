/**
 * Application.cpp
 *
 * Implementation of the core Application class.
 */

#include "Application.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "downloader/DownloadManager.hpp"
#include "downloader/ShowListing.hpp"
#include "server/HttpFrontend.hpp"
#include "server/MediaServer.hpp"
#include "transfer/Decoder.hpp"
#include "../utils/HttpClient.hpp"
#include "../utils/PathUtils.hpp"

#include <chrono>
#include <filesystem>
#include <thread>

namespace homestream::core {

namespace {
constexpr auto kPruneInterval = std::chrono::minutes(10);
constexpr auto kFinishedRetention = std::chrono::hours(24);
}

Application::Application() {
    Logger::instance().debug("Application instance created");
}

Application::~Application() {
    if (m_state != AppState::Uninitialized && m_state != AppState::ShuttingDown) {
        shutdown();
    }
}

bool Application::initialize(const std::string& configPath, bool debug) {
    if (m_state != AppState::Uninitialized) {
        Logger::instance().warn("Application already initialized");
        return false;
    }

    setState(AppState::Initializing);

    if (!loadConfiguration(configPath)) {
        setState(AppState::Error);
        return false;
    }
    initializeLogging(debug);

    Logger::instance().info("{} v{} starting...", getName(), getVersion());
    Logger::instance().info("Configuration: {}", Config::instance().path());

    auto startTime = std::chrono::steady_clock::now();

    utils::CurlGlobalInit::init();

    try {
        if (!initializeDownloader()) {
            Logger::instance().error("Failed to initialize download manager");
            setState(AppState::Error);
            return false;
        }

        if (!initializeMediaServer()) {
            Logger::instance().error("Failed to initialize media server");
            setState(AppState::Error);
            return false;
        }

        if (!initializeFrontend()) {
            Logger::instance().error("Failed to initialize HTTP front end");
            setState(AppState::Error);
            return false;
        }
    } catch (const ConfigError& e) {
        Logger::instance().critical("Configuration error: {}", e.what());
        setState(AppState::Error);
        return false;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    Logger::instance().info("Application initialized in {}ms", duration.count());

    setState(AppState::Running);
    return true;
}

void Application::run(const std::atomic<bool>& stop) {
    auto lastPrune = std::chrono::steady_clock::now();

    while (!stop && m_state == AppState::Running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        if (std::chrono::steady_clock::now() - lastPrune >= kPruneInterval) {
            lastPrune = std::chrono::steady_clock::now();
            if (m_downloadManager) m_downloadManager->pruneFinished(kFinishedRetention);
            if (m_mediaServer) m_mediaServer->pruneStatus(kFinishedRetention);
        }
    }
}

void Application::shutdown() {
    if (m_state == AppState::ShuttingDown || m_state == AppState::Uninitialized) {
        return;
    }

    setState(AppState::ShuttingDown);
    Logger::instance().info("Shutting down application...");

    // Stop accepting requests before tearing down what they use
    if (m_frontend) {
        m_frontend->stop();
        m_frontend.reset();
    }
    if (m_downloadManager) {
        m_downloadManager->shutdown();
    }
    m_mediaServer.reset();
    m_downloadManager.reset();

    utils::CurlGlobalInit::cleanup();

    Logger::instance().info("Application shutdown complete");
    Logger::instance().flush();

    setState(AppState::Uninitialized);
}

void Application::onStateChange(std::function<void(AppState)> callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_stateCallbacks.push_back(std::move(callback));
}

void Application::setState(AppState state) {
    m_state = state;

    std::vector<std::function<void(AppState)>> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        callbacks = m_stateCallbacks;
    }
    for (const auto& callback : callbacks) {
        callback(state);
    }
}

bool Application::loadConfiguration(const std::string& configPath) {
    auto& config = Config::instance();
    std::string path = configPath.empty() ? utils::PathUtils::getConfigPath().string() : configPath;

    if (std::filesystem::exists(path)) {
        if (!config.load(path)) {
            Logger::instance().critical("Cannot parse configuration {}", path);
            return false;
        }
        return true;
    }

    if (!configPath.empty()) {
        Logger::instance().critical("Configuration file not found: {}", path);
        return false;
    }

    config.setDefaults();
    if (config.save(path)) {
        config.load(path);
        Logger::instance().info("Default configuration created at {}", path);
    }
    return true;
}

void Application::initializeLogging(bool debug) {
    auto& config = Config::instance();

    LogLevel level = debug ? LogLevel::Debug
                           : Logger::parseLevel(config.get<std::string>("logging.level", "info"));

    std::string logDir = config.get<std::string>("logging.directory", "");
    if (logDir.empty()) {
        logDir = utils::PathUtils::getLogsPath().string();
    }

    Logger::instance().initialize(level, logDir);
}

bool Application::initializeDownloader() {
    auto& config = Config::instance();

    auto managerConfig = downloader::DownloadManagerConfig::fromJson(
        config.section("togo"), config.section("receivers"));
    m_downloadManager = std::make_shared<downloader::DownloadManager>(managerConfig);
    m_showList = std::make_unique<downloader::ShowListClient>(managerConfig.receivers);

    nlohmann::json decoderSection = config.section("togo.decoder");
    if (auto decoder = ExternalDecoder::fromConfig(decoderSection)) {
        Logger::instance().info("Decoder: {}", decoder->name());
        m_downloadManager->setDecoder(std::shared_ptr<Decoder>(std::move(decoder)));
    }

    m_downloadManager->setCompletionCallback([](const downloader::TaskStatus& status) {
        Logger::instance().debug("Task {} finished: {}", status.id, toString(status.state));
    });
    return true;
}

bool Application::initializeMediaServer() {
    auto& config = Config::instance();

    auto serverConfig = server::MediaServerConfig::fromJson(
        config.section("server"), config.section("shares"), config.section("transcode"));
    serverConfig.version = getVersion();

    std::string ffprobe = config.get<std::string>("transcode.ffprobe", "ffprobe");
    m_mediaServer = std::make_shared<server::MediaServer>(
        serverConfig, std::make_shared<server::FfprobeInspector>(ffprobe));

    for (const auto& share : m_mediaServer->shares()) {
        Logger::instance().info("Share '{}' -> {}", share.name, share.path);
    }
    return true;
}

bool Application::initializeFrontend() {
    auto& config = Config::instance();

    auto frontendConfig = server::HttpFrontendConfig::fromJson(
        config.section("server"), config.section("togo"), config.section("receivers"));
    if (frontendConfig.destination.empty()) {
        frontendConfig.destination = utils::PathUtils::getDownloadsPath().string();
    }

    m_frontend = std::make_unique<server::HttpFrontend>(frontendConfig, *m_mediaServer, *m_downloadManager,
                                                        m_showList.get());
    return m_frontend->start();
}

} // namespace homestream::core

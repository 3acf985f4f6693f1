#pragma once

/**
 * Application.hpp
 *
 * Core application class that manages the lifecycle of the server.
 * Wires configuration, logging, the download manager, the media server
 * and the HTTP front end together.
 */

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace homestream::core::downloader { class DownloadManager; class ShowListClient; }
namespace homestream::core::server { class MediaServer; class HttpFrontend; }

namespace homestream::core {

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Initializing,
    Running,
    ShuttingDown,
    Error
};

/**
 * Main application class
 *
 * Handles initialization, shutdown, and coordination of all subsystems.
 */
class Application {
public:
    Application();
    ~Application();

    // Disable copy and move
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Initialize all application subsystems
     * @param configPath Config file (empty = default location)
     * @param debug Force debug logging
     * @return true if initialization successful
     */
    bool initialize(const std::string& configPath, bool debug);

    /**
     * Serve until stop becomes true; prunes finished work periodically
     */
    void run(const std::atomic<bool>& stop);

    /**
     * Shutdown the application gracefully
     */
    void shutdown();

    AppState getState() const { return m_state.load(); }

    std::shared_ptr<downloader::DownloadManager> getDownloadManager() const { return m_downloadManager; }
    std::shared_ptr<server::MediaServer> getMediaServer() const { return m_mediaServer; }

    /**
     * Register state change callback
     */
    void onStateChange(std::function<void(AppState)> callback);

    static std::string getVersion() { return "1.0.0"; }
    static std::string getName() { return "HomeStream"; }

private:
    void setState(AppState state);

    bool loadConfiguration(const std::string& configPath);
    void initializeLogging(bool debug);
    bool initializeDownloader();
    bool initializeMediaServer();
    bool initializeFrontend();

private:
    std::atomic<AppState> m_state{AppState::Uninitialized};

    std::vector<std::function<void(AppState)>> m_stateCallbacks;
    std::mutex m_callbackMutex;

    // Subsystems, destroyed in reverse order of creation
    std::shared_ptr<downloader::DownloadManager> m_downloadManager;
    std::unique_ptr<downloader::ShowListClient> m_showList;
    std::shared_ptr<server::MediaServer> m_mediaServer;
    std::unique_ptr<server::HttpFrontend> m_frontend;
};

} // namespace homestream::core

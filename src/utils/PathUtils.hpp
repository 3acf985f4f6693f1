#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace homestream::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getAppDataPath() {
        if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
            return fs::path(xdg);
        }
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / ".local" / "share" : fs::current_path();
    }

    static fs::path getHomeStreamPath() {
        return getAppDataPath() / "HomeStream";
    }

    static fs::path getConfigPath() {
        return getHomeStreamPath() / "config.json";
    }

    static fs::path getLogsPath() {
        return getHomeStreamPath() / "logs";
    }

    // Default destination for pulled recordings
    static fs::path getDownloadsPath() {
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / "Videos" / "HomeStream" : getHomeStreamPath() / "downloads";
    }
};

} // namespace homestream::utils

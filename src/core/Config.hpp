#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace homestream::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Holds the server, share, transcode, download ("togo") and receiver
 * settings. Keys are addressed with dot notation ("togo.maxAttempts").
 */
class Config {
public:
    /**
     * Get singleton instance
     * @return Reference to Config instance
     */
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Load configuration from file, merged over the defaults
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            if (!std::filesystem::exists(path)) {
                return false;
            }

            std::ifstream file(path);
            if (!file.is_open()) {
                return false;
            }

            m_config.merge_patch(json::parse(file));
            m_configPath = path;
            return true;

        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Save configuration to file
     * @param path Path to config file (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool save(const std::string& path = "") {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::string savePath = path.empty() ? m_configPath : path;
        if (savePath.empty()) {
            return false;
        }

        try {
            std::filesystem::create_directories(
                std::filesystem::path(savePath).parent_path()
            );

            std::ofstream file(savePath);
            if (!file.is_open()) {
                return false;
            }

            file << m_config.dump(4);
            return true;

        } catch (const std::exception&) {
            return false;
        }
    }

    /**
     * Set default configuration values
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_config = {
            {"version", "1.0.0"},
            {"server", {
                {"address", "0.0.0.0"},
                {"port", 9032},
                {"name", "HomeStream"},
                {"guid", ""},
                {"threads", 8},
                {"requestTimeoutSec", 180}
            }},
            {"shares", json::object()},
            {"transcode", {
                {"ffmpeg", "ffmpeg"},
                {"ffprobe", "ffprobe"},
                {"cacheCapacity", 256},
                {"tsFlag", "auto"}
            }},
            {"togo", {
                {"destination", ""},
                {"maxAttempts", 3},
                {"errorMode", "first"},
                {"tsErrorMode", "reject"},
                {"saveMetadata", false},
                {"concurrency", 1},
                {"retryDelayMs", 2000},
                {"connectTimeoutSec", 30},
                {"readTimeoutSec", 180},
                {"retainFinished", true},
                {"decoder", {
                    {"path", ""},
                    {"args", json::array({"-m", "{mak}", "-o", "{output}", "{input}"})}
                }},
                {"naming", {
                    {"movie", "{title} ({movie_year})"},
                    {"episode", "{title} - s{season}e{episode} - {episode_title} ({date_recorded},{callsign})"}
                }}
            }},
            {"receivers", json::object()},
            {"logging", {
                {"level", "info"},
                {"directory", ""}
            }}
        };
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "togo.maxAttempts")
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Fall through to default
        }

        return defaultValue;
    }

    /**
     * Set configuration value with dot notation
     * @param key Key path
     * @param value Value to set
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config[toJsonPointer(key)] = value;
    }

    /**
     * Get a whole section as JSON (empty object if missing)
     * @param key Key path
     */
    json section(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        json::json_pointer ptr = toJsonPointer(key);
        if (m_config.contains(ptr)) {
            return m_config.at(ptr);
        }
        return json::object();
    }

    std::string path() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_configPath;
    }

private:
    Config() {
        setDefaults();
    }

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * Convert dot notation to JSON pointer
     * @param key Dot-notation key
     * @return JSON pointer
     */
    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            if (c == '.') {
                pointer += '/';
            } else {
                pointer += c;
            }
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace homestream::core

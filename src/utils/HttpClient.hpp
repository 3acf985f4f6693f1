// HomeStream - HTTP Client
// Streaming HTTP client for pulling recordings from receivers (cpr over libcurl)

#pragma once

#include <string>
#include <map>
#include <functional>
#include <optional>
#include <cstdint>
#include <curl/curl.h>

namespace homestream::utils {

/**
 * @brief Result of a streamed request
 */
struct HttpStreamResult {
    int statusCode{0};
    std::map<std::string, std::string> headers;   // lower-case names
    std::string error;         // transport error, empty on success
    uint64_t bytesReceived{0};
    bool aborted{false};       // stopped by the chunk handler
    double elapsed{0.0};

    bool isSuccess() const {
        return error.empty() && statusCode >= 200 && statusCode < 300;
    }

    std::optional<uint64_t> contentLength() const;
};

/**
 * @brief HTTP request options
 */
struct HttpOptions {
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> cookies;
    int connectTimeoutSeconds{30};
    // Abort when less than 1 byte/s arrives for this long (0 = never)
    int lowSpeedTimeoutSeconds{180};
    bool verifySSL{true};
    std::string userAgent{"HomeStream/1.0"};

    // Digest authentication (empty user = none)
    std::string digestUser;
    std::string digestPassword;
};

/**
 * @brief Receives body bytes as they arrive; return false to abort
 */
using ChunkCallback = std::function<bool(const char* data, size_t len)>;

/**
 * @brief Streaming HTTP client
 */
class HttpClient {
public:
    HttpClient() = default;

    /**
     * Perform a GET and hand the body to onChunk as it arrives.
     * Runs on the calling thread until the body ends, the handler
     * aborts or the transfer fails.
     */
    HttpStreamResult streamGet(const std::string& url, const HttpOptions& options,
                               const ChunkCallback& onChunk) const;

    // URL utilities
    static std::string urlEncode(const std::string& str);
};

/**
 * @brief RAII wrapper for CURL handle
 */
class CurlHandle {
public:
    CurlHandle();
    ~CurlHandle();

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CurlHandle(CurlHandle&& other) noexcept;
    CurlHandle& operator=(CurlHandle&& other) noexcept;

    CURL* get() const { return m_curl; }
    operator CURL*() const { return m_curl; }

private:
    CURL* m_curl{nullptr};
};

/**
 * @brief Global CURL initialization
 */
class CurlGlobalInit {
public:
    static void init();
    static void cleanup();

private:
    static bool s_initialized;
};

} // namespace homestream::utils

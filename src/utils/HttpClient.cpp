/**
 * HttpClient.cpp
 *
 * HTTP client implementation using cpr (which wraps libcurl).
 */

#include "HttpClient.hpp"
#include "StringUtils.hpp"

#include <cpr/cpr.h>

namespace homestream::utils {

// -- CurlGlobalInit --

bool CurlGlobalInit::s_initialized = false;

void CurlGlobalInit::init() {
    if (!s_initialized) {
        curl_global_init(CURL_GLOBAL_ALL);
        s_initialized = true;
    }
}

void CurlGlobalInit::cleanup() {
    if (s_initialized) {
        curl_global_cleanup();
        s_initialized = false;
    }
}

// -- CurlHandle --

CurlHandle::CurlHandle() : m_curl(curl_easy_init()) {}
CurlHandle::~CurlHandle() { if (m_curl) curl_easy_cleanup(m_curl); }
CurlHandle::CurlHandle(CurlHandle&& other) noexcept : m_curl(other.m_curl) { other.m_curl = nullptr; }
CurlHandle& CurlHandle::operator=(CurlHandle&& other) noexcept {
    if (this != &other) { if (m_curl) curl_easy_cleanup(m_curl); m_curl = other.m_curl; other.m_curl = nullptr; }
    return *this;
}

// -- HttpStreamResult --

std::optional<uint64_t> HttpStreamResult::contentLength() const {
    auto it = headers.find("content-length");
    if (it == headers.end()) return std::nullopt;
    auto value = StringUtils::parseLong(it->second);
    if (!value || *value < 0) return std::nullopt;
    return static_cast<uint64_t>(*value);
}

// -- HttpClient --

HttpStreamResult HttpClient::streamGet(const std::string& url, const HttpOptions& options,
                                       const ChunkCallback& onChunk) const {
    HttpStreamResult result;

    cpr::Session session;
    session.SetUrl(cpr::Url{url});
    session.SetUserAgent(cpr::UserAgent{options.userAgent});
    session.SetVerifySsl(cpr::VerifySsl{options.verifySSL});
    session.SetConnectTimeout(cpr::ConnectTimeout{std::chrono::seconds(options.connectTimeoutSeconds)});
    if (options.lowSpeedTimeoutSeconds > 0) {
        session.SetLowSpeed(cpr::LowSpeed{1, options.lowSpeedTimeoutSeconds});
    }

    cpr::Header headers;
    for (const auto& [key, value] : options.headers) headers[key] = value;
    if (!options.cookies.empty()) {
        std::vector<std::string> pairs;
        for (const auto& [name, value] : options.cookies) pairs.push_back(name + "=" + value);
        headers["Cookie"] = StringUtils::join(pairs, "; ");
    }
    session.SetHeader(headers);

    if (!options.digestUser.empty()) {
        session.SetAuth(cpr::Authentication{options.digestUser, options.digestPassword, cpr::AuthMode::DIGEST});
    }

    // A digest challenge produces a 401 response before the real one.
    // Keep only the headers of the last response; only 2xx bodies reach onChunk.
    bool deliver = false;
    session.SetHeaderCallback(cpr::HeaderCallback{[&result, &deliver](const auto& line, intptr_t) -> bool {
        std::string header(line.data(), line.size());
        if (StringUtils::startsWith(header, "HTTP/")) {
            result.headers.clear();
            auto parts = StringUtils::split(header, ' ');
            int status = parts.size() > 1 ? StringUtils::parseInt(parts[1]) : 0;
            deliver = status >= 200 && status < 300;
            return true;
        }
        auto colon = header.find(':');
        if (colon != std::string::npos) {
            result.headers[StringUtils::toLower(StringUtils::trim(header.substr(0, colon)))] =
                StringUtils::trim(header.substr(colon + 1));
        }
        return true;
    }});

    session.SetWriteCallback(cpr::WriteCallback{[&result, &onChunk, &deliver](const auto& data, intptr_t) -> bool {
        if (!deliver) return true;
        result.bytesReceived += data.size();
        if (!onChunk(data.data(), data.size())) {
            result.aborted = true;
            return false;
        }
        return true;
    }});

    cpr::Response response = session.Get();

    result.statusCode = static_cast<int>(response.status_code);
    result.elapsed = response.elapsed;
    if (response.error.code != cpr::ErrorCode::OK && !result.aborted) {
        result.error = response.error.message.empty() ? "transfer failed" : response.error.message;
    }
    return result;
}

std::string HttpClient::urlEncode(const std::string& str) {
    CurlHandle curl;
    if (!curl) return str;
    char* output = curl_easy_escape(curl, str.c_str(), static_cast<int>(str.size()));
    if (!output) return str;
    std::string result(output);
    curl_free(output);
    return result;
}

} // namespace homestream::utils

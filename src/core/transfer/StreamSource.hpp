#pragma once

/**
 * StreamSource.hpp
 *
 * Byte producers for a transfer: a local file, a transcoder process or a
 * recording streamed from a receiver.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../../utils/HttpClient.hpp"
#include "../../utils/Subprocess.hpp"

namespace homestream::core {

/**
 * Receives the next chunk; return false to stop the source
 */
using ChunkHandler = std::function<bool(const char* data, size_t len)>;

/**
 * StreamSource - interface
 *
 * open() throws ConnectError when the bytes cannot be reached. pump()
 * delivers chunks on the calling thread until the stream ends or the
 * handler returns false, and throws ConnectError (transport) or
 * DecodeError (producing process) on failure.
 */
class StreamSource {
public:
    virtual ~StreamSource() = default;

    virtual void open(uint64_t offset) = 0;
    virtual void pump(const ChunkHandler& handler) = 0;

    /**
     * Bytes the transport declares it will deliver from the open offset.
     * Network sources only know this once pump() has started.
     */
    virtual std::optional<uint64_t> expectedLength() const = 0;

    virtual std::string describe() const = 0;
};

/**
 * FileSource - local file from an offset
 */
class FileSource : public StreamSource {
public:
    explicit FileSource(std::string path, size_t chunkSize = 256 * 1024);

    void open(uint64_t offset) override;
    void pump(const ChunkHandler& handler) override;
    std::optional<uint64_t> expectedLength() const override { return m_length; }
    std::string describe() const override { return m_path; }

private:
    std::string m_path;
    size_t m_chunkSize;
    uint64_t m_offset{0};
    std::optional<uint64_t> m_length;
};

/**
 * ProcessSource - stdout of an external process (the transcoder)
 *
 * Output of a process cannot be sought; open() rejects a non-zero offset.
 */
class ProcessSource : public StreamSource {
public:
    explicit ProcessSource(std::vector<std::string> command, size_t chunkSize = 64 * 1024);

    void open(uint64_t offset) override;
    void pump(const ChunkHandler& handler) override;
    std::optional<uint64_t> expectedLength() const override { return std::nullopt; }
    std::string describe() const override;

private:
    std::vector<std::string> m_command;
    size_t m_chunkSize;
    std::unique_ptr<utils::Subprocess> m_process;
};

/**
 * Receiver connection settings
 */
struct ReceiverEndpoint {
    std::string mak;                  // media access key (digest password)
    int connectTimeoutSeconds{30};
    int readTimeoutSeconds{180};
};

/**
 * ReceiverSource - recording streamed over HTTP(S) from a receiver
 *
 * Digest authentication as user "tivo" with the media access key, the
 * session cookie receivers expect, and no certificate verification
 * (receivers present self-signed certificates).
 */
class ReceiverSource : public StreamSource {
public:
    ReceiverSource(std::string url, ReceiverEndpoint endpoint);

    void open(uint64_t offset) override;
    void pump(const ChunkHandler& handler) override;
    std::optional<uint64_t> expectedLength() const override { return m_length; }
    std::string describe() const override { return m_url; }

    const std::string& url() const { return m_url; }

private:
    std::string m_url;
    ReceiverEndpoint m_endpoint;
    uint64_t m_offset{0};
    std::optional<uint64_t> m_length;
    utils::HttpClient m_client;
};

} // namespace homestream::core

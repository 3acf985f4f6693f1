#pragma once

/**
 * StreamSink.hpp
 *
 * Byte consumers for a transfer: the working file of a pull, or the
 * response writer of a serve.
 */

#include <cstdint>
#include <fstream>
#include <functional>
#include <string>

namespace homestream::core {

class StreamSink {
public:
    virtual ~StreamSink() = default;

    virtual bool open() = 0;
    // false when the consumer is gone or the write failed
    virtual bool write(const char* data, size_t len) = 0;
    virtual bool close() = 0;
    virtual std::string describe() const = 0;
};

/**
 * FileSink - writes to a file, truncating or appending
 */
class FileSink : public StreamSink {
public:
    explicit FileSink(std::string path, bool append = false);
    ~FileSink() override;

    bool open() override;
    bool write(const char* data, size_t len) override;
    bool close() override;
    std::string describe() const override { return m_path; }

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    bool m_append;
    std::ofstream m_file;
};

/**
 * CallbackSink - hands bytes to a writer function (HTTP responses)
 */
class CallbackSink : public StreamSink {
public:
    using Writer = std::function<bool(const char* data, size_t len)>;

    CallbackSink(Writer writer, std::string name);

    bool open() override { return true; }
    bool write(const char* data, size_t len) override { return m_writer(data, len); }
    bool close() override { return true; }
    std::string describe() const override { return m_name; }

private:
    Writer m_writer;
    std::string m_name;
};

} // namespace homestream::core

/**
 * StreamSink.cpp
 */

#include "StreamSink.hpp"

#include <filesystem>

namespace homestream::core {

// -- FileSink --

FileSink::FileSink(std::string path, bool append)
    : m_path(std::move(path)), m_append(append) {
}

FileSink::~FileSink() {
    if (m_file.is_open()) {
        m_file.close();
    }
}

bool FileSink::open() {
    std::error_code ec;
    auto parent = std::filesystem::path(m_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    auto mode = std::ios::binary | (m_append ? std::ios::app : std::ios::trunc);
    m_file.open(m_path, mode);
    return m_file.is_open();
}

bool FileSink::write(const char* data, size_t len) {
    m_file.write(data, static_cast<std::streamsize>(len));
    return static_cast<bool>(m_file);
}

bool FileSink::close() {
    if (!m_file.is_open()) return true;
    m_file.flush();
    bool ok = static_cast<bool>(m_file);
    m_file.close();
    return ok;
}

// -- CallbackSink --

CallbackSink::CallbackSink(Writer writer, std::string name)
    : m_writer(std::move(writer)), m_name(std::move(name)) {
}

} // namespace homestream::core

/**
 * StreamSource.cpp
 */

#include "StreamSource.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"

#include <filesystem>
#include <fstream>
#include <vector>

namespace homestream::core {

// -- FileSource --

FileSource::FileSource(std::string path, size_t chunkSize)
    : m_path(std::move(path)), m_chunkSize(chunkSize) {
}

void FileSource::open(uint64_t offset) {
    std::error_code ec;
    auto size = std::filesystem::file_size(m_path, ec);
    if (ec) {
        throw ConnectError("cannot open " + m_path + ": " + ec.message());
    }
    if (offset > size) {
        throw ConnectError("offset " + std::to_string(offset) + " beyond end of " + m_path);
    }
    m_offset = offset;
    m_length = size - offset;
}

void FileSource::pump(const ChunkHandler& handler) {
    std::ifstream file(m_path, std::ios::binary);
    if (!file.is_open()) {
        throw ConnectError("cannot open " + m_path);
    }
    file.seekg(static_cast<std::streamoff>(m_offset));

    std::vector<char> buffer(m_chunkSize);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto n = file.gcount();
        if (n <= 0) break;
        if (!handler(buffer.data(), static_cast<size_t>(n))) {
            return;
        }
    }

    if (file.bad()) {
        throw ConnectError("read error on " + m_path);
    }
}

// -- ProcessSource --

ProcessSource::ProcessSource(std::vector<std::string> command, size_t chunkSize)
    : m_command(std::move(command)), m_chunkSize(chunkSize) {
}

std::string ProcessSource::describe() const {
    return m_command.empty() ? "process" : m_command.front();
}

void ProcessSource::open(uint64_t offset) {
    if (offset != 0) {
        throw ConnectError("transcoded output is not seekable");
    }

    m_process = std::make_unique<utils::Subprocess>(m_command);
    if (!m_process->start()) {
        m_process.reset();
        throw DecodeError("cannot start " + describe());
    }
    LOG_DEBUG("Started {} (pid {})", m_process->commandLine(), m_process->pid());
}

void ProcessSource::pump(const ChunkHandler& handler) {
    if (!m_process) {
        throw DecodeError(describe() + " not started");
    }

    std::vector<char> buffer(m_chunkSize);
    bool stopped = false;

    while (true) {
        ssize_t n = m_process->read(buffer.data(), buffer.size());
        if (n <= 0) break;
        if (!handler(buffer.data(), static_cast<size_t>(n))) {
            stopped = true;
            m_process->terminate();
            break;
        }
    }

    int exitCode = m_process->wait();
    m_process.reset();

    if (!stopped && exitCode != 0) {
        throw DecodeError(describe() + " exited with status " + std::to_string(exitCode));
    }
}

// -- ReceiverSource --

ReceiverSource::ReceiverSource(std::string url, ReceiverEndpoint endpoint)
    : m_url(std::move(url)), m_endpoint(std::move(endpoint)) {
}

void ReceiverSource::open(uint64_t offset) {
    if (m_url.empty()) {
        throw ConnectError("no download URL");
    }
    m_offset = offset;
    m_length.reset();
}

void ReceiverSource::pump(const ChunkHandler& handler) {
    utils::HttpOptions options;
    options.digestUser = "tivo";
    options.digestPassword = m_endpoint.mak;
    options.cookies["sid"] = "ADEADDA7EDEBAC1E";
    options.verifySSL = false;
    options.connectTimeoutSeconds = m_endpoint.connectTimeoutSeconds;
    options.lowSpeedTimeoutSeconds = m_endpoint.readTimeoutSeconds;
    if (m_offset > 0) {
        options.headers["Range"] = "bytes=" + std::to_string(m_offset) + "-";
    }

    auto result = m_client.streamGet(m_url, options, handler);

    m_length = result.contentLength();

    if (!result.error.empty()) {
        throw ConnectError(m_url + ": " + result.error);
    }
    if (!result.aborted && (result.statusCode < 200 || result.statusCode >= 300)) {
        throw ConnectError(m_url + ": HTTP " + std::to_string(result.statusCode));
    }
}

} // namespace homestream::core

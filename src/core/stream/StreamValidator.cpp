/**
 * StreamValidator.cpp
 */

#include "StreamValidator.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>

namespace homestream::core::stream {

using utils::StringUtils;

namespace {
constexpr size_t kHeaderPeekBytes = 14;   // magic + flags + length field
}

nlohmann::json SyncError::toJson() const {
    return {
        {"offset", offset},
        {"packets", packetCount},
        {"bytes", packetCount * kTsPacketSize},
        {"foundByte", StringUtils::toHex(foundByte)},
        {"expectedByte", StringUtils::toHex(expectedByte())}
    };
}

StreamValidator::StreamValidator(bool skipContainerHeader)
    : m_skipHeader(skipContainerHeader) {
    if (!m_skipHeader) {
        m_payloadStart = 0;
    }
}

void StreamValidator::reset() {
    m_headerBytes.clear();
    m_payloadStart.reset();
    if (!m_skipHeader) {
        m_payloadStart = 0;
    }
    m_bytesFed = 0;
    m_packetsChecked = 0;
    m_inRun = false;
    m_errors.clear();
}

uint64_t StreamValidator::corruptPackets() const {
    uint64_t total = 0;
    for (const auto& e : m_errors) total += e.packetCount;
    return total;
}

void StreamValidator::readHeaderBytes(const uint8_t* data, size_t len) {
    size_t take = std::min(len, kHeaderPeekBytes - m_headerBytes.size());
    m_headerBytes.insert(m_headerBytes.end(), data, data + take);

    size_t magicBytes = std::min<size_t>(m_headerBytes.size(), 4);
    if (std::memcmp(m_headerBytes.data(), "TiVo", magicBytes) != 0) {
        m_payloadStart = 0;
        return;
    }

    if (auto header = TivoHeader::parse(m_headerBytes.data(), m_headerBytes.size())) {
        m_payloadStart = header->length;
    }
}

void StreamValidator::checkPacket(uint64_t offset, uint8_t first, size_t& newRuns) {
    ++m_packetsChecked;

    if (first == kTsSyncByte) {
        m_inRun = false;
        return;
    }

    if (m_inRun) {
        ++m_errors.back().packetCount;
        return;
    }

    m_inRun = true;
    m_errors.push_back(SyncError{offset, 1, first});
    ++newRuns;
}

size_t StreamValidator::feed(const uint8_t* data, size_t len) {
    if (len == 0) return 0;

    size_t newRuns = 0;
    const uint64_t chunkStart = m_bytesFed;

    auto scan = [&](uint64_t base, const uint8_t* bytes, size_t n) {
        const uint64_t start = *m_payloadStart;
        const uint64_t end = base + n;
        uint64_t p = start;
        if (base > start) {
            p = start + ((base - start + kTsPacketSize - 1) / kTsPacketSize) * kTsPacketSize;
        }
        for (; p < end; p += kTsPacketSize) {
            checkPacket(p, bytes[p - base], newRuns);
        }
    };

    if (!m_payloadStart) {
        readHeaderBytes(data, len);
        m_bytesFed += len;
        if (!m_payloadStart) {
            return 0;
        }

        // Bytes fed while the header was undecided are all in m_headerBytes
        scan(0, m_headerBytes.data(), static_cast<size_t>(chunkStart));
        scan(chunkStart, data, len);
        m_headerBytes.clear();
        return newRuns;
    }

    m_bytesFed += len;
    scan(chunkStart, data, len);
    return newRuns;
}

std::vector<SyncError> StreamValidator::validateBuffer(const uint8_t* data, size_t len,
                                                       bool skipContainerHeader) {
    StreamValidator validator(skipContainerHeader);
    validator.feed(data, len);
    return validator.errors();
}

std::optional<std::vector<SyncError>> StreamValidator::validateFile(const std::string& path,
                                                                    bool skipContainerHeader) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    StreamValidator validator(skipContainerHeader);
    std::vector<char> buffer(kTsPacketSize * 2788);   // ~512 KiB

    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto n = file.gcount();
        if (n <= 0) break;
        validator.feed(reinterpret_cast<const uint8_t*>(buffer.data()), static_cast<size_t>(n));
    }

    if (file.bad()) {
        return std::nullopt;
    }
    return validator.errors();
}

} // namespace homestream::core::stream

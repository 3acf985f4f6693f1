#pragma once

/**
 * StreamValidator.hpp
 *
 * Transport stream sync-byte checker.
 * Fed incrementally while a recording is pulled; chunk boundaries do not
 * have to line up with packets.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "TivoHeader.hpp"

namespace homestream::core::stream {

/**
 * A run of consecutive packets that do not start with the sync byte
 */
struct SyncError {
    uint64_t offset{0};        // absolute stream offset of the first bad packet
    uint64_t packetCount{0};
    uint8_t foundByte{0};      // first byte of the first bad packet

    uint8_t expectedByte() const { return kTsSyncByte; }

    nlohmann::json toJson() const;
};

/**
 * StreamValidator - incremental sync check
 *
 * If the stream starts with a TiVo container header, packet alignment
 * starts after it. A packet is checked as soon as its first byte arrives.
 */
class StreamValidator {
public:
    explicit StreamValidator(bool skipContainerHeader = true);

    /**
     * Check the next chunk of the stream
     * @return Number of new error runs started in this chunk
     */
    size_t feed(const uint8_t* data, size_t len);

    void reset();

    const std::vector<SyncError>& errors() const { return m_errors; }
    bool clean() const { return m_errors.empty(); }

    uint64_t bytesFed() const { return m_bytesFed; }
    uint64_t packetsChecked() const { return m_packetsChecked; }
    uint64_t corruptPackets() const;

    /**
     * Offset where packet alignment starts (header length, or 0),
     * nullopt until enough bytes were fed to know
     */
    std::optional<uint64_t> payloadStart() const { return m_payloadStart; }

    static std::vector<SyncError> validateBuffer(const uint8_t* data, size_t len,
                                                 bool skipContainerHeader = true);

    /**
     * Validate a file on disk
     * @return nullopt if the file cannot be read
     */
    static std::optional<std::vector<SyncError>> validateFile(const std::string& path,
                                                              bool skipContainerHeader = true);

private:
    void readHeaderBytes(const uint8_t* data, size_t len);
    void checkPacket(uint64_t offset, uint8_t first, size_t& newRuns);

    bool m_skipHeader;
    std::vector<uint8_t> m_headerBytes;
    std::optional<uint64_t> m_payloadStart;

    uint64_t m_bytesFed{0};
    uint64_t m_packetsChecked{0};
    bool m_inRun{false};
    std::vector<SyncError> m_errors;
};

} // namespace homestream::core::stream

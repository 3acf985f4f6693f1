#pragma once

/**
 * TivoHeader.hpp
 *
 * Container header that prefixes recordings pulled from a receiver
 * without decoding.
 *
 *   0..3   "TiVo"
 *   7      flags (0x20 = transport stream payload)
 *   10..13 header length, big-endian, including these 16 bytes
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace homestream::core::stream {

constexpr size_t kTsPacketSize = 188;
constexpr uint8_t kTsSyncByte = 0x47;

constexpr size_t kTivoHeaderPrefix = 16;

struct TivoHeader {
    uint32_t length{0};
    bool transportStream{false};

    /**
     * Parse the fixed part of the header
     * @return nullopt if data does not start with the magic or is too short
     */
    static std::optional<TivoHeader> parse(const uint8_t* data, size_t len);

    /**
     * Read the header of a file on disk
     */
    static std::optional<TivoHeader> readFile(const std::string& path);

    static bool hasMagic(const uint8_t* data, size_t len);
};

} // namespace homestream::core::stream

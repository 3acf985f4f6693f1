/**
 * TivoHeader.cpp
 */

#include "TivoHeader.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>

namespace homestream::core::stream {

bool TivoHeader::hasMagic(const uint8_t* data, size_t len) {
    return len >= 4 && std::memcmp(data, "TiVo", 4) == 0;
}

std::optional<TivoHeader> TivoHeader::parse(const uint8_t* data, size_t len) {
    if (len < 14 || !hasMagic(data, len)) {
        return std::nullopt;
    }

    TivoHeader header;
    header.transportStream = (data[7] & 0x20) != 0;
    header.length = (static_cast<uint32_t>(data[10]) << 24) |
                    (static_cast<uint32_t>(data[11]) << 16) |
                    (static_cast<uint32_t>(data[12]) << 8) |
                    static_cast<uint32_t>(data[13]);
    header.length = std::max<uint32_t>(header.length, kTivoHeaderPrefix);
    return header;
}

std::optional<TivoHeader> TivoHeader::readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    uint8_t prefix[kTivoHeaderPrefix];
    file.read(reinterpret_cast<char*>(prefix), sizeof(prefix));
    return parse(prefix, static_cast<size_t>(file.gcount()));
}

} // namespace homestream::core::stream

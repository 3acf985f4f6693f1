#pragma once

#include <string>
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>

namespace homestream::utils {

class HashUtils {
public:
    static std::string sha1String(const std::string& data) {
        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) return "";

        if (EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx);
            return "";
        }

        EVP_DigestUpdate(ctx, data.data(), data.size());

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        int ok = EVP_DigestFinal_ex(ctx, hash, &hashLen);
        EVP_MD_CTX_free(ctx);
        if (ok != 1) return "";

        std::ostringstream oss;
        for (unsigned int i = 0; i < hashLen; ++i) {
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
        }
        return oss.str();
    }
};

} // namespace homestream::utils

// src/Utils/CryptoUtils.cpp
#include "Utils/CryptoUtils.h"
#include "Utils/StringUtils.h"
#include "Utils/Logger.h"

#include <openssl/sha.h>
#include <openssl/rand.h>
#include <openssl/err.h>

namespace CryptoUtils {

std::string SHA256Hex(const std::vector<uint8_t>& data) {
    uint8_t hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);
    return StringUtils::ToHex(hash, SHA256_DIGEST_LENGTH);
}

std::string SHA256Hex(const std::string& text) {
    return SHA256Hex(std::vector<uint8_t>(text.begin(), text.end()));
}

std::vector<uint8_t> GenerateRandomBytes(size_t length) {
    std::vector<uint8_t> out(length);
    if (length == 0) return out;
    if (RAND_bytes(out.data(), static_cast<int>(length)) != 1) {
        Logger::Error("CryptoUtils: RAND_bytes failed (err %lu)", ERR_get_error());
        return {};
    }
    return out;
}

std::string GenerateToken(size_t byteCount) {
    auto bytes = GenerateRandomBytes(byteCount);
    if (bytes.empty()) return "";
    return StringUtils::ToHex(bytes.data(), bytes.size());
}

}

// src/Utils/CryptoUtils.h
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace CryptoUtils {

    // SHA-256 of input data as lowercase hex
    std::string SHA256Hex(const std::vector<uint8_t>& data);
    std::string SHA256Hex(const std::string& text);

    // Cryptographically secure random bytes; empty vector if the RNG fails
    std::vector<uint8_t> GenerateRandomBytes(size_t length);

    // Random opaque token of byteCount bytes, hex encoded
    std::string GenerateToken(size_t byteCount = 16);
}

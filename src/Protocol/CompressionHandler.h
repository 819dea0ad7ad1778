// src/Protocol/CompressionHandler.h
#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>

// Compression algorithms supported on the wire. Values are sent as a u8.
enum class CompressionAlgorithm : uint8_t {
    NONE = 0,
    ZLIB = 1,
    LZ4  = 2
};

class CompressionHandler {
public:
    // Compress raw data with specified algorithm.
    // LZ4 output carries a 4-byte little-endian original-size prefix.
    static bool Compress(const std::vector<uint8_t>& input,
                         std::vector<uint8_t>& output,
                         CompressionAlgorithm algo = CompressionAlgorithm::ZLIB,
                         int level = -1  // algorithm-specific compression level
    );

    // Decompress data compressed by Compress(). Output larger than
    // maxOutput is treated as corrupt.
    static bool Decompress(const std::vector<uint8_t>& input,
                           std::vector<uint8_t>& output,
                           CompressionAlgorithm algo = CompressionAlgorithm::ZLIB,
                           size_t maxOutput = 4 * 1024 * 1024
    );

    static const char* ToString(CompressionAlgorithm algo);
};

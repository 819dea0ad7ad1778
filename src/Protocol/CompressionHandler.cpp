// src/Protocol/CompressionHandler.cpp
#include "Protocol/CompressionHandler.h"
#include "Utils/Logger.h"
#include <algorithm>
#include <cstring>

#include <zlib.h>
#include <lz4.h>

bool CompressionHandler::Compress(const std::vector<uint8_t>& input,
                                  std::vector<uint8_t>& output,
                                  CompressionAlgorithm algo,
                                  int level)
{
    switch (algo) {
        case CompressionAlgorithm::NONE:
            output = input;
            return true;

        case CompressionAlgorithm::ZLIB: {
            uLongf destLen = compressBound(static_cast<uLong>(input.size()));
            output.resize(destLen);
            int ret = ::compress2(output.data(), &destLen,
                                  input.data(), static_cast<uLong>(input.size()),
                                  level < 0 ? Z_DEFAULT_COMPRESSION : level);
            if (ret != Z_OK) {
                Logger::Error("CompressionHandler: zlib compress2 failed (code %d)", ret);
                return false;
            }
            output.resize(destLen);
            return true;
        }

        case CompressionAlgorithm::LZ4: {
            const int srcSize = static_cast<int>(input.size());
            const int maxDst = LZ4_compressBound(srcSize);
            output.resize(4 + static_cast<size_t>(maxDst));
            uint32_t origSize = static_cast<uint32_t>(input.size());
            std::memcpy(output.data(), &origSize, 4);
            int compressedSize = LZ4_compress_default(
                reinterpret_cast<const char*>(input.data()),
                reinterpret_cast<char*>(output.data()) + 4,
                srcSize, maxDst);
            if (compressedSize <= 0 && srcSize > 0) {
                Logger::Error("CompressionHandler: LZ4_compress_default failed");
                return false;
            }
            output.resize(4 + static_cast<size_t>(compressedSize));
            return true;
        }
    }
    return false;
}

bool CompressionHandler::Decompress(const std::vector<uint8_t>& input,
                                    std::vector<uint8_t>& output,
                                    CompressionAlgorithm algo,
                                    size_t maxOutput)
{
    switch (algo) {
        case CompressionAlgorithm::NONE:
            if (input.size() > maxOutput) {
                Logger::Error("CompressionHandler: %zu raw bytes exceed limit", input.size());
                return false;
            }
            output = input;
            return true;

        case CompressionAlgorithm::ZLIB: {
            // Size is not carried; grow the buffer until it fits
            uLongf capacity = static_cast<uLongf>(std::min<size_t>(input.size() * 4 + 64, maxOutput));
            int ret = Z_BUF_ERROR;
            while (true) {
                output.resize(capacity);
                uLongf destLen = capacity;
                ret = ::uncompress(output.data(), &destLen,
                                   input.data(), static_cast<uLong>(input.size()));
                if (ret == Z_OK) {
                    output.resize(destLen);
                    return true;
                }
                if (ret != Z_BUF_ERROR || capacity >= maxOutput) break;
                capacity = static_cast<uLongf>(std::min<size_t>(capacity * 2, maxOutput));
            }
            Logger::Error("CompressionHandler: zlib uncompress failed (code %d)", ret);
            output.clear();
            return false;
        }

        case CompressionAlgorithm::LZ4: {
            if (input.size() < 4) {
                Logger::Error("CompressionHandler: LZ4 input too small for size prefix");
                return false;
            }
            uint32_t origSize;
            std::memcpy(&origSize, input.data(), 4);
            if (origSize > maxOutput) {
                Logger::Error("CompressionHandler: LZ4 size prefix %u exceeds limit", origSize);
                return false;
            }
            output.resize(origSize);
            int decoded = LZ4_decompress_safe(
                reinterpret_cast<const char*>(input.data()) + 4,
                reinterpret_cast<char*>(output.data()),
                static_cast<int>(input.size() - 4), static_cast<int>(origSize));
            if (decoded < 0 || static_cast<uint32_t>(decoded) != origSize) {
                Logger::Error("CompressionHandler: LZ4_decompress_safe failed (code %d)", decoded);
                output.clear();
                return false;
            }
            return true;
        }
    }
    return false;
}

const char* CompressionHandler::ToString(CompressionAlgorithm algo) {
    switch (algo) {
        case CompressionAlgorithm::NONE: return "none";
        case CompressionAlgorithm::ZLIB: return "zlib";
        case CompressionAlgorithm::LZ4:  return "lz4";
    }
    return "unknown";
}

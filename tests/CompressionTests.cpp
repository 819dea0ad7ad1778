// tests/CompressionTests.cpp
// Unit tests for CompressionHandler (none, zlib, lz4)

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <random>
#include <vector>
#include "Protocol/CompressionHandler.h"

class CompressionTests : public ::testing::TestWithParam<CompressionAlgorithm> {
protected:
    // Half repetitive, half noise
    static std::vector<uint8_t> SampleData(size_t size) {
        std::vector<uint8_t> data(size);
        std::mt19937 rng(7);
        for (size_t i = 0; i < size; ++i) {
            data[i] = i < size / 2 ? static_cast<uint8_t>(i % 16) : static_cast<uint8_t>(rng());
        }
        return data;
    }
};

TEST_P(CompressionTests, CompressDecompress_RestoresInput) {
    auto input = SampleData(10000);
    std::vector<uint8_t> packed;
    ASSERT_TRUE(CompressionHandler::Compress(input, packed, GetParam()));

    std::vector<uint8_t> restored;
    ASSERT_TRUE(CompressionHandler::Decompress(packed, restored, GetParam()));
    EXPECT_EQ(restored, input);
}

TEST_P(CompressionTests, OutputLimit_Enforced) {
    auto input = SampleData(4096);
    std::vector<uint8_t> packed;
    ASSERT_TRUE(CompressionHandler::Compress(input, packed, GetParam()));

    std::vector<uint8_t> restored;
    EXPECT_FALSE(CompressionHandler::Decompress(packed, restored, GetParam(), 1024))
        << CompressionHandler::ToString(GetParam());
}

INSTANTIATE_TEST_SUITE_P(Algorithms, CompressionTests,
                         ::testing::Values(CompressionAlgorithm::NONE,
                                           CompressionAlgorithm::ZLIB,
                                           CompressionAlgorithm::LZ4));

TEST(CompressionHandlerTests, Zlib_ShrinksRepetitiveData) {
    std::vector<uint8_t> zeros(8192, 0);
    std::vector<uint8_t> packed;
    ASSERT_TRUE(CompressionHandler::Compress(zeros, packed, CompressionAlgorithm::ZLIB, 9));
    EXPECT_LT(packed.size(), zeros.size() / 10);
}

TEST(CompressionHandlerTests, Lz4_CarriesSizePrefix) {
    std::vector<uint8_t> input(300, 0xAB);
    std::vector<uint8_t> packed;
    ASSERT_TRUE(CompressionHandler::Compress(input, packed, CompressionAlgorithm::LZ4));
    ASSERT_GE(packed.size(), 4u);
    EXPECT_EQ(packed[0], 300 & 0xFF);
    EXPECT_EQ(packed[1], 300 >> 8);
}

TEST(CompressionHandlerTests, CorruptInput_Rejected) {
    std::vector<uint8_t> garbage = {0x12, 0x34, 0x56, 0x78, 0x9A, 0xBC};
    std::vector<uint8_t> out;
    EXPECT_FALSE(CompressionHandler::Decompress(garbage, out, CompressionAlgorithm::ZLIB));
    EXPECT_TRUE(out.empty());

    EXPECT_FALSE(CompressionHandler::Decompress({1, 2}, out, CompressionAlgorithm::LZ4))
        << "shorter than the size prefix";

    std::vector<uint8_t> input(512, 0x5A);
    std::vector<uint8_t> packed;
    ASSERT_TRUE(CompressionHandler::Compress(input, packed, CompressionAlgorithm::LZ4));
    packed.resize(packed.size() - 2);
    EXPECT_FALSE(CompressionHandler::Decompress(packed, out, CompressionAlgorithm::LZ4));
}

TEST(CompressionHandlerTests, Names) {
    EXPECT_STREQ(CompressionHandler::ToString(CompressionAlgorithm::NONE), "none");
    EXPECT_STREQ(CompressionHandler::ToString(CompressionAlgorithm::ZLIB), "zlib");
    EXPECT_STREQ(CompressionHandler::ToString(CompressionAlgorithm::LZ4), "lz4");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

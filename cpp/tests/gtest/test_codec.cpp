// =============================================================================
// Weight Codec Tests
// =============================================================================

#include <gtest/gtest.h>
#include <filesystem>

#include "fedrelay/codec.hpp"
#include "fedrelay/error.hpp"

using namespace fedrelay;

TEST(CodecTest, DecodesLittleEndianFloat32) {
    // 1.0f = 0x3F800000, -2.0f = 0xC0000000
    const Bytes bytes = {0x00, 0x00, 0x80, 0x3F, 0x00, 0x00, 0x00, 0xC0};
    WeightVector w = codec::decode_weights(bytes);
    ASSERT_EQ(w.size(), 2u);
    EXPECT_EQ(w[0], 1.0f);
    EXPECT_EQ(w[1], -2.0f);
}

TEST(CodecTest, EncodesLittleEndianFloat32) {
    Bytes bytes = codec::encode_weights({0.5f});
    // 0.5f = 0x3F000000
    EXPECT_EQ(bytes, (Bytes{0x00, 0x00, 0x00, 0x3F}));
}

TEST(CodecTest, ByteLengthIsFourTimesVectorLength) {
    WeightVector w(37, 0.25f);
    EXPECT_EQ(codec::encode_weights(w).size(), 37 * codec::kBytesPerWeight);
}

TEST(CodecTest, RejectsEmptyPayload) {
    EXPECT_THROW(codec::decode_weights(Bytes{}), WireFormatError);
}

TEST(CodecTest, RejectsTruncatedPayload) {
    EXPECT_THROW(codec::decode_weights(Bytes{0x00, 0x00, 0x80}), WireFormatError);
    EXPECT_THROW(codec::decode_weights(Bytes(10, 0x00)), WireFormatError);
}

TEST(CodecTest, WeightsFileRoundTrip) {
    const auto path = std::filesystem::temp_directory_path() / "fedrelay_codec_test.bin";
    const WeightVector w = {1.5f, -0.125f, 3.0e-7f};
    codec::write_weights_file(path.string(), w);
    EXPECT_EQ(std::filesystem::file_size(path), 12u);
    EXPECT_EQ(codec::read_weights_file(path.string()), w);
    std::filesystem::remove(path);
}

TEST(CodecTest, MissingWeightsFileThrows) {
    EXPECT_THROW(codec::read_weights_file("/nonexistent/fedrelay/localWeights.bin"), FedRelayException);
}

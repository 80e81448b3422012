#include <gtest/gtest.h>
#include "content_id.h"
#include <string>
#include <vector>

namespace cverify {
namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

// ============================================================================
// Known vectors
// ============================================================================

TEST(ContentIdTest, RawEmptyInput) {
    EXPECT_EQ(compute_content_id({}, ContentEncoding::RAW),
              "bafkreihdwdcefgh4dqkjv67uzcmw7ojee6xedzdetojuzjevtenxquvyku");
}

TEST(ContentIdTest, RawHelloWorld) {
    EXPECT_EQ(compute_content_id(bytes_of("hello world"), ContentEncoding::RAW),
              "bafkreifzjut3te2nhyekklss27nh3k72ysco7y32koao5eei66wof36n5e");
}

TEST(ContentIdTest, DagCborEmptyInput) {
    EXPECT_EQ(compute_content_id({}, ContentEncoding::DAG_CBOR),
              "bafyreigdmqpykrgxyaxtlafqpqhzrb7qy2rh75nldvfd4kok6gl47quzvy");
}

TEST(ContentIdTest, DagCborHelloWorld) {
    EXPECT_EQ(compute_content_id(bytes_of("hello world"), ContentEncoding::DAG_CBOR),
              "bafyreicoej4zpgj5lhby7j7gowdmy2f3ud3lwinknoqfi7y2dm6ducfjp4");
}

TEST(ContentIdTest, DagCborUsesOneByteLengthAbove23Bytes) {
    // Given: 30 bytes, which needs the 0x58 length prefix in CBOR
    std::vector<uint8_t> data;
    for (uint8_t i = 0; i < 30; ++i) {
        data.push_back(i);
    }

    std::vector<uint8_t> block = cid_utils::cbor_byte_string(data);
    ASSERT_EQ(block.size(), 32u);
    EXPECT_EQ(block[0], 0x58);
    EXPECT_EQ(block[1], 0x1e);

    EXPECT_EQ(compute_content_id(data, ContentEncoding::DAG_CBOR),
              "bafyreigf6ojwmfryz5gnax2bqttgviapghct37wzqqnv7r6ztavqx2hugu");
}

TEST(ContentIdTest, PreEncodedDagCborBlock) {
    // Given: a block that is already the CBOR text string "aaa"
    const uint8_t block[] = {0x63, 'a', 'a', 'a'};

    EXPECT_EQ(make_content_id(CODEC_DAG_CBOR, block, sizeof(block)),
              "bafyreibajxuqjmh6az6vne5jqmmpgb6q6wpoffusbsmdfrokjoptkxk6dy");
}

// ============================================================================
// Properties
// ============================================================================

TEST(ContentIdTest, Deterministic) {
    auto data = bytes_of("contract bytecode");
    EXPECT_EQ(compute_content_id(data, ContentEncoding::RAW),
              compute_content_id(data, ContentEncoding::RAW));
    EXPECT_EQ(compute_content_id(data, ContentEncoding::DAG_CBOR),
              compute_content_id(data, ContentEncoding::DAG_CBOR));
}

TEST(ContentIdTest, OneByteChangeChangesIdentifier) {
    std::string a = compute_content_id(bytes_of("hello world"), ContentEncoding::RAW);
    std::string b = compute_content_id(bytes_of("hello worle"), ContentEncoding::RAW);

    EXPECT_NE(a, b);
    EXPECT_EQ(b, "bafkreiapymhhgwqcfcrrzo5zngmiwt2q4axhg74xt4er27jcjn3fiq7v2q");
}

TEST(ContentIdTest, EncodingsNeverCollide) {
    auto data = bytes_of("same bytes");
    EXPECT_NE(compute_content_id(data, ContentEncoding::RAW),
              compute_content_id(data, ContentEncoding::DAG_CBOR));
}

TEST(ContentIdTest, LargeInputUsesWiderCborHeader) {
    std::vector<uint8_t> data(70000, 0xab);
    std::vector<uint8_t> block = cid_utils::cbor_byte_string(data);

    // 0x5a + 4-byte big-endian length
    ASSERT_EQ(block.size(), data.size() + 5);
    EXPECT_EQ(block[0], 0x5a);
    EXPECT_EQ(block[1], 0x00);
    EXPECT_EQ(block[2], 0x01);
    EXPECT_EQ(block[3], 0x11);
    EXPECT_EQ(block[4], 0x70);
}

// ============================================================================
// Decoding
// ============================================================================

TEST(ContentIdTest, DecodeRecoversCodecAndDigest) {
    ContentIdInfo info = decode_content_id("bafkreifzjut3te2nhyekklss27nh3k72ysco7y32koao5eei66wof36n5e");

    EXPECT_EQ(info.version, 1u);
    EXPECT_EQ(info.codec, CODEC_RAW);
    EXPECT_EQ(info.hash_code, MULTIHASH_SHA2_256);
    ASSERT_EQ(info.digest.size(), 32u);
    // sha256("hello world") starts with b94d27b9
    EXPECT_EQ(info.digest[0], 0xb9);
    EXPECT_EQ(info.digest[1], 0x4d);
    EXPECT_EQ(info.digest[2], 0x27);
    EXPECT_EQ(info.digest[3], 0xb9);
}

TEST(ContentIdTest, EncodingOfFollowsCodec) {
    EXPECT_EQ(encoding_of("bafkreihdwdcefgh4dqkjv67uzcmw7ojee6xedzdetojuzjevtenxquvyku"), ContentEncoding::RAW);
    EXPECT_EQ(encoding_of("bafyreigdmqpykrgxyaxtlafqpqhzrb7qy2rh75nldvfd4kok6gl47quzvy"), ContentEncoding::DAG_CBOR);
}

TEST(ContentIdTest, DecodeRejectsMalformedInput) {
    EXPECT_THROW(decode_content_id(""), ContentIdError);
    EXPECT_THROW(decode_content_id("Qmabc"), ContentIdError);       // not base32 multibase
    EXPECT_THROW(decode_content_id("bafkrei!!!"), ContentIdError);  // bad alphabet
    EXPECT_THROW(decode_content_id("bafkreihdwdcefgh4dqkjv67uzcmw7oj"), ContentIdError);  // truncated digest
}

TEST(ContentIdTest, EncodingNames) {
    EXPECT_EQ(encoding_to_string(ContentEncoding::RAW), "raw");
    EXPECT_EQ(encoding_to_string(ContentEncoding::DAG_CBOR), "dag-cbor");
    EXPECT_EQ(encoding_from_string("dag-cbor"), ContentEncoding::DAG_CBOR);
    EXPECT_THROW(encoding_from_string("dag-pb"), std::invalid_argument);
}

// ============================================================================
// Helpers
// ============================================================================

TEST(ContentIdTest, VarintEncoding) {
    std::vector<uint8_t> out;
    cid_utils::append_varint(out, 0x55);
    cid_utils::append_varint(out, 300);
    EXPECT_EQ(out, (std::vector<uint8_t>{0x55, 0xac, 0x02}));
}

TEST(ContentIdTest, Base32RoundTrip) {
    std::vector<uint8_t> data = {0x00, 0xff, 0x10, 0x20, 0x7f};
    std::string text = cid_utils::base32_encode(data);
    EXPECT_EQ(cid_utils::base32_decode(text), data);
}

} // namespace
} // namespace cverify

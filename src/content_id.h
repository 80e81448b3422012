#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

namespace cverify {

// How bytes are wrapped before hashing. Must match what the chain used when
// it recorded the deployed bytecode, otherwise identifiers never compare equal.
enum class ContentEncoding {
    RAW,        // multicodec 0x55, digest over the bytes themselves
    DAG_CBOR    // multicodec 0x71, digest over a CBOR byte string holding the bytes
};

// Multicodec codes used in CIDv1
constexpr uint64_t CODEC_RAW = 0x55;
constexpr uint64_t CODEC_DAG_CBOR = 0x71;
constexpr uint64_t MULTIHASH_SHA2_256 = 0x12;

class ContentIdError : public std::runtime_error {
public:
    explicit ContentIdError(const std::string& message)
        : std::runtime_error("Invalid content identifier: " + message) {}
};

// Decoded CIDv1
struct ContentIdInfo {
    uint64_t version = 0;
    uint64_t codec = 0;
    uint64_t hash_code = 0;
    std::vector<uint8_t> digest;
};

// CIDv1 (base32 multibase, SHA2-256 multihash) of `data` under `encoding`.
// Pure: identical input always yields the identical string.
std::string compute_content_id(const std::vector<uint8_t>& data, ContentEncoding encoding);

// CIDv1 for an already encoded block with the given multicodec
std::string make_content_id(uint64_t codec, const uint8_t* block, size_t len);

// Parse a base32 CIDv1 string; throws ContentIdError
ContentIdInfo decode_content_id(const std::string& cid);

// Encoding implied by a CID's codec; throws ContentIdError for other codecs
ContentEncoding encoding_of(const std::string& cid);

std::string encoding_to_string(ContentEncoding encoding);
ContentEncoding encoding_from_string(const std::string& name);

namespace cid_utils {
    void append_varint(std::vector<uint8_t>& out, uint64_t value);
    std::vector<uint8_t> cbor_byte_string(const std::vector<uint8_t>& data);
    std::string base32_encode(const std::vector<uint8_t>& data);
    std::vector<uint8_t> base32_decode(const std::string& text);
}

} // namespace cverify

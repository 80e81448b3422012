#include "content_id.h"
#include "file_utils.h"

namespace cverify {

namespace {

const char BASE32_ALPHABET[] = "abcdefghijklmnopqrstuvwxyz234567";
constexpr size_t SHA2_256_LENGTH = 32;

uint64_t read_varint(const std::vector<uint8_t>& data, size_t& pos) {
    uint64_t value = 0;
    int shift = 0;
    while (true) {
        if (pos >= data.size()) {
            throw ContentIdError("truncated varint");
        }
        if (shift > 63) {
            throw ContentIdError("varint overflow");
        }
        uint8_t byte = data[pos++];
        value |= static_cast<uint64_t>(byte & 0x7f) << shift;
        if ((byte & 0x80) == 0) {
            return value;
        }
        shift += 7;
    }
}

} // namespace

namespace cid_utils {

void append_varint(std::vector<uint8_t>& out, uint64_t value) {
    while (value >= 0x80) {
        out.push_back(static_cast<uint8_t>((value & 0x7f) | 0x80));
        value >>= 7;
    }
    out.push_back(static_cast<uint8_t>(value));
}

// CBOR major type 2 with the shortest length header
std::vector<uint8_t> cbor_byte_string(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> out;
    uint64_t len = data.size();
    const uint8_t major = 0x40;

    if (len < 24) {
        out.push_back(static_cast<uint8_t>(major | len));
    } else {
        int width;
        if (len <= 0xff) {
            out.push_back(major | 24);
            width = 1;
        } else if (len <= 0xffff) {
            out.push_back(major | 25);
            width = 2;
        } else if (len <= 0xffffffffULL) {
            out.push_back(major | 26);
            width = 4;
        } else {
            out.push_back(major | 27);
            width = 8;
        }
        for (int i = width - 1; i >= 0; --i) {
            out.push_back(static_cast<uint8_t>((len >> (8 * i)) & 0xff));
        }
    }

    out.insert(out.end(), data.begin(), data.end());
    return out;
}

// RFC 4648 alphabet, lowercase, no padding
std::string base32_encode(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve((data.size() * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;
    for (uint8_t byte : data) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            out += BASE32_ALPHABET[(buffer >> (bits - 5)) & 0x1f];
            bits -= 5;
        }
    }
    if (bits > 0) {
        out += BASE32_ALPHABET[(buffer << (5 - bits)) & 0x1f];
    }
    return out;
}

std::vector<uint8_t> base32_decode(const std::string& text) {
    std::vector<uint8_t> out;
    uint32_t buffer = 0;
    int bits = 0;

    for (char c : text) {
        int value;
        if (c >= 'a' && c <= 'z') {
            value = c - 'a';
        } else if (c >= 'A' && c <= 'Z') {
            value = c - 'A';
        } else if (c >= '2' && c <= '7') {
            value = c - '2' + 26;
        } else {
            throw ContentIdError(std::string("bad base32 character '") + c + "'");
        }
        buffer = (buffer << 5) | static_cast<uint32_t>(value);
        bits += 5;
        if (bits >= 8) {
            out.push_back(static_cast<uint8_t>((buffer >> (bits - 8)) & 0xff));
            bits -= 8;
        }
    }
    return out;
}

} // namespace cid_utils

std::string make_content_id(uint64_t codec, const uint8_t* block, size_t len) {
    std::vector<uint8_t> digest = FileUtils::sha256(block, len);

    std::vector<uint8_t> cid;
    cid_utils::append_varint(cid, 1);  // CID version
    cid_utils::append_varint(cid, codec);
    cid_utils::append_varint(cid, MULTIHASH_SHA2_256);
    cid_utils::append_varint(cid, digest.size());
    cid.insert(cid.end(), digest.begin(), digest.end());

    return "b" + cid_utils::base32_encode(cid);
}

std::string compute_content_id(const std::vector<uint8_t>& data, ContentEncoding encoding) {
    switch (encoding) {
        case ContentEncoding::RAW:
            return make_content_id(CODEC_RAW, data.data(), data.size());
        case ContentEncoding::DAG_CBOR: {
            std::vector<uint8_t> block = cid_utils::cbor_byte_string(data);
            return make_content_id(CODEC_DAG_CBOR, block.data(), block.size());
        }
    }
    throw std::invalid_argument("Unsupported content encoding");
}

ContentIdInfo decode_content_id(const std::string& cid) {
    if (cid.size() < 2 || cid[0] != 'b') {
        throw ContentIdError("expected base32 multibase prefix 'b'");
    }

    std::vector<uint8_t> bytes = cid_utils::base32_decode(cid.substr(1));
    size_t pos = 0;

    ContentIdInfo info;
    info.version = read_varint(bytes, pos);
    if (info.version != 1) {
        throw ContentIdError("unsupported CID version " + std::to_string(info.version));
    }
    info.codec = read_varint(bytes, pos);
    info.hash_code = read_varint(bytes, pos);
    uint64_t digest_len = read_varint(bytes, pos);

    if (bytes.size() - pos != digest_len) {
        throw ContentIdError("digest length mismatch");
    }
    if (info.hash_code == MULTIHASH_SHA2_256 && digest_len != SHA2_256_LENGTH) {
        throw ContentIdError("sha2-256 digest must be 32 bytes");
    }
    info.digest.assign(bytes.begin() + static_cast<std::ptrdiff_t>(pos), bytes.end());
    return info;
}

ContentEncoding encoding_of(const std::string& cid) {
    ContentIdInfo info = decode_content_id(cid);
    if (info.codec == CODEC_RAW) {
        return ContentEncoding::RAW;
    }
    if (info.codec == CODEC_DAG_CBOR) {
        return ContentEncoding::DAG_CBOR;
    }
    throw ContentIdError("unsupported codec " + std::to_string(info.codec));
}

std::string encoding_to_string(ContentEncoding encoding) {
    switch (encoding) {
        case ContentEncoding::RAW: return "raw";
        case ContentEncoding::DAG_CBOR: return "dag-cbor";
    }
    return "raw";
}

ContentEncoding encoding_from_string(const std::string& name) {
    if (name == "raw") return ContentEncoding::RAW;
    if (name == "dag-cbor") return ContentEncoding::DAG_CBOR;
    throw std::invalid_argument("Unknown content encoding: " + name);
}

} // namespace cverify

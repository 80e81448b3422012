#include "worker_identity.h"
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <sys/stat.h>
#include <cstdio>

namespace cverify {

namespace {

constexpr size_t ED25519_KEY_SIZE = 32;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

struct PkeyDeleter {
    void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free_all(bio); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

// Copies both raw halves out of an Ed25519 key
bool extract_raw_keys(EVP_PKEY* pkey, std::vector<unsigned char>& private_key,
                      std::vector<unsigned char>& public_key) {
    size_t pub_len = ED25519_KEY_SIZE;
    public_key.resize(pub_len);
    if (EVP_PKEY_get_raw_public_key(pkey, public_key.data(), &pub_len) <= 0) {
        return false;
    }

    size_t priv_len = ED25519_KEY_SIZE;
    private_key.resize(priv_len);
    return EVP_PKEY_get_raw_private_key(pkey, private_key.data(), &priv_len) > 0;
}

} // namespace

std::string Attestation::message() const {
    return "cverify-attestation-v1\n" + address + "\n" + content_id + "\n" +
           git_commit.value_or("") + "\n" + std::to_string(verified_at_ms);
}

std::string WorkerIdentity::base64_encode(const unsigned char* data, size_t len) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    std::unique_ptr<BIO, BioDeleter> bio(BIO_push(b64, BIO_new(BIO_s_mem())));

    BIO_write(bio.get(), data, static_cast<int>(len));
    if (BIO_flush(bio.get()) != 1) {
        return "";
    }

    BUF_MEM* buffer = nullptr;
    BIO_get_mem_ptr(bio.get(), &buffer);
    return std::string(buffer->data, buffer->length);
}

std::vector<unsigned char> WorkerIdentity::base64_decode(const std::string& encoded) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    std::unique_ptr<BIO, BioDeleter> bio(
        BIO_push(b64, BIO_new_mem_buf(encoded.data(), static_cast<int>(encoded.size()))));

    std::vector<unsigned char> result(encoded.size());
    int decoded_len = BIO_read(bio.get(), result.data(), static_cast<int>(result.size()));
    result.resize(decoded_len > 0 ? static_cast<size_t>(decoded_len) : 0);
    return result;
}

std::unique_ptr<WorkerIdentity> WorkerIdentity::generate() {
    std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        return nullptr;
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        return nullptr;
    }
    PkeyPtr pkey(raw);

    auto identity = std::unique_ptr<WorkerIdentity>(new WorkerIdentity());
    if (!extract_raw_keys(pkey.get(), identity->private_key_, identity->public_key_)) {
        return nullptr;
    }
    return identity;
}

std::unique_ptr<WorkerIdentity> WorkerIdentity::from_keyfile(const std::string& keyfile_path) {
    FILE* fp = fopen(keyfile_path.c_str(), "r");
    if (!fp) {
        return nullptr;
    }
    PkeyPtr pkey(PEM_read_PrivateKey(fp, nullptr, nullptr, nullptr));
    fclose(fp);

    if (!pkey || EVP_PKEY_id(pkey.get()) != EVP_PKEY_ED25519) {
        return nullptr;
    }

    auto identity = std::unique_ptr<WorkerIdentity>(new WorkerIdentity());
    if (!extract_raw_keys(pkey.get(), identity->private_key_, identity->public_key_)) {
        return nullptr;
    }
    return identity;
}

bool WorkerIdentity::save_to_file(const std::string& filepath) const {
    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                              private_key_.data(), private_key_.size()));
    if (!pkey) {
        return false;
    }

    FILE* fp = fopen(filepath.c_str(), "w");
    if (!fp) {
        return false;
    }
    chmod(filepath.c_str(), S_IRUSR | S_IWUSR);

    int written = PEM_write_PrivateKey(fp, pkey.get(), nullptr, nullptr, 0, nullptr, nullptr);
    bool closed = fclose(fp) == 0;
    return written > 0 && closed;
}

std::string WorkerIdentity::get_worker_id() const {
    return base64_encode(public_key_.data(), public_key_.size());
}

std::vector<unsigned char> WorkerIdentity::get_public_key() const {
    return public_key_;
}

std::string WorkerIdentity::sign(const std::string& data) const {
    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                              private_key_.data(), private_key_.size()));
    MdCtxPtr md_ctx(EVP_MD_CTX_new());
    if (!pkey || !md_ctx) {
        return "";
    }

    // Ed25519 is one-shot: no digest, no update calls
    if (EVP_DigestSignInit(md_ctx.get(), nullptr, nullptr, nullptr, pkey.get()) <= 0) {
        return "";
    }

    unsigned char signature[ED25519_SIGNATURE_SIZE];
    size_t sig_len = sizeof(signature);
    if (EVP_DigestSign(md_ctx.get(), signature, &sig_len,
                       reinterpret_cast<const unsigned char*>(data.data()), data.size()) <= 0) {
        return "";
    }
    return base64_encode(signature, sig_len);
}

std::string WorkerIdentity::sign_attestation(const Attestation& attestation) const {
    return sign(attestation.message());
}

bool WorkerIdentity::verify(const std::string& data,
                            const std::string& signature_b64,
                            const std::string& public_key_b64) {
    auto public_key = base64_decode(public_key_b64);
    auto signature = base64_decode(signature_b64);
    if (public_key.size() != ED25519_KEY_SIZE || signature.size() != ED25519_SIGNATURE_SIZE) {
        return false;
    }

    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                             public_key.data(), public_key.size()));
    MdCtxPtr md_ctx(EVP_MD_CTX_new());
    if (!pkey || !md_ctx) {
        return false;
    }
    if (EVP_DigestVerifyInit(md_ctx.get(), nullptr, nullptr, nullptr, pkey.get()) <= 0) {
        return false;
    }

    return EVP_DigestVerify(md_ctx.get(), signature.data(), signature.size(),
                            reinterpret_cast<const unsigned char*>(data.data()), data.size()) == 1;
}

bool WorkerIdentity::verify_attestation(const Attestation& attestation,
                                        const std::string& signature_b64,
                                        const std::string& public_key_b64) {
    return verify(attestation.message(), signature_b64, public_key_b64);
}

} // namespace cverify

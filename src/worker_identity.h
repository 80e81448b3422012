#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>

namespace cverify {

// What a verifier vouches for when it records a successful verification
struct Attestation {
    std::string address;
    std::string content_id;
    std::optional<std::string> git_commit;
    int64_t verified_at_ms = 0;

    // Canonical bytes that are signed
    std::string message() const;
};

// Ed25519 identity of this verifier instance.
// The identity string is the base64 public key; signatures are base64.
class WorkerIdentity {
public:
    // PEM private key; nullptr when missing, unreadable or not Ed25519
    static std::unique_ptr<WorkerIdentity> from_keyfile(const std::string& keyfile_path);

    // Fresh Ed25519 keypair
    static std::unique_ptr<WorkerIdentity> generate();

    std::string get_worker_id() const;
    std::vector<unsigned char> get_public_key() const;

    // Empty string when signing fails
    std::string sign(const std::string& data) const;
    std::string sign_attestation(const Attestation& attestation) const;

    static bool verify(const std::string& data,
                       const std::string& signature_b64,
                       const std::string& public_key_b64);
    static bool verify_attestation(const Attestation& attestation,
                                   const std::string& signature_b64,
                                   const std::string& public_key_b64);

    // PEM, mode 0600
    bool save_to_file(const std::string& filepath) const;

    static std::string base64_encode(const unsigned char* data, size_t len);
    static std::vector<unsigned char> base64_decode(const std::string& encoded);

private:
    WorkerIdentity() = default;

    std::vector<unsigned char> private_key_;  // 32 bytes
    std::vector<unsigned char> public_key_;   // 32 bytes
};

} // namespace cverify

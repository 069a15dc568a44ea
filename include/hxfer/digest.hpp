#pragma once
#include "hxfer/keys.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace hxfer {

static constexpr size_t DIGEST_LEN = 32; // SHA-256

using Digest = std::array<uint8_t, DIGEST_LEN>;
using Signature = std::vector<uint8_t>;

// Incremental SHA-256 over the plaintext stream.
class DigestState {
public:
    DigestState();
    ~DigestState();
    DigestState(const DigestState&) = delete;
    DigestState& operator=(const DigestState&) = delete;

    void update(const uint8_t* data, size_t len);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }
    Digest finalize();

private:
    EVP_MD_CTX* ctx_;
    bool finalized_ = false;
};

Digest digest_file(const std::string& path);

// RSA PKCS#1 v1.5 over a precomputed SHA-256 digest.
Signature sign(const Digest& digest, const PrivateKey& key);
bool verify(const Digest& digest, const Signature& signature, const PublicKey& key);

std::string to_hex(const uint8_t* data, size_t len);
inline std::string to_hex(const Digest& d) { return to_hex(d.data(), d.size()); }

} // namespace hxfer

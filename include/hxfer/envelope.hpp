#pragma once
#include "hxfer/keys.hpp"
#include <array>
#include <cstdint>
#include <vector>

namespace hxfer {

static constexpr size_t KEY_LEN   = 32; // AES-256
static constexpr size_t TAG_LEN   = 16; // GCM
static constexpr size_t NONCE_LEN = 12; // GCM standard

using WrappedKey = std::vector<uint8_t>;
using Tag = std::array<uint8_t, TAG_LEN>;

// Ephemeral per-session symmetric key. Zeroized on destruction, move-only.
class ContentKey {
public:
    ContentKey() = default;
    explicit ContentKey(const uint8_t* bytes);
    ~ContentKey();
    ContentKey(ContentKey&& other) noexcept;
    ContentKey& operator=(ContentKey&& other) noexcept;
    ContentKey(const ContentKey&) = delete;
    ContentKey& operator=(const ContentKey&) = delete;

    const uint8_t* data() const { return bytes_.data(); }
    bool empty() const { return empty_; }
    void clear();

private:
    std::array<uint8_t, KEY_LEN> bytes_{};
    bool empty_ = true;
};

// Material derived once per session from the content key.
struct ChunkKeys {
    std::array<uint8_t, KEY_LEN> enc_key{};
    std::array<uint8_t, NONCE_LEN> nonce_base{};
    ChunkKeys() = default;
    ChunkKeys(const ChunkKeys&) = delete;
    ChunkKeys& operator=(const ChunkKeys&) = delete;
    ~ChunkKeys();
};

struct SealedChunk {
    std::vector<uint8_t> ciphertext;
    Tag tag{};
};

class Envelope {
public:
    static ContentKey generate_session_key();

    // RSA-OAEP (SHA-256) wrapping of the content key.
    static WrappedKey wrap_key(const ContentKey& key, const PublicKey& peer);
    static ContentKey unwrap_key(const WrappedKey& blob, const PrivateKey& own);

    static void derive_chunk_keys(const ContentKey& key, ChunkKeys& out);

    // AES-256-GCM; aad binds the chunk to the session header.
    static SealedChunk encrypt_chunk(const ChunkKeys& keys,
                                     const std::vector<uint8_t>& plaintext,
                                     uint64_t chunk_index,
                                     const std::vector<uint8_t>& aad);
    static std::vector<uint8_t> decrypt_chunk(const ChunkKeys& keys,
                                              const std::vector<uint8_t>& ciphertext,
                                              const Tag& tag,
                                              uint64_t chunk_index,
                                              const std::vector<uint8_t>& aad);

    // Convenience overloads deriving the chunk keys on every call.
    static SealedChunk encrypt_chunk(const ContentKey& key,
                                     const std::vector<uint8_t>& plaintext,
                                     uint64_t chunk_index,
                                     const std::vector<uint8_t>& aad = {});
    static std::vector<uint8_t> decrypt_chunk(const ContentKey& key,
                                              const std::vector<uint8_t>& ciphertext,
                                              const Tag& tag,
                                              uint64_t chunk_index,
                                              const std::vector<uint8_t>& aad = {});

    // nonce_base with the last 8 bytes XOR big-endian chunk_index
    static std::array<uint8_t, NONCE_LEN> chunk_nonce(const std::array<uint8_t, NONCE_LEN>& base,
                                                      uint64_t chunk_index);
};

} // namespace hxfer

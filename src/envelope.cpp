#include "hxfer/envelope.hpp"
#include "hxfer/errors.hpp"
#include "openssl_utils.hpp"
#include <openssl/crypto.h>
#include <openssl/rsa.h>
#include <climits>

namespace hxfer {

using namespace detail;

static const char ENC_KEY_LABEL[]    = "HXFER-ENC-KEY";
static const char NONCE_BASE_LABEL[] = "HXFER-NONCE-BASE";
static constexpr size_t OAEP_SHA256_OVERHEAD = 2 * 32 + 2;

ContentKey::ContentKey(const uint8_t* bytes) : empty_(false) {
    std::memcpy(bytes_.data(), bytes, KEY_LEN);
}

ContentKey::~ContentKey() { clear(); }

ContentKey::ContentKey(ContentKey&& other) noexcept : bytes_(other.bytes_), empty_(other.empty_) {
    other.clear();
}

ContentKey& ContentKey::operator=(ContentKey&& other) noexcept {
    if (this != &other) {
        bytes_ = other.bytes_;
        empty_ = other.empty_;
        other.clear();
    }
    return *this;
}

void ContentKey::clear() {
    OPENSSL_cleanse(bytes_.data(), bytes_.size());
    empty_ = true;
}

ChunkKeys::~ChunkKeys() {
    OPENSSL_cleanse(enc_key.data(), enc_key.size());
    OPENSSL_cleanse(nonce_base.data(), nonce_base.size());
}

ContentKey Envelope::generate_session_key() {
    std::array<uint8_t, KEY_LEN> raw{};
    random_bytes(raw.data(), raw.size());
    ContentKey key(raw.data());
    OPENSSL_cleanse(raw.data(), raw.size());
    return key;
}

static void set_oaep(EVP_PKEY_CTX* ctx) {
    if (EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) <= 0 ||
        EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) <= 0) {
        throw std::runtime_error(ssl_error("OAEP parameters"));
    }
}

WrappedKey Envelope::wrap_key(const ContentKey& key, const PublicKey& peer) {
    if (key.empty()) throw KeyWrapError("no content key");
    if (EVP_PKEY_get_base_id(peer.get()) != EVP_PKEY_RSA) throw KeyWrapError("peer key is not RSA");
    const size_t modulus = peer.size();
    if (modulus < OAEP_SHA256_OVERHEAD || KEY_LEN > modulus - OAEP_SHA256_OVERHEAD)
        throw KeyWrapError("content key exceeds OAEP payload of peer key");

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(peer.get(), nullptr));
    if (!ctx) throw KeyWrapError(ssl_error("wrap ctx"));
    if (EVP_PKEY_encrypt_init(ctx.get()) <= 0) throw KeyWrapError(ssl_error("wrap init"));
    try {
        set_oaep(ctx.get());
    } catch (const std::runtime_error& e) {
        throw KeyWrapError(e.what());
    }
    size_t len = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &len, key.data(), KEY_LEN) <= 0) throw KeyWrapError(ssl_error("wrap size"));
    WrappedKey out(len);
    if (EVP_PKEY_encrypt(ctx.get(), out.data(), &len, key.data(), KEY_LEN) <= 0) throw KeyWrapError(ssl_error("wrap"));
    out.resize(len);
    return out;
}

ContentKey Envelope::unwrap_key(const WrappedKey& blob, const PrivateKey& own) {
    if (EVP_PKEY_get_base_id(own.get()) != EVP_PKEY_RSA) throw KeyUnwrapError("own key is not RSA");
    if (blob.size() != own.size()) throw KeyUnwrapError("wrapped key length does not match private key");

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(own.get(), nullptr));
    if (!ctx) throw KeyUnwrapError(ssl_error("unwrap ctx"));
    if (EVP_PKEY_decrypt_init(ctx.get()) <= 0) throw KeyUnwrapError(ssl_error("unwrap init"));
    try {
        set_oaep(ctx.get());
    } catch (const std::runtime_error& e) {
        throw KeyUnwrapError(e.what());
    }
    std::vector<uint8_t> buf(own.size());
    size_t len = buf.size();
    int rc = EVP_PKEY_decrypt(ctx.get(), buf.data(), &len, blob.data(), blob.size());
    if (rc <= 0 || len != KEY_LEN) {
        OPENSSL_cleanse(buf.data(), buf.size());
        throw KeyUnwrapError(ssl_error("content key unwrap failed"));
    }
    ContentKey key(buf.data());
    OPENSSL_cleanse(buf.data(), buf.size());
    return key;
}

void Envelope::derive_chunk_keys(const ContentKey& key, ChunkKeys& out) {
    if (key.empty()) throw std::logic_error("no content key");
    hkdf_sha256(key.data(), KEY_LEN,
                std::vector<uint8_t>(ENC_KEY_LABEL, ENC_KEY_LABEL + sizeof(ENC_KEY_LABEL) - 1),
                out.enc_key.data(), out.enc_key.size());
    hkdf_sha256(key.data(), KEY_LEN,
                std::vector<uint8_t>(NONCE_BASE_LABEL, NONCE_BASE_LABEL + sizeof(NONCE_BASE_LABEL) - 1),
                out.nonce_base.data(), out.nonce_base.size());
}

std::array<uint8_t, NONCE_LEN> Envelope::chunk_nonce(const std::array<uint8_t, NONCE_LEN>& base,
                                                     uint64_t chunk_index) {
    std::array<uint8_t, NONCE_LEN> nonce = base;
    for (int i = 0; i < 8; ++i) {
        nonce[NONCE_LEN - 1 - i] ^= (uint8_t)(chunk_index & 0xff);
        chunk_index >>= 8;
    }
    return nonce;
}

SealedChunk Envelope::encrypt_chunk(const ChunkKeys& keys,
                                    const std::vector<uint8_t>& plaintext,
                                    uint64_t chunk_index,
                                    const std::vector<uint8_t>& aad) {
    if (plaintext.size() > (size_t)INT_MAX) throw std::invalid_argument("chunk too large");
    auto nonce = chunk_nonce(keys.nonce_base, chunk_index);
    SealedChunk out;
    out.ciphertext.resize(plaintext.size());

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) throw_ssl("cipher ctx");
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) throw_ssl("enc init");
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, NONCE_LEN, nullptr) != 1) throw_ssl("set iv len");
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, keys.enc_key.data(), nonce.data()) != 1) throw_ssl("set key/iv");

    int len = 0;
    if (!aad.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), (int)aad.size()) != 1) throw_ssl("aad");
    }
    int outlen = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), out.ciphertext.data(), &outlen, plaintext.data(), (int)plaintext.size()) != 1)
            throw_ssl("enc update");
    }
    int tmplen = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.ciphertext.data() + outlen, &tmplen) != 1) throw_ssl("enc final");
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, TAG_LEN, out.tag.data()) != 1) throw_ssl("get tag");
    return out;
}

std::vector<uint8_t> Envelope::decrypt_chunk(const ChunkKeys& keys,
                                             const std::vector<uint8_t>& ciphertext,
                                             const Tag& tag,
                                             uint64_t chunk_index,
                                             const std::vector<uint8_t>& aad) {
    if (ciphertext.size() > (size_t)INT_MAX) throw std::invalid_argument("chunk too large");
    auto nonce = chunk_nonce(keys.nonce_base, chunk_index);
    std::vector<uint8_t> out(ciphertext.size());

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) throw_ssl("cipher ctx");
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) throw_ssl("dec init");
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, NONCE_LEN, nullptr) != 1) throw_ssl("set iv len");
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, keys.enc_key.data(), nonce.data()) != 1) throw_ssl("set key/iv");

    int len = 0;
    if (!aad.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), (int)aad.size()) != 1) throw_ssl("aad");
    }
    int outlen = 0;
    if (!ciphertext.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), out.data(), &outlen, ciphertext.data(), (int)ciphertext.size()) != 1)
            throw_ssl("dec update");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, TAG_LEN, const_cast<uint8_t*>(tag.data())) != 1)
        throw_ssl("set tag");
    int final_ok = EVP_DecryptFinal_ex(ctx.get(), out.data() + outlen, &len);
    if (final_ok != 1) {
        OPENSSL_cleanse(out.data(), out.size());
        ERR_clear_error();
        throw ChunkAuthError("chunk " + std::to_string(chunk_index) + " failed authentication");
    }
    return out;
}

SealedChunk Envelope::encrypt_chunk(const ContentKey& key,
                                    const std::vector<uint8_t>& plaintext,
                                    uint64_t chunk_index,
                                    const std::vector<uint8_t>& aad) {
    ChunkKeys keys;
    derive_chunk_keys(key, keys);
    return encrypt_chunk(keys, plaintext, chunk_index, aad);
}

std::vector<uint8_t> Envelope::decrypt_chunk(const ContentKey& key,
                                             const std::vector<uint8_t>& ciphertext,
                                             const Tag& tag,
                                             uint64_t chunk_index,
                                             const std::vector<uint8_t>& aad) {
    ChunkKeys keys;
    derive_chunk_keys(key, keys);
    return decrypt_chunk(keys, ciphertext, tag, chunk_index, aad);
}

} // namespace hxfer

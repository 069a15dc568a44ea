#pragma once
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>
#include <openssl/x509.h>
#include <array>
#include <memory>
#include <vector>
#include <stdexcept>
#include <string>
#include <cstring>
#include <cstdint>

namespace hxfer {
namespace detail {

struct EvpPkeyCtxDeleter { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
struct EvpCipherCtxDeleter { void operator()(EVP_CIPHER_CTX* p) const { EVP_CIPHER_CTX_free(p); } };
struct EvpMdCtxDeleter { void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); } };
struct BioDeleter { void operator()(BIO* p) const { BIO_free(p); } };
struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };

using PkeyCtxPtr   = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherCtxDeleter>;
using MdCtxPtr     = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;
using BioPtr       = std::unique_ptr<BIO, BioDeleter>;
using X509Ptr      = std::unique_ptr<X509, X509Deleter>;

// Message with the oldest queued OpenSSL error appended; clears the queue.
inline std::string ssl_error(const char* what) {
    std::string msg(what);
    unsigned long code = ERR_get_error();
    if (code != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        msg += ": ";
        msg += buf;
    }
    ERR_clear_error();
    return msg;
}

[[noreturn]] inline void throw_ssl(const char* what) {
    throw std::runtime_error(ssl_error(what));
}

inline void random_bytes(uint8_t* out, size_t n) {
    if (RAND_bytes(out, (int)n) != 1) throw_ssl("RAND_bytes failed");
}

inline void hkdf_sha256(const uint8_t* ikm, size_t ikm_len,
                        const std::vector<uint8_t>& info,
                        uint8_t* out, size_t out_len) {
    PkeyCtxPtr pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    if (!pctx) throw_ssl("EVP_PKEY_HKDF ctx");
    if (EVP_PKEY_derive_init(pctx.get()) <= 0) throw_ssl("HKDF derive_init");
    if (EVP_PKEY_CTX_set_hkdf_md(pctx.get(), EVP_sha256()) <= 0) throw_ssl("HKDF md");
    // salt left unset: HKDF uses a zero-filled one
    if (EVP_PKEY_CTX_set1_hkdf_key(pctx.get(), ikm, (int)ikm_len) <= 0) throw_ssl("HKDF key");
    if (EVP_PKEY_CTX_add1_hkdf_info(pctx.get(), info.data(), (int)info.size()) <= 0) throw_ssl("HKDF info");
    size_t len = out_len;
    if (EVP_PKEY_derive(pctx.get(), out, &len) <= 0 || len != out_len) throw_ssl("HKDF derive");
}

static inline void u16be(std::vector<uint8_t>& v, uint16_t x) {
    v.push_back((uint8_t)((x>>8)&0xff)); v.push_back((uint8_t)(x&0xff));
}
static inline void u32be(std::vector<uint8_t>& v, uint32_t x) {
    v.push_back((uint8_t)((x>>24)&0xff)); v.push_back((uint8_t)((x>>16)&0xff));
    v.push_back((uint8_t)((x>>8)&0xff));  v.push_back((uint8_t)(x&0xff));
}
static inline void u64be(std::vector<uint8_t>& v, uint64_t x) {
    for (int s = 56; s >= 0; s -= 8) v.push_back((uint8_t)((x>>s)&0xff));
}
static inline uint16_t be16(const uint8_t* p) {
    return (uint16_t)((uint16_t)p[0]<<8 | p[1]);
}
static inline uint32_t be32(const uint8_t* p) {
    return (uint32_t)p[0]<<24 | (uint32_t)p[1]<<16 | (uint32_t)p[2]<<8 | (uint32_t)p[3];
}
static inline uint64_t be64(const uint8_t* p) {
    return (uint64_t)be32(p)<<32 | be32(p+4);
}

} // namespace detail
} // namespace hxfer

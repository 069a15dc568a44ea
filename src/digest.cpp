#include "hxfer/digest.hpp"
#include "openssl_utils.hpp"
#include <openssl/rsa.h>
#include <fstream>

namespace hxfer {

using namespace detail;

DigestState::DigestState() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw_ssl("digest ctx");
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw_ssl("digest init");
    }
}

DigestState::~DigestState() { EVP_MD_CTX_free(ctx_); }

void DigestState::update(const uint8_t* data, size_t len) {
    if (finalized_) throw std::logic_error("digest already finalized");
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_, data, len) != 1) throw_ssl("digest update");
}

Digest DigestState::finalize() {
    if (finalized_) throw std::logic_error("digest already finalized");
    Digest out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1 || len != DIGEST_LEN) throw_ssl("digest final");
    finalized_ = true;
    return out;
}

Digest digest_file(const std::string& path) {
    std::ifstream fin(path, std::ios::binary);
    if (!fin) throw std::runtime_error("open input failed: " + path);
    DigestState st;
    std::vector<uint8_t> buf(1u<<16);
    while (fin) {
        fin.read(reinterpret_cast<char*>(buf.data()), (std::streamsize)buf.size());
        std::streamsize got = fin.gcount();
        if (got <= 0) break;
        st.update(buf.data(), (size_t)got);
    }
    if (fin.bad()) throw std::runtime_error("read input failed: " + path);
    return st.finalize();
}

static PkeyCtxPtr pkey_ctx(EVP_PKEY* key) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(key, nullptr));
    if (!ctx) throw_ssl("pkey ctx");
    return ctx;
}

Signature sign(const Digest& digest, const PrivateKey& key) {
    auto ctx = pkey_ctx(key.get());
    if (EVP_PKEY_sign_init(ctx.get()) <= 0) throw_ssl("sign init");
    if (EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) <= 0) throw_ssl("sign padding");
    if (EVP_PKEY_CTX_set_signature_md(ctx.get(), EVP_sha256()) <= 0) throw_ssl("sign md");
    size_t len = 0;
    if (EVP_PKEY_sign(ctx.get(), nullptr, &len, digest.data(), digest.size()) <= 0) throw_ssl("sign size");
    Signature sig(len);
    if (EVP_PKEY_sign(ctx.get(), sig.data(), &len, digest.data(), digest.size()) <= 0) throw_ssl("sign");
    sig.resize(len);
    return sig;
}

bool verify(const Digest& digest, const Signature& signature, const PublicKey& key) {
    if (signature.empty()) return false;
    auto ctx = pkey_ctx(key.get());
    if (EVP_PKEY_verify_init(ctx.get()) <= 0) throw_ssl("verify init");
    if (EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) <= 0) throw_ssl("verify padding");
    if (EVP_PKEY_CTX_set_signature_md(ctx.get(), EVP_sha256()) <= 0) throw_ssl("verify md");
    int rc = EVP_PKEY_verify(ctx.get(), signature.data(), signature.size(), digest.data(), digest.size());
    // rc < 0 is a malformed signature, not an internal fault
    ERR_clear_error();
    return rc == 1;
}

std::string to_hex(const uint8_t* data, size_t len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

} // namespace hxfer

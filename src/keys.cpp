#include "hxfer/keys.hpp"
#include "openssl_utils.hpp"
#include <openssl/pem.h>
#include <fstream>
#include <sstream>

namespace hxfer {

using namespace detail;

static std::string read_text_file(const std::string& path) {
    std::ifstream fin(path, std::ios::binary);
    if (!fin) throw std::runtime_error("open key file failed: " + path);
    std::ostringstream ss;
    ss << fin.rdbuf();
    return ss.str();
}

static BioPtr mem_bio(const std::string& pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), (int)pem.size()));
    if (!bio) throw_ssl("BIO_new_mem_buf");
    return bio;
}

PrivateKey::PrivateKey(EVP_PKEY* adopted) : pkey_(adopted) {
    if (!pkey_) throw std::invalid_argument("null private key");
}

PrivateKey PrivateKey::from_pem(const std::string& pem) {
    auto bio = mem_bio(pem);
    EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
    if (!pkey) throw_ssl("parse private key");
    return PrivateKey(pkey);
}

PrivateKey PrivateKey::load_pem_file(const std::string& path) {
    return from_pem(read_text_file(path));
}

size_t PrivateKey::size() const { return (size_t)EVP_PKEY_get_size(pkey_.get()); }

PublicKey::PublicKey(EVP_PKEY* adopted) : pkey_(adopted) {
    if (!pkey_) throw std::invalid_argument("null public key");
}

PublicKey PublicKey::from_pem(const std::string& pem) {
    if (pem.find("-----BEGIN CERTIFICATE-----") != std::string::npos) {
        auto bio = mem_bio(pem);
        X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
        if (!cert) throw_ssl("parse certificate");
        EVP_PKEY* pkey = X509_get_pubkey(cert.get());
        if (!pkey) throw_ssl("certificate public key");
        return PublicKey(pkey);
    }
    auto bio = mem_bio(pem);
    EVP_PKEY* pkey = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
    if (!pkey) throw_ssl("parse public key");
    return PublicKey(pkey);
}

PublicKey PublicKey::load_pem_file(const std::string& path) {
    return from_pem(read_text_file(path));
}

PublicKey PublicKey::from_private(const PrivateKey& key) {
    // Round-trip through SubjectPublicKeyInfo so no private component survives
    unsigned char* der = nullptr;
    int len = i2d_PUBKEY(key.get(), &der);
    if (len <= 0) throw_ssl("encode public key");
    const unsigned char* p = der;
    EVP_PKEY* pkey = d2i_PUBKEY(nullptr, &p, len);
    OPENSSL_free(der);
    if (!pkey) throw_ssl("decode public key");
    return PublicKey(pkey);
}

size_t PublicKey::size() const { return (size_t)EVP_PKEY_get_size(pkey_.get()); }

std::string PublicKey::to_pem() const {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio) throw_ssl("BIO_new");
    if (PEM_write_bio_PUBKEY(bio.get(), pkey_.get()) != 1) throw_ssl("write public key");
    char* data = nullptr;
    long n = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, (size_t)n);
}

} // namespace hxfer

#pragma once
#include <openssl/evp.h>
#include <memory>
#include <string>

namespace hxfer {

struct PkeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };

// Local private key. Used to unwrap content keys (receiver) and to sign
// digests (sender).
class PrivateKey {
public:
    explicit PrivateKey(EVP_PKEY* adopted);

    static PrivateKey load_pem_file(const std::string& path);
    static PrivateKey from_pem(const std::string& pem);

    EVP_PKEY* get() const { return pkey_.get(); }
    // RSA modulus size in bytes
    size_t size() const;

private:
    std::unique_ptr<EVP_PKEY, PkeyDeleter> pkey_;
};

// Peer public key. Accepts "PUBLIC KEY" or "CERTIFICATE" PEM.
class PublicKey {
public:
    explicit PublicKey(EVP_PKEY* adopted);

    static PublicKey load_pem_file(const std::string& path);
    static PublicKey from_pem(const std::string& pem);
    static PublicKey from_private(const PrivateKey& key);

    EVP_PKEY* get() const { return pkey_.get(); }
    size_t size() const;
    std::string to_pem() const;

private:
    std::unique_ptr<EVP_PKEY, PkeyDeleter> pkey_;
};

} // namespace hxfer

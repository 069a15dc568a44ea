#pragma once
#include "hxfer/channel.hpp"
#include <openssl/ssl.h>
#include <cstdint>
#include <memory>
#include <string>

namespace hxfer {

struct SslCtxDeleter { void operator()(SSL_CTX* p) const { SSL_CTX_free(p); } };

class TlsContext {
public:
    static TlsContext server(const std::string& cert_file, const std::string& key_file);
    // insecure disables certificate and hostname verification.
    static TlsContext client(const std::string& ca_file, bool insecure);

    SSL_CTX* get() const { return ctx_.get(); }
    bool verifies_peer() const { return verify_; }

private:
    TlsContext(SSL_CTX* ctx, bool verify) : ctx_(ctx), verify_(verify) {}
    std::unique_ptr<SSL_CTX, SslCtxDeleter> ctx_;
    bool verify_;
};

// TLS stream over a connected socket. Owns both the SSL object and the fd.
// Writes use the plain socket, so the process must ignore SIGPIPE
// (Server::listen does).
class TlsChannel : public Channel {
public:
    ~TlsChannel() override;
    TlsChannel(const TlsChannel&) = delete;
    TlsChannel& operator=(const TlsChannel&) = delete;

    static std::unique_ptr<TlsChannel> accept(const TlsContext& ctx, int fd);
    static std::unique_ptr<TlsChannel> connect(const TlsContext& ctx, int fd, const std::string& host);

    void read_exact(uint8_t* out, size_t len) override;
    void write_all(const uint8_t* data, size_t len) override;
    void close() override;

private:
    TlsChannel(SSL* ssl, int fd) : ssl_(ssl), fd_(fd) {}

    SSL* ssl_;
    int fd_;
};

// TCP connect then TLS handshake.
std::unique_ptr<TlsChannel> tls_connect(const std::string& host, uint16_t port,
                                        const TlsContext& ctx, int timeout_ms = 0);

} // namespace hxfer

#include "hxfer/tls.hpp"
#include "hxfer/errors.hpp"
#include "openssl_utils.hpp"
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace hxfer {

using namespace detail;

TlsContext TlsContext::server(const std::string& cert_file, const std::string& key_file) {
    SSL_CTX* raw = SSL_CTX_new(TLS_server_method());
    if (!raw) throw_ssl("SSL_CTX_new");
    TlsContext ctx(raw, false);
    if (SSL_CTX_set_min_proto_version(raw, TLS1_2_VERSION) != 1) throw_ssl("min TLS version");
    if (SSL_CTX_use_certificate_chain_file(raw, cert_file.c_str()) != 1) throw_ssl("load certificate");
    if (SSL_CTX_use_PrivateKey_file(raw, key_file.c_str(), SSL_FILETYPE_PEM) != 1) throw_ssl("load private key");
    if (SSL_CTX_check_private_key(raw) != 1) throw_ssl("certificate/key mismatch");
    return ctx;
}

TlsContext TlsContext::client(const std::string& ca_file, bool insecure) {
    SSL_CTX* raw = SSL_CTX_new(TLS_client_method());
    if (!raw) throw_ssl("SSL_CTX_new");
    TlsContext ctx(raw, !insecure);
    if (SSL_CTX_set_min_proto_version(raw, TLS1_2_VERSION) != 1) throw_ssl("min TLS version");
    if (insecure) {
        SSL_CTX_set_verify(raw, SSL_VERIFY_NONE, nullptr);
    } else {
        if (ca_file.empty()) throw std::invalid_argument("trust anchor required unless insecure");
        if (SSL_CTX_load_verify_locations(raw, ca_file.c_str(), nullptr) != 1) throw_ssl("load trust anchor");
        SSL_CTX_set_verify(raw, SSL_VERIFY_PEER, nullptr);
    }
    return ctx;
}

static std::string tls_error(SSL* ssl, int ret, const char* what) {
    int err = SSL_get_error(ssl, ret);
    if (err == SSL_ERROR_ZERO_RETURN) return std::string(what) + ": peer closed connection";
    if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) {
        if (ret == 0 || errno == 0) return std::string(what) + ": unexpected EOF";
        return std::string(what) + ": " + std::strerror(errno);
    }
    return ssl_error(what);
}

std::unique_ptr<TlsChannel> TlsChannel::accept(const TlsContext& ctx, int fd) {
    SSL* ssl = SSL_new(ctx.get());
    if (!ssl) {
        ::close(fd);
        throw_ssl("SSL_new");
    }
    std::unique_ptr<TlsChannel> ch(new TlsChannel(ssl, fd));
    if (SSL_set_fd(ssl, fd) != 1) throw_ssl("SSL_set_fd");
    int ret = SSL_accept(ssl);
    if (ret != 1) throw ChannelClosedError(tls_error(ssl, ret, "TLS accept"));
    return ch;
}

std::unique_ptr<TlsChannel> TlsChannel::connect(const TlsContext& ctx, int fd, const std::string& host) {
    SSL* ssl = SSL_new(ctx.get());
    if (!ssl) {
        ::close(fd);
        throw_ssl("SSL_new");
    }
    std::unique_ptr<TlsChannel> ch(new TlsChannel(ssl, fd));
    if (SSL_set_fd(ssl, fd) != 1) throw_ssl("SSL_set_fd");
    if (ctx.verifies_peer()) {
        if (SSL_set_tlsext_host_name(ssl, host.c_str()) != 1) throw_ssl("SNI");
        if (SSL_set1_host(ssl, host.c_str()) != 1) throw_ssl("expected host");
    }
    int ret = SSL_connect(ssl);
    if (ret != 1) throw ChannelClosedError(tls_error(ssl, ret, "TLS connect"));
    return ch;
}

TlsChannel::~TlsChannel() { close(); }

void TlsChannel::read_exact(uint8_t* out, size_t len) {
    if (!ssl_) throw ChannelClosedError("channel closed");
    size_t got = 0;
    while (got < len) {
        size_t n = 0;
        int ret = SSL_read_ex(ssl_, out + got, len - got, &n);
        if (ret != 1) throw ChannelClosedError(tls_error(ssl_, ret, "TLS read"));
        got += n;
    }
}

void TlsChannel::write_all(const uint8_t* data, size_t len) {
    if (!ssl_) throw ChannelClosedError("channel closed");
    size_t sent = 0;
    while (sent < len) {
        size_t n = 0;
        int ret = SSL_write_ex(ssl_, data + sent, len - sent, &n);
        if (ret != 1) throw ChannelClosedError(tls_error(ssl_, ret, "TLS write"));
        sent += n;
    }
}

void TlsChannel::close() {
    if (ssl_) {
        // close_notify only; the peer's reply is not awaited
        if (SSL_shutdown(ssl_) < 0) ERR_clear_error();
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        fd_ = -1;
    }
}

std::unique_ptr<TlsChannel> tls_connect(const std::string& host, uint16_t port,
                                        const TlsContext& ctx, int timeout_ms) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0) throw ChannelClosedError("resolve " + host + ": " + gai_strerror(rc));

    int fd = -1;
    std::string last = "no addresses";
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) { last = std::strerror(errno); continue; }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
        last = std::strerror(errno);
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);
    if (fd < 0) throw ChannelClosedError("connect " + host + ":" + std::to_string(port) + ": " + last);
    if (timeout_ms > 0) {
        try {
            set_socket_timeout(fd, timeout_ms);
        } catch (...) {
            ::close(fd);
            throw;
        }
    }
    return TlsChannel::connect(ctx, fd, host);
}

} // namespace hxfer

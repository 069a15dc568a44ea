#include "hxfer/server.hpp"
#include "hxfer/log.hpp"
#include "hxfer/session.hpp"
#include "hxfer/sink.hpp"
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <thread>

namespace hxfer {

static std::string peer_name(const sockaddr_storage& ss) {
    char host[NI_MAXHOST];
    char serv[NI_MAXSERV];
    if (::getnameinfo(reinterpret_cast<const sockaddr*>(&ss), sizeof(ss), host, sizeof(host),
                      serv, sizeof(serv), NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
        return "unknown";
    }
    return std::string(host) + ":" + serv;
}

Server::Server(const TlsContext& tls, const PrivateKey& receiver_key,
               const PublicKey* sender_key, ServerConfig cfg)
    : tls_(tls), receiver_key_(receiver_key), sender_key_(sender_key), cfg_(std::move(cfg)) {}

Server::~Server() {
    stop();
    if (listen_fd_ >= 0) ::close(listen_fd_);
}

void Server::listen() {
    // TLS writes go straight to the socket; a vanished peer must not raise SIGPIPE.
    std::signal(SIGPIPE, SIG_IGN);

    std::error_code ec;
    std::filesystem::create_directories(cfg_.out_dir, ec);
    if (ec) throw std::runtime_error("create output directory " + cfg_.out_dir + ": " + ec.message());

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;
    addrinfo* res = nullptr;
    const char* node = cfg_.host.empty() ? nullptr : cfg_.host.c_str();
    int rc = ::getaddrinfo(node, std::to_string(cfg_.port).c_str(), &hints, &res);
    if (rc != 0) throw std::runtime_error("resolve " + cfg_.host + ": " + gai_strerror(rc));

    std::string last = "no addresses";
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) { last = std::strerror(errno); continue; }
        int one = 1;
        if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) != 0 ||
            ::bind(fd, ai->ai_addr, ai->ai_addrlen) != 0 ||
            ::listen(fd, SOMAXCONN) != 0) {
            last = std::strerror(errno);
            ::close(fd);
            continue;
        }
        listen_fd_ = fd;
        break;
    }
    ::freeaddrinfo(res);
    if (listen_fd_ < 0) throw std::runtime_error("listen on " + cfg_.host + ":" + std::to_string(cfg_.port) + ": " + last);

    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&ss), &len) != 0)
        throw std::runtime_error(std::string("getsockname: ") + std::strerror(errno));
    bound_port_ = ss.ss_family == AF_INET6
        ? ntohs(reinterpret_cast<sockaddr_in6*>(&ss)->sin6_port)
        : ntohs(reinterpret_cast<sockaddr_in*>(&ss)->sin_port);
    Logger::instance().info("listening on {}:{}, saving to {}", cfg_.host, bound_port_, cfg_.out_dir);
}

void Server::serve() {
    if (listen_fd_ < 0) listen();
    while (!stopping_) {
        sockaddr_storage ss{};
        socklen_t len = sizeof(ss);
        int fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&ss), &len);
        if (fd < 0) {
            if (stopping_) break;
            if (errno == EINTR || errno == ECONNABORTED) continue;
            throw std::runtime_error(std::string("accept: ") + std::strerror(errno));
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                ::close(fd);
                break;
            }
            ++active_;
        }
        const std::string peer = peer_name(ss);
        Logger::instance().info("connection from {}", peer);
        std::thread([this, fd, peer] { handle(fd, peer); }).detach();
    }
}

void Server::stop() {
    bool was_stopping;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_stopping = stopping_.exchange(true);
    }
    if (!was_stopping && listen_fd_ >= 0) {
        // wakes a blocked accept()
        ::shutdown(listen_fd_, SHUT_RDWR);
    }
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return active_ == 0; });
}

void Server::handle(int fd, const std::string& peer) {
    try {
        if (cfg_.io_timeout_ms > 0) set_socket_timeout(fd, cfg_.io_timeout_ms);
    } catch (const std::exception& e) {
        Logger::instance().warning("[{}] no I/O timeout: {}", peer, e.what());
    }
    std::unique_ptr<TlsChannel> channel;
    try {
        channel = TlsChannel::accept(tls_, fd);
    } catch (const std::exception& e) {
        Logger::instance().warning("[{}] TLS handshake failed: {}", peer, e.what());
        ++aborted_;
    }
    if (channel) {
        FileSink sink(cfg_.out_dir);
        ReceiverSession session(*channel, receiver_key_, sender_key_, sink, cfg_.options);
        session.set_label(peer);
        try {
            session.receive();
            ++completed_;
        } catch (const std::exception&) {
            // logged by the session on abort
            ++aborted_;
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (--active_ == 0) idle_.notify_all();
}

} // namespace hxfer

#pragma once
#include "hxfer/config.hpp"
#include "hxfer/keys.hpp"
#include "hxfer/tls.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

namespace hxfer {

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 5001;
    std::string out_dir = ".";
    SessionOptions options;
    int io_timeout_ms = 30000;
};

// Accepts TLS connections and runs one ReceiverSession per connection on its
// own thread. Sessions share only the immutable keys and TLS context.
class Server {
public:
    Server(const TlsContext& tls, const PrivateKey& receiver_key,
           const PublicKey* sender_key, ServerConfig cfg);
    ~Server();
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Binds and listens; port 0 picks an ephemeral port.
    void listen();
    uint16_t port() const { return bound_port_; }

    // Blocks until stop() is called.
    void serve();
    // Stops accepting and waits for running sessions to finish.
    void stop();

    size_t completed() const { return completed_.load(); }
    size_t aborted() const { return aborted_.load(); }

private:
    void handle(int fd, const std::string& peer);

    const TlsContext& tls_;
    const PrivateKey& receiver_key_;
    const PublicKey* sender_key_;
    ServerConfig cfg_;

    int listen_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> stopping_{false};
    std::atomic<size_t> completed_{0};
    std::atomic<size_t> aborted_{0};

    std::mutex mutex_;
    std::condition_variable idle_;
    size_t active_ = 0;
};

} // namespace hxfer

#pragma once
#include <cstddef>
#include <cstdint>

namespace hxfer {

// Ordered, blocking byte stream supplied by the transport. read_exact and
// write_all throw ChannelClosedError on disconnect, timeout or I/O failure.
class Channel {
public:
    virtual ~Channel() = default;
    virtual void read_exact(uint8_t* out, size_t len) = 0;
    virtual void write_all(const uint8_t* data, size_t len) = 0;
    virtual void close() = 0;
};

// Connected stream socket (or socketpair end). Owns the descriptor.
class FdChannel : public Channel {
public:
    explicit FdChannel(int fd);
    ~FdChannel() override;
    FdChannel(const FdChannel&) = delete;
    FdChannel& operator=(const FdChannel&) = delete;

    void read_exact(uint8_t* out, size_t len) override;
    void write_all(const uint8_t* data, size_t len) override;
    void close() override;

    void set_timeout_ms(int ms);
    int fd() const { return fd_; }

private:
    int fd_;
};

// Sets SO_RCVTIMEO/SO_SNDTIMEO on a socket; 0 disables.
void set_socket_timeout(int fd, int timeout_ms);

} // namespace hxfer

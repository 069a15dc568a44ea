#include "hxfer/channel.hpp"
#include "hxfer/errors.hpp"
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string>

namespace hxfer {

FdChannel::FdChannel(int fd) : fd_(fd) {}

FdChannel::~FdChannel() { close(); }

void FdChannel::read_exact(uint8_t* out, size_t len) {
    if (fd_ < 0) throw ChannelClosedError("channel closed");
    size_t got = 0;
    while (got < len) {
        ssize_t n = ::recv(fd_, out + got, len - got, 0);
        if (n == 0) throw ChannelClosedError("peer closed connection");
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ChannelClosedError(std::string("recv: ") + std::strerror(errno));
        }
        got += (size_t)n;
    }
}

void FdChannel::write_all(const uint8_t* data, size_t len) {
    if (fd_ < 0) throw ChannelClosedError("channel closed");
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ChannelClosedError(std::string("send: ") + std::strerror(errno));
        }
        sent += (size_t)n;
    }
}

void FdChannel::close() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        fd_ = -1;
    }
}

void FdChannel::set_timeout_ms(int ms) {
    if (fd_ >= 0) set_socket_timeout(fd_, ms);
}

void set_socket_timeout(int fd, int timeout_ms) {
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        throw std::runtime_error(std::string("setsockopt: ") + std::strerror(errno));
    }
}

} // namespace hxfer

#include "hxfer/sink.hpp"
#include "hxfer/errors.hpp"
#include "hxfer/framing.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace hxfer {

static std::string errno_msg(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

FileSink::FileSink(std::string dir) : dir_(std::move(dir)) {
    if (dir_.empty()) dir_ = ".";
}

FileSink::~FileSink() { discard(); }

void FileSink::open(const std::string& name) {
    if (fd_ >= 0) throw std::logic_error("sink already open");
    if (!valid_file_name(name)) throw ProtocolError("unsafe file name");
    final_path_ = dir_ + "/" + name;
    std::string tpl = dir_ + "/." + name + ".part.XXXXXX";
    std::vector<char> buf(tpl.begin(), tpl.end());
    buf.push_back('\0');
    int fd = ::mkstemp(buf.data());
    if (fd < 0) throw IoError(errno_msg("create temporary file in " + dir_));
    fd_ = fd;
    tmp_path_ = buf.data();
}

void FileSink::write(const uint8_t* data, size_t len) {
    if (fd_ < 0) throw std::logic_error("sink not open");
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::write(fd_, data + done, len - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw IoError(errno_msg("write " + tmp_path_));
        }
        done += (size_t)n;
    }
}

std::string FileSink::commit() {
    if (fd_ < 0) throw std::logic_error("sink not open");
    if (::fsync(fd_) != 0) throw IoError(errno_msg("fsync " + tmp_path_));
    if (::fchmod(fd_, 0644) != 0) throw IoError(errno_msg("chmod " + tmp_path_));
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        ::unlink(tmp_path_.c_str());
        tmp_path_.clear();
        throw IoError(errno_msg("close " + final_path_));
    }
    if (std::rename(tmp_path_.c_str(), final_path_.c_str()) != 0) {
        std::string msg = errno_msg("rename to " + final_path_);
        ::unlink(tmp_path_.c_str());
        tmp_path_.clear();
        throw IoError(msg);
    }
    tmp_path_.clear();
    return final_path_;
}

void FileSink::discard() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (!tmp_path_.empty()) {
        ::unlink(tmp_path_.c_str());
        tmp_path_.clear();
    }
}

} // namespace hxfer

#include "sys.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace sys {

[[noreturn]] void throw_errno(const char* what) {
    throw std::system_error(errno, std::generic_category(),
                            std::string(what) + ": " + std::strerror(errno));
}

std::string errno_text(int err) {
    return std::strerror(err);
}

Fd& Fd::operator=(Fd&& o) noexcept {
    if (this != &o) { reset(); fd = o.fd; o.fd = -1; }
    return *this;
}

void Fd::reset() {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

void set_cloexec(int fd) {
    int flags = ::fcntl(fd, F_GETFD);
    if (flags < 0) throw_errno("fcntl(F_GETFD)");
    if (::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) < 0) throw_errno("fcntl(F_SETFD)");
}

void set_nonblock(int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    if (flags < 0) throw_errno("fcntl(F_GETFL)");
    if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) throw_errno("fcntl(F_SETFL)");
}

Pipe make_pipe() {
    int fds[2];
    if (::pipe(fds) < 0) throw_errno("pipe");
    Pipe p{Fd{fds[0]}, Fd{fds[1]}};
    set_cloexec(p.r.get());
    set_cloexec(p.w.get());
    return p;
}

int open_dev_null() {
    int fd = ::open("/dev/null", O_RDWR);
    if (fd < 0) throw_errno("open(/dev/null)");
    set_cloexec(fd);
    return fd;
}

bool write_all(int fd, const void* data, size_t len) {
    const char* p = static_cast<const char*>(data);
    while (len > 0) {
        ssize_t n = ::write(fd, p, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace sys

#pragma once
#include <cstddef>
#include <string>
#include <system_error>

namespace sys {

[[noreturn]] void throw_errno(const char* what);

struct Fd {
    int fd{-1};
    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& o) noexcept : fd(o.fd) { o.fd = -1; }
    Fd& operator=(Fd&& o) noexcept;
    ~Fd() { reset(); }
    void reset();
    int get() const { return fd; }
    int release() { int t=fd; fd=-1; return t; }
    explicit operator bool() const { return fd >= 0; }
};

struct Pipe { Fd r, w; };

// Both ends are close-on-exec; dup2 onto 0/1/2 clears the flag on the copy.
Pipe make_pipe();

int  open_dev_null();

void set_cloexec(int fd);
void set_nonblock(int fd);

// write(2) until done, retrying EINTR. Returns false on any other error.
bool write_all(int fd, const void* data, size_t len);

std::string errno_text(int err);

} // namespace sys

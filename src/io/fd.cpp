#include "io/fd.hpp"

#include <unistd.h>

#include <utility>

namespace uploader {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Reset(std::exchange(other.fd_, -1));
    }
    return *this;
}

Fd::~Fd() { Reset(); }

void Fd::Reset(int fd) {
    if (fd_ >= 0 && fd_ != fd) {
        ::close(fd_);
    }
    fd_ = fd;
}

} // namespace uploader

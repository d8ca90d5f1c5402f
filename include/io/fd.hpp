#pragma once

namespace uploader {

// Owns a POSIX file descriptor and closes it on destruction.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    // Closes the current descriptor, then owns |fd|.
    void Reset(int fd = -1);
    void Close() { Reset(); }

  private:
    int fd_{-1};
};

} // namespace uploader

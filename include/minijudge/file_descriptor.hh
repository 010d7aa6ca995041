#pragma once

#include <fcntl.h>
#include <minijudge/file_path.hh>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

// Owns a file descriptor (a pipe end, a memory file or an opened file) and
// closes it on destruction
class FileDescriptor {
    int fd_;

public:
    explicit FileDescriptor(int fd = -1) noexcept : fd_(fd) {}

    // Check is_open() for the result, errno is set by open(2)
    FileDescriptor(FilePath filename, int flags, mode_t mode = 0644) noexcept
    : fd_(::open(filename, flags, mode)) {}

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&&) = delete;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const noexcept { return fd_; }

    // Returns the result of close(2), so that a failed flush to disk is not lost
    [[nodiscard]] int close() noexcept { return (fd_ < 0 ? 0 : ::close(std::exchange(fd_, -1))); }

    ~FileDescriptor() { (void)close(); }
};

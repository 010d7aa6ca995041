#include <array>
#include <cerrno>
#include <minijudge/errmsg.hh>
#include <minijudge/file_contents.hh>
#include <minijudge/file_descriptor.hh>
#include <minijudge/macros/throw.hh>
#include <unistd.h>

using std::string;

size_t read_all(int fd, void* buf, size_t count) noexcept {
    size_t pos = 0;
    errno = 0;
    while (pos < count) {
        ssize_t k = read(fd, static_cast<char*>(buf) + pos, count - pos);
        if (k > 0) {
            pos += k;
        } else if (k == 0) {
            errno = 0; // End of file
            break;
        } else if (errno != EINTR) {
            break;
        }
    }

    return pos;
}

size_t write_all(int fd, const void* buf, size_t count) noexcept {
    size_t pos = 0;
    errno = 0;
    while (pos < count) {
        ssize_t k = write(fd, static_cast<const char*>(buf) + pos, count - pos);
        if (k > 0) {
            pos += k;
        } else if (k == 0 or errno != EINTR) {
            break;
        }
    }

    return pos;
}

string get_file_contents(int fd) {
    string res;
    std::array<char, 1 << 16> buff{};
    for (;;) {
        size_t len = read_all(fd, buff.data(), buff.size());
        res.append(buff.data(), len);
        if (len < buff.size()) {
            if (errno != 0) {
                THROW("read()", errmsg());
            }
            return res;
        }
    }
}

string get_file_contents(int fd, off64_t beg, off64_t end) {
    if (lseek64(fd, beg, SEEK_SET) == static_cast<off64_t>(-1)) {
        THROW("lseek64()", errmsg());
    }

    if (end < 0) {
        return get_file_contents(fd);
    }

    string res(end > beg ? end - beg : 0, '\0');
    size_t len = read_all(fd, res.data(), res.size());
    if (len != res.size() and errno != 0) {
        THROW("read()", errmsg());
    }

    res.resize(len);
    return res;
}

string get_file_contents(FilePath file) {
    FileDescriptor fd{file, O_RDONLY | O_CLOEXEC};
    if (not fd.is_open()) {
        THROW("Failed to open file `", file, '`', errmsg());
    }

    return get_file_contents(fd);
}

void put_file_contents(FilePath file, std::string_view data, mode_t mode) {
    FileDescriptor fd{file, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode};
    if (not fd.is_open()) {
        THROW("Failed to open file `", file, '`', errmsg());
    }

    if (write_all(fd, data) != data.size()) {
        THROW("write()", errmsg());
    }

    if (fd.close()) {
        THROW("close()", errmsg());
    }
}

#pragma once

#include <cstddef>
#include <minijudge/file_path.hh>
#include <string>
#include <string_view>
#include <sys/types.h>

/**
 * @brief Reads until @p count bytes are read, end of file or an error occurs
 * @details EINTR is handled internally
 *
 * @return number of bytes read; if less than @p count, errno tells whether it
 *   was an error (errno != 0) or end of file (errno == 0)
 */
size_t read_all(int fd, void* buf, size_t count) noexcept;

/**
 * @brief Writes @p count bytes unless an error occurs
 * @details EINTR is handled internally
 *
 * @return number of bytes written; if less than @p count, errno is set
 */
size_t write_all(int fd, const void* buf, size_t count) noexcept;

inline size_t write_all(int fd, std::string_view str) noexcept {
    return write_all(fd, str.data(), str.size());
}

// Reads the whole rest of the file @p fd, starting at the current offset
std::string get_file_contents(int fd);

// Reads bytes [@p beg, @p end) of @p fd, @p end == -1 means the end of file
std::string get_file_contents(int fd, off64_t beg, off64_t end = -1);

std::string get_file_contents(FilePath file);

// Creates or truncates @p file and writes @p data into it
void put_file_contents(FilePath file, std::string_view data, mode_t mode = 0644);

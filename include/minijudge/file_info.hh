#pragma once

#include <minijudge/file_path.hh>
#include <sys/stat.h>

inline bool path_exists(FilePath path) noexcept {
    struct stat64 st = {};
    return stat64(path, &st) == 0;
}

inline bool is_directory(FilePath path) noexcept {
    struct stat64 st = {};
    return (stat64(path, &st) == 0 and S_ISDIR(st.st_mode));
}

inline bool is_regular_file(FilePath path) noexcept {
    struct stat64 st = {};
    return (stat64(path, &st) == 0 and S_ISREG(st.st_mode));
}

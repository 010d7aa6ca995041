#pragma once

#include <minijudge/file_path.hh>

/**
 * @brief Removes recursively file or directory @p path
 * @details Symbolic links are removed, not followed.
 *
 * @return 0 on success, -1 on error (errno is set)
 */
int remove_r(FilePath path) noexcept;

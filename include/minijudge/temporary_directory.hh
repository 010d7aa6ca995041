#pragma once

#include <minijudge/file_path.hh>
#include <string>

class TemporaryDirectory {
    std::string path_; // absolute path with trailing '/'

public:
    TemporaryDirectory() = default; // Does NOT create a temporary directory

    // @p templ has to end with "XXXXXX" (6 characters 'X'), the directory is
    // created with mode 0700
    explicit TemporaryDirectory(FilePath templ);

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&& td) noexcept : path_(std::move(td.path_)) {
        td.path_.clear();
    }
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    // NOLINTNEXTLINE(performance-noexcept-move-constructor)
    TemporaryDirectory& operator=(TemporaryDirectory&& td);

    // Removes the directory recursively, errors are not reported
    ~TemporaryDirectory();

    // Returns true if object holds a real temporary directory
    [[nodiscard]] bool exists() const noexcept { return not path_.empty(); }

    // Directory absolute path with trailing '/'
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    /**
     * @brief Removes the directory recursively and leaves the object empty
     *
     * @errors Throws std::runtime_error if the removal fails, the object is
     *   left empty anyway
     */
    void remove();
};

#pragma once

#include <minijudge/judge/language_profile.hh>
#include <minijudge/temporary_directory.hh>
#include <optional>
#include <string>
#include <string_view>

namespace minijudge::judge {

// Ephemeral directory owned by exactly one run, removed on every exit path
class Workspace {
    TemporaryDirectory dir_;
    std::string source_path_;
    std::optional<std::string> artifact_path_;

    Workspace(
        TemporaryDirectory dir, std::string source_path, std::optional<std::string> artifact_path
    )
    : dir_(std::move(dir))
    , source_path_(std::move(source_path))
    , artifact_path_(std::move(artifact_path)) {}

public:
    /**
     * @brief Creates a fresh, uniquely named directory (mode 0700) inside
     *   @p parent_dir and writes @p source_text into
     *   <root>/<profile.source_filename()>
     *
     * @errors Throws std::runtime_error if the directory or the file cannot be
     *   created, nothing is left on disk then
     */
    static Workspace acquire(
        std::string_view parent_dir, const LanguageProfile& profile, std::string_view source_text
    );

    Workspace(const Workspace&) = delete;
    Workspace(Workspace&&) noexcept = default;
    Workspace& operator=(const Workspace&) = delete;
    Workspace& operator=(Workspace&&) = delete;

    // Removes the directory tree, errors are ignored
    ~Workspace() = default;

    [[nodiscard]] bool is_released() const noexcept { return not dir_.exists(); }

    // Absolute path with trailing '/'
    [[nodiscard]] const std::string& root() const noexcept { return dir_.path(); }

    [[nodiscard]] const std::string& source_path() const noexcept { return source_path_; }

    [[nodiscard]] const std::optional<std::string>& artifact_path() const noexcept {
        return artifact_path_;
    }

    /**
     * @brief Removes the directory tree now
     *
     * @errors Throws std::runtime_error if the removal fails
     */
    void release() { dir_.remove(); }
};

} // namespace minijudge::judge

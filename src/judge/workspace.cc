#include <minijudge/concat_tostr.hh>
#include <minijudge/file_contents.hh>
#include <minijudge/judge/workspace.hh>

using std::string;

namespace minijudge::judge {

Workspace Workspace::acquire(
    std::string_view parent_dir, const LanguageProfile& profile, std::string_view source_text
) {
    string templ{parent_dir};
    if (templ.empty() or templ.back() != '/') {
        templ += '/';
    }
    templ += "mini_judge.XXXXXX";

    TemporaryDirectory dir{templ};
    string source_path = concat_tostr(dir.path(), profile.source_filename());
    // On failure dir is removed while unwinding
    put_file_contents(source_path, source_text, 0600);

    std::optional<string> artifact_path;
    if (profile.artifact_filename) {
        artifact_path = concat_tostr(dir.path(), *profile.artifact_filename);
    }
    return {std::move(dir), std::move(source_path), std::move(artifact_path)};
}

} // namespace minijudge::judge

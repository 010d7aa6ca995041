#include <gmock/gmock-matchers.h>
#include <gtest/gtest.h>
#include <minijudge/file_contents.hh>
#include <minijudge/file_info.hh>
#include <minijudge/judge/language_profile.hh>
#include <minijudge/judge/workspace.hh>
#include <minijudge/temporary_directory.hh>
#include <sys/stat.h>

using minijudge::judge::LanguageProfile;
using minijudge::judge::Workspace;
using std::string;
using ::testing::MatchesRegex;
using ::testing::StartsWith;

namespace {

const LanguageProfile& profile(std::string_view language_id) {
    auto res = minijudge::judge::resolve(language_id);
    if (res.is_err()) {
        throw std::runtime_error(std::move(res).unwrap_err().description());
    }
    return *std::move(res).unwrap();
}

mode_t file_mode(const string& path) {
    struct stat64 st = {};
    EXPECT_EQ(stat64(path.c_str(), &st), 0) << path;
    return st.st_mode & 0777;
}

} // namespace

// NOLINTNEXTLINE
TEST(workspace, acquire_and_release) {
    TemporaryDirectory parent("/tmp/workspace-test.XXXXXX");
    auto ws = Workspace::acquire(parent.path(), profile("cpp"), "int main() {}\n");

    EXPECT_FALSE(ws.is_released());
    EXPECT_THAT(ws.root(), StartsWith(parent.path()));
    EXPECT_THAT(ws.root(), MatchesRegex(".*/mini_judge\\..{6}/"));
    EXPECT_TRUE(is_directory(ws.root()));
    EXPECT_EQ(file_mode(ws.root()), 0700);

    EXPECT_EQ(ws.source_path(), ws.root() + "code.cpp");
    EXPECT_EQ(get_file_contents(ws.source_path()), "int main() {}\n");
    EXPECT_EQ(file_mode(ws.source_path()), 0600);
    EXPECT_EQ(ws.artifact_path(), ws.root() + "program");
    EXPECT_FALSE(path_exists(*ws.artifact_path()));

    auto root = ws.root();
    ws.release();
    EXPECT_TRUE(ws.is_released());
    EXPECT_FALSE(path_exists(root));
}

// NOLINTNEXTLINE
TEST(workspace, parent_without_trailing_slash) {
    TemporaryDirectory parent("/tmp/workspace-test.XXXXXX");
    auto parent_path = parent.path();
    parent_path.pop_back();

    auto ws = Workspace::acquire(parent_path, profile("java"), "class Main {}");
    EXPECT_THAT(ws.root(), StartsWith(parent.path()));
    EXPECT_EQ(ws.source_path(), ws.root() + "Main.java");
    EXPECT_EQ(ws.artifact_path(), std::nullopt);
}

// NOLINTNEXTLINE
TEST(workspace, destructor_removes_the_directory) {
    TemporaryDirectory parent("/tmp/workspace-test.XXXXXX");
    string root;
    {
        auto ws = Workspace::acquire(parent.path(), profile("python"), "print(1)\n");
        root = ws.root();
        // Leftovers of a run are removed too
        string output_path = root + "output.txt";
        put_file_contents(output_path, "data");
        EXPECT_TRUE(path_exists(output_path));
    }
    EXPECT_FALSE(path_exists(root));
}

// NOLINTNEXTLINE
TEST(workspace, moved_from_workspace_does_not_remove) {
    TemporaryDirectory parent("/tmp/workspace-test.XXXXXX");
    auto ws = Workspace::acquire(parent.path(), profile("python"), "");
    string root = ws.root();
    {
        Workspace other = std::move(ws);
        EXPECT_TRUE(path_exists(root));
    }
    EXPECT_FALSE(path_exists(root));
}

// NOLINTNEXTLINE
TEST(workspace, distinct_runs_get_distinct_directories) {
    TemporaryDirectory parent("/tmp/workspace-test.XXXXXX");
    auto a = Workspace::acquire(parent.path(), profile("c"), "");
    auto b = Workspace::acquire(parent.path(), profile("c"), "");
    EXPECT_NE(a.root(), b.root());
}

// NOLINTNEXTLINE
TEST(workspace, nonexistent_parent_directory) {
    EXPECT_THROW(
        (void)Workspace::acquire("/nonexistent/parent", profile("c"), ""), std::runtime_error
    );
}

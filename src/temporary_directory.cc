#include <climits>
#include <cstdlib>
#include <minijudge/errmsg.hh>
#include <minijudge/file_manip.hh>
#include <minijudge/macros/throw.hh>
#include <minijudge/temporary_directory.hh>
#include <string_view>

using std::string;

TemporaryDirectory::TemporaryDirectory(FilePath templ) {
    std::string_view templ_sv = templ.to_string_view();
    if (templ_sv.size() < 6 or templ_sv.substr(templ_sv.size() - 6) != "XXXXXX") {
        THROW("Invalid temporary directory template: ", templ);
    }

    string name = templ.to_str();
    if (mkdtemp(name.data()) == nullptr) {
        THROW("Cannot create temporary directory from template `", templ, '`', errmsg());
    }

    char* abs_path = realpath(name.c_str(), nullptr);
    if (abs_path == nullptr) {
        int errnum = errno;
        (void)remove_r(name);
        THROW("realpath()", errmsg(errnum));
    }

    path_ = abs_path;
    free(abs_path); // NOLINT(cppcoreguidelines-no-malloc)
    if (path_.back() != '/') {
        path_ += '/';
    }
}

// NOLINTNEXTLINE(performance-noexcept-move-constructor): it throws
TemporaryDirectory& TemporaryDirectory::operator=(TemporaryDirectory&& td) {
    remove();
    path_ = std::move(td.path_);
    td.path_.clear();
    return *this;
}

void TemporaryDirectory::remove() {
    if (not exists()) {
        return;
    }

    string path = std::move(path_);
    path_.clear();
    if (remove_r(path) == -1) {
        THROW("remove_r(`", path, "`)", errmsg());
    }
}

TemporaryDirectory::~TemporaryDirectory() {
    if (exists()) {
        (void)remove_r(path_); // We cannot throw from the destructor
    }
}

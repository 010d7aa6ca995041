#include <cerrno>
#include <ftw.h>
#include <minijudge/file_manip.hh>
#include <unistd.h>

int remove_r(FilePath path) noexcept {
    // Children first, so that directories are empty when their turn comes
    return nftw(
        path,
        [](const char* fpath, const struct stat* /*sb*/, int typeflag, FTW* /*ftwbuf*/) {
            int rc = (typeflag == FTW_DP ? rmdir(fpath) : unlink(fpath));
            return rc == 0 ? 0 : -1;
        },
        64,
        FTW_DEPTH | FTW_PHYS
    );
}

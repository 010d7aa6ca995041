#pragma once

#include <cstdlib>
#include <string>
#include <string_view>
#include <unistd.h>

// Returns true if an executable @p name is found in one of the PATH
// directories
inline bool has_program(std::string_view name) {
    const char* path_env = std::getenv("PATH");
    std::string_view path = (path_env ? path_env : "/usr/local/bin:/usr/bin:/bin");
    while (not path.empty()) {
        auto colon = path.find(':');
        auto dir = path.substr(0, colon);
        path.remove_prefix(colon == std::string_view::npos ? path.size() : colon + 1);
        if (dir.empty()) {
            continue;
        }

        std::string candidate{dir};
        candidate += '/';
        candidate += name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

#define SKIP_WITHOUT_PROGRAM(name)                   \
    do {                                             \
        if (not has_program(name)) {                 \
            GTEST_SKIP() << (name) << " is missing"; \
        }                                            \
    } while (false)

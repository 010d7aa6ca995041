#pragma once

#include <csignal>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

extern "C" struct rusage;

namespace syscalls {

inline pid_t gettid() noexcept { return static_cast<pid_t>(syscall(SYS_gettid)); }

// Unlike glibc's waitid() this one fills @p usage
inline int
waitid(int id_type, pid_t id, siginfo_t* info, int options, struct rusage* usage) noexcept {
    return static_cast<int>(syscall(SYS_waitid, id_type, id, info, options, usage));
}

} // namespace syscalls

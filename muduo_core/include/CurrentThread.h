#pragma once

#include <sys/syscall.h>
#include <unistd.h>

namespace CurrentThread {
extern thread_local int t_cachedTid;

inline void cacheTid() {
    if (t_cachedTid == 0) {
        t_cachedTid = static_cast<int>(::syscall(SYS_gettid));
    }
}

inline int tid() {
    if (__builtin_expect(t_cachedTid == 0, 0)) {
        cacheTid();
    }
    return t_cachedTid;
}
}  // namespace CurrentThread

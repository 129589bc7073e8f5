#include "CurrentThread.h"

namespace CurrentThread {
thread_local int t_cachedTid = 0;
}  // namespace CurrentThread

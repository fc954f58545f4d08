#include "primer/heapProbe.hpp"

#include <malloc.h>
#include <sys/resource.h>
#include <unistd.h>

#include <algorithm>
#include <climits>
#include <initializer_list>

std::int64_t MallocHeapProbe::usedBytes()
{
    // uordblks: in-use arena bytes; hblkhd: bytes in mmap'd chunks.
    const struct mallinfo2 mi = mallinfo2();
    return static_cast<std::int64_t>(mi.uordblks + mi.hblkhd);
}

void MallocHeapProbe::collect()
{
    // Return value only says whether anything went back to the OS.
    (void)malloc_trim(0);
    ++collections_;
}

int estimateMaxHeapMB()
{
    const std::uint64_t mb = 1024 * 1024;
    std::uint64_t limit = 0;

    for (int resource : {RLIMIT_DATA, RLIMIT_AS}) {
        struct rlimit rl;
        if (getrlimit(resource, &rl) != 0 || rl.rlim_cur == RLIM_INFINITY)
            continue;
        const auto cur = static_cast<std::uint64_t>(rl.rlim_cur);
        limit = (limit == 0) ? cur : std::min(limit, cur);
    }

    if (limit == 0) {
        const long pages = sysconf(_SC_PHYS_PAGES);
        const long pageSize = sysconf(_SC_PAGESIZE);
        if (pages > 0 && pageSize > 0)
            limit = static_cast<std::uint64_t>(pages) * static_cast<std::uint64_t>(pageSize) / 4;
    }

    return static_cast<int>(std::min<std::uint64_t>(limit / mb, INT_MAX));
}

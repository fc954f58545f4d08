#pragma once
#include <cstdint>

// Occupancy view of the process heap plus a reclamation hint.
class HeapProbe {
public:
    virtual ~HeapProbe() = default;

    virtual std::int64_t usedBytes() = 0;
    virtual void collect() = 0;
};

// glibc allocator: in-use bytes from mallinfo2(), malloc_trim(0) as the hint.
class MallocHeapProbe : public HeapProbe {
public:
    std::int64_t usedBytes() override;
    void collect() override;

    std::uint64_t collections() const { return collections_; }

private:
    std::uint64_t collections_ = 0;
};

// Smallest finite RLIMIT_DATA / RLIMIT_AS, else a quarter of physical memory.
int estimateMaxHeapMB();

#pragma once
#include <cstddef>
#include <cstdint>

#include "primer/heapProbe.hpp"

constexpr std::int64_t kMB = 1024 * 1024;

// Measures what one allocation unit really costs on the heap: allocate a
// batch, compare occupancy before and after, divide.
//
// The result is only as good as the probe. A heap that returns memory to the
// OS mid-measurement, or a probe that does not see the batch, yields zero or
// negative values; those are returned as-is and rejected by the caller.
class FootprintCalibrator {
public:
    static constexpr std::int64_t kRoughUnitOverhead = 40; // bytes, header guess
    static constexpr std::int64_t kElementBytes = sizeof(std::int64_t);

    FootprintCalibrator(HeapProbe& heap, std::int64_t reference_volume_bytes);

    double calibrateBytesPerUnit(int shape_size);

    // Units allocated by one calibration of the given shape.
    static std::int64_t batchCount(int shape_size, std::int64_t reference_volume_bytes);

    std::int64_t referenceVolume() const { return volume_; }
    std::int64_t lastBatchCount() const { return lastBatch_; }
    std::int64_t lastBytesUsed() const { return lastBytesUsed_; }

private:
    HeapProbe&   heap_;
    std::int64_t volume_;
    std::int64_t lastBatch_ = 0;
    std::int64_t lastBytesUsed_ = 0;
};

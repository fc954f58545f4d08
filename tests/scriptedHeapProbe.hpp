#pragma once
#include <cstdint>

#include "primer/footprintCalibrator.hpp"
#include "primer/heapProbe.hpp"

// Reports a fixed occupancy growth between each pair of reads, so that a
// calibration of `shape` over `volume` bytes measures exactly bytes_per_unit.
class ScriptedHeapProbe : public HeapProbe
{
public:
    ScriptedHeapProbe(std::int64_t bytes_per_unit, int shape, std::int64_t volume)
        : growth_(bytes_per_unit * FootprintCalibrator::batchCount(shape, volume)) {}

    std::int64_t usedBytes() override
    {
        const bool after = (reads_++ % 2) == 1;
        return after ? kBase + growth_ : kBase;
    }
    void collect() override { ++collections; }

    void setGrowth(std::int64_t g) { growth_ = g; }

    int collections = 0;

private:
    static constexpr std::int64_t kBase = 64 * 1024 * 1024;
    std::int64_t growth_;
    std::uint64_t reads_ = 0;
};

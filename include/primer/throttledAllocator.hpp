#pragma once
#include <chrono>
#include <cstdint>
#include <iosfwd>

#include "primer/footprintCalibrator.hpp"
#include "primer/heapProbe.hpp"
#include "primer/retentionSet.hpp"
#include "utils/histogram.hpp"
#include "utils/stopSignal.hpp"

struct ThrottleStats
{
    double        bytes_per_unit = 0.0;
    std::int64_t  units_per_mb = 0;
    int           blocks = 0;
    std::uint64_t units_retained = 0;
    std::uint64_t units_scratch = 0;
    std::uint64_t samples = 0;
    std::uint64_t throttle_sleeps = 0;
    bool          interrupted = false;
    std::chrono::nanoseconds elapsed{0};
};

// Allocates targetTotalMB in 10 MB blocks. Every block allocates one MB
// worth of units ten times into a retained slab and the same again into a
// throwaway scratch slab, timing each allocation into the histogram. The
// loop is throttled so that combined retained + scratch volume does not
// exceed the configured rate.
class RateThrottledAllocator
{
public:
    static constexpr int kBlockMB = 10;
    static constexpr std::int64_t kNanosPerSecond = 1000000000LL;

    RateThrottledAllocator(int unit_shape_size, int alloc_rate_mb_per_sec,
                           FootprintCalibrator &calibrator, HeapProbe &heap,
                           std::ostream &log, const StopSignal *stop = nullptr);

    // Throws CalibrationError if the footprint cannot size a block, and lets
    // std::bad_alloc through untouched.
    RetentionSet run(int target_total_mb, LatencyHistogram &histogram, bool verbose);

    ThrottleStats stats() const { return stats_; } // snapshot of the last run

    // Minimum wall time per nominal MB; 0 when unthrottled.
    static std::int64_t nanosPerMB(int alloc_rate_mb_per_sec);
    static int blocksFor(int target_total_mb);

private:
    void fillSlab_(Slab &slab, std::int64_t count, LatencyHistogram &histogram);
    bool throttle_(std::chrono::steady_clock::time_point since, std::int64_t budget_ns);

    int                  shape_;
    int                  rate_;
    FootprintCalibrator &calibrator_;
    HeapProbe           &heap_;
    std::ostream        &log_;
    const StopSignal    *stop_ = nullptr; // not owned
    ThrottleStats        stats_;
};

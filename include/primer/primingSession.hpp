#pragma once
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <optional>

#include "primer/footprintCalibrator.hpp"
#include "primer/heapProbe.hpp"
#include "primer/primerConfig.hpp"
#include "primer/throttledAllocator.hpp"
#include "utils/histogram.hpp"
#include "utils/stopSignal.hpp"

struct PassReport
{
    int           index = 0;          // 1 or 2
    int           target_mb = 0;
    int           blocks = 0;
    double        bytes_per_unit = 0.0;
    std::int64_t  units_per_mb = 0;
    std::uint64_t units_retained = 0;
    std::uint64_t samples = 0;         // histogram count when the pass ended
    bool          interrupted = false;
    std::chrono::nanoseconds elapsed{0};
};

struct SessionResult
{
    PassReport                first;
    std::optional<PassReport> second;
    bool                      settle_interrupted = false;
};

// One or two priming passes with reporting. Pass 1 sizes itself from the
// estimated maximum occupancy plus a delta; pass 2 (if enabled) from pass 1
// plus its own delta, after a settle delay and a histogram reset. Each pass's
// retained units are dropped before the next one starts.
class PrimingSession
{
public:
    PrimingSession(const PrimerOptions &opts, HeapProbe &heap, std::ostream &log,
                   const StopSignal *stop = nullptr);

    SessionResult execute();

    const LatencyHistogram &histogram() const { return histogram_; }

private:
    PassReport runPass_(int index, int target_mb);
    void report_(const char *which);

    PrimerOptions          opts_;
    HeapProbe             &heap_;
    std::ostream          &log_;
    const StopSignal      *stop_ = nullptr;
    LatencyHistogram       histogram_;
    FootprintCalibrator    calibrator_;
    RateThrottledAllocator allocator_;
};

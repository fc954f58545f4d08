#include "primer/throttledAllocator.hpp"
#include "primer/primerErrors.hpp"

#include <ostream>
#include <string>
#include <thread>

using Clock = std::chrono::steady_clock;

RateThrottledAllocator::RateThrottledAllocator(int unit_shape_size, int alloc_rate_mb_per_sec,
                                               FootprintCalibrator &calibrator, HeapProbe &heap,
                                               std::ostream &log, const StopSignal *stop)
    : shape_(unit_shape_size), rate_(alloc_rate_mb_per_sec),
      calibrator_(calibrator), heap_(heap), log_(log), stop_(stop)
{
}

std::int64_t RateThrottledAllocator::nanosPerMB(int alloc_rate_mb_per_sec)
{
    // Factor 2: scratch allocations double the volume behind every nominal MB.
    return (alloc_rate_mb_per_sec != 0) ? (2 * kNanosPerSecond / alloc_rate_mb_per_sec) : 0;
}

int RateThrottledAllocator::blocksFor(int target_total_mb)
{
    int blocks = 0;
    for (std::int64_t mb = 0; mb < target_total_mb; mb += kBlockMB)
        ++blocks;
    return blocks;
}

RetentionSet RateThrottledAllocator::run(int target_total_mb, LatencyHistogram &histogram, bool verbose)
{
    stats_ = ThrottleStats{};
    const auto started = Clock::now();

    const double bytesPerUnit = calibrator_.calibrateBytesPerUnit(shape_);
    stats_.bytes_per_unit = bytesPerUnit;
    if (!(bytesPerUnit > 0.0))
    {
        throw CalibrationError("footprint calibration measured " + std::to_string(bytesPerUnit) +
                               " bytes per unit over " + std::to_string(calibrator_.lastBatchCount()) +
                               " units; heap occupancy readings are unusable");
    }
    // A unit can never take less heap than its own payload.
    const auto payloadBytes = static_cast<double>(shape_) * sizeof(std::int64_t);
    if (bytesPerUnit < payloadBytes)
    {
        throw CalibrationError("footprint calibration measured " + std::to_string(bytesPerUnit) +
                               " bytes per unit, below the " + std::to_string(static_cast<std::int64_t>(payloadBytes)) +
                               "-byte payload; heap occupancy readings are unusable");
    }
    const auto unitsPerMB = static_cast<std::int64_t>(static_cast<double>(kMB) / bytesPerUnit);
    if (unitsPerMB <= 0)
    {
        throw CalibrationError("footprint calibration measured " + std::to_string(bytesPerUnit) +
                               " bytes per unit, larger than one MB; cannot size a block");
    }
    stats_.units_per_mb = unitsPerMB;

    if (verbose)
    {
        log_ << "\t[Primer: calibrated per-unit footprint is " << kMB / unitsPerMB << " bytes]\n";
        log_ << "\t[Primer: allocating a total of " << static_cast<std::int64_t>(target_total_mb) * unitsPerMB
             << " units]\n";
    }

    const std::int64_t unitsPerBlock = unitsPerMB * kBlockMB;
    const std::int64_t blockBudget = nanosPerMB(rate_) * kBlockMB;

    RetentionSet retained;
    auto lastSleepTime = Clock::now();

    // Fixed 10 MB stride: the last block may overshoot the target.
    for (std::int64_t mb = 0; mb < target_total_mb; mb += kBlockMB)
    {
        if (stop_ && stop_->stopRequested())
        {
            stats_.interrupted = true;
            break;
        }

        Slab &slab = retained.addSlab(static_cast<std::size_t>(unitsPerBlock));
        fillSlab_(slab, unitsPerBlock, histogram);
        stats_.units_retained += static_cast<std::uint64_t>(unitsPerBlock);

        {
            Slab scratch;
            scratch.reserve(static_cast<std::size_t>(unitsPerBlock));
            fillSlab_(scratch, unitsPerBlock, histogram);
            stats_.units_scratch += static_cast<std::uint64_t>(unitsPerBlock);
        } // scratch dropped here

        ++stats_.blocks;

        if (!throttle_(lastSleepTime, blockBudget))
            stats_.interrupted = true;
        lastSleepTime = Clock::now();

        if (verbose)
            log_ << "." << std::flush;
        if (stats_.interrupted)
            break;
    }
    if (verbose)
        log_ << "\n";

    heap_.collect();
    stats_.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - started);
    return retained;
}

void RateThrottledAllocator::fillSlab_(Slab &slab, std::int64_t count, LatencyHistogram &histogram)
{
    const auto elements = static_cast<std::size_t>(shape_);
    for (std::int64_t j = 0; j < count; ++j)
    {
        auto t0 = std::chrono::high_resolution_clock::now();
        slab.push_back(allocateUnit(elements));
        auto t1 = std::chrono::high_resolution_clock::now();
        histogram.record(std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count());
    }
    stats_.samples += static_cast<std::uint64_t>(count);
}

// Sleeps in 1 ms steps until budget_ns has passed since `since`.
// Returns false if a stop was requested meanwhile.
bool RateThrottledAllocator::throttle_(Clock::time_point since, std::int64_t budget_ns)
{
    const auto budget = std::chrono::nanoseconds(budget_ns);
    while (Clock::now() - since < budget)
    {
        ++stats_.throttle_sleeps;
        if (stop_)
        {
            if (stop_->waitFor(std::chrono::milliseconds(1)))
                return false;
        }
        else
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    return true;
}

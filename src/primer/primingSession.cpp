#include "primer/primingSession.hpp"

#include <ostream>
#include <thread>

namespace
{
    const PrimerOptions &validated(const PrimerOptions &opts)
    {
        opts.validate();
        return opts;
    }
}

PrimingSession::PrimingSession(const PrimerOptions &opts, HeapProbe &heap, std::ostream &log,
                               const StopSignal *stop)
    : opts_(validated(opts)), heap_(heap), log_(log), stop_(stop),
      histogram_(opts.hist_highest_trackable, opts.hist_significant_digits),
      calibrator_(heap, static_cast<std::int64_t>(opts.calibration_volume_mb) * kMB),
      allocator_(opts.unit_shape_size, opts.alloc_rate_mb_per_sec, calibrator_, heap, log, stop)
{
}

SessionResult PrimingSession::execute()
{
    SessionResult result;
    int targetMB = static_cast<int>(opts_.firstPassMB());

    if (opts_.verbose)
        log_ << "First pass, allocating " << targetMB << " MB of objects:\n";
    result.first = runPass_(1, targetMB);
    if (opts_.verbose)
        report_("first");

    if (!opts_.two_pass || result.first.interrupted)
        return result;

    heap_.collect();
    const auto settle = std::chrono::milliseconds(opts_.settle_delay_ms);
    if (stop_)
    {
        if (stop_->waitFor(settle))
        {
            result.settle_interrupted = true;
            return result;
        }
    }
    else
    {
        std::this_thread::sleep_for(settle);
    }

    targetMB = static_cast<int>(opts_.secondPassMB());
    histogram_.reset();

    if (opts_.verbose)
        log_ << "\n\n\nSecond pass, allocating " << targetMB << " MB of objects:\n";
    result.second = runPass_(2, targetMB);
    if (opts_.verbose)
        report_("second");

    return result;
}

PassReport PrimingSession::runPass_(int index, int target_mb)
{
    PassReport r;
    r.index = index;
    r.target_mb = target_mb;

    RetentionSet retained = allocator_.run(target_mb, histogram_, opts_.verbose);
    r.units_retained = retained.unitCount();
    retained.release();
    heap_.collect();

    const ThrottleStats s = allocator_.stats();
    r.blocks = s.blocks;
    r.bytes_per_unit = s.bytes_per_unit;
    r.units_per_mb = s.units_per_mb;
    r.interrupted = s.interrupted;
    r.elapsed = s.elapsed;
    r.samples = histogram_.totalCount();
    return r;
}

void PrimingSession::report_(const char *which)
{
    log_ << "Percentile distribution for " << which << " allocation pass:";
    histogram_.outputPercentileDistribution(log_, opts_.hist_ticks_per_half_distance, 1000.0);
    log_.flush();
}

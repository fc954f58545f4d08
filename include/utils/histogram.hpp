#pragma once
#include <cstdint>
#include <iosfwd>
#include <memory>

#include "hdr_histogram.h"

// Latency histogram backed by HdrHistogram_c.
// Tracks [0, highest_trackable] with a fixed number of significant decimal
// digits. Values outside that range are clamped to its edges before they are
// recorded. Not thread-safe: owned by one recording thread.
class LatencyHistogram {
public:
    LatencyHistogram(std::int64_t highest_trackable, int significant_digits);

    void record(std::int64_t v);
    void reset();

    std::uint64_t totalCount() const { return static_cast<std::uint64_t>(h_->total_count); }
    std::int64_t minValue() const;
    std::int64_t maxValue() const { return hdr_max(h_.get()); }
    double       mean() const;
    double       stddev() const;
    std::int64_t valueAtPercentile(double percentile) const;
    std::int64_t countAt(std::int64_t v) const { return hdr_count_at_value(h_.get(), clamp_(v)); }

    std::int64_t highestTrackable() const { return h_->highest_trackable_value; }
    int          significantDigits() const { return h_->significant_figures; }
    int          bucketCount() const { return h_->bucket_count; }
    int          subBucketCount() const { return h_->sub_bucket_count; }

    // All values in [lowestEquivalent(v), highestEquivalent(v)] share one counter.
    std::int64_t lowestEquivalent(std::int64_t v) const { return hdr_lowest_equivalent_value(h_.get(), v); }
    std::int64_t highestEquivalent(std::int64_t v) const { return hdr_next_non_equivalent_value(h_.get(), v) - 1; }
    std::int64_t medianEquivalent(std::int64_t v) const { return hdr_median_equivalent_value(h_.get(), v); }
    std::int64_t equivalentRange(std::int64_t v) const { return hdr_size_of_equivalent_value_range(h_.get(), v); }

    // Percentile table driven by hdr_iter_percentile: reporting ticks double
    // every time the remaining distance to 100% halves.
    void outputPercentileDistribution(std::ostream& out, int ticks_per_half_distance,
                                      double value_scale) const;

private:
    struct Closer {
        void operator()(hdr_histogram* h) const { hdr_close(h); }
    };

    std::int64_t clamp_(std::int64_t v) const;

    std::unique_ptr<hdr_histogram, Closer> h_;
};

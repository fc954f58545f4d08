#include "utils/histogram.hpp"

#include <algorithm>
#include <cerrno>
#include <iomanip>
#include <ios>
#include <new>
#include <ostream>
#include <stdexcept>

LatencyHistogram::LatencyHistogram(std::int64_t highest_trackable, int significant_digits)
{
    hdr_histogram* raw = nullptr;
    const int rc = hdr_init(1, highest_trackable, significant_digits, &raw);
    if (rc == ENOMEM)
        throw std::bad_alloc();
    if (rc != 0 || raw == nullptr)
        throw std::invalid_argument("LatencyHistogram: highest trackable value must be >= 2 "
                                    "and significant digits in [1, 5]");
    h_.reset(raw);
}

void LatencyHistogram::record(std::int64_t v)
{
    // Cannot fail once clamped into the trackable range.
    (void)hdr_record_value(h_.get(), clamp_(v));
}

void LatencyHistogram::reset()
{
    hdr_reset(h_.get());
}

std::int64_t LatencyHistogram::minValue() const
{
    return h_->total_count ? hdr_min(h_.get()) : 0;
}

double LatencyHistogram::mean() const
{
    return h_->total_count ? hdr_mean(h_.get()) : 0.0;
}

double LatencyHistogram::stddev() const
{
    return h_->total_count ? hdr_stddev(h_.get()) : 0.0;
}

std::int64_t LatencyHistogram::valueAtPercentile(double percentile) const
{
    if (h_->total_count == 0)
        return 0;
    return hdr_value_at_percentile(h_.get(), std::min(std::max(percentile, 0.0), 100.0));
}

void LatencyHistogram::outputPercentileDistribution(std::ostream& out, int ticks_per_half_distance,
                                                    double value_scale) const
{
    std::ios saved(nullptr);
    saved.copyfmt(out);

    if (ticks_per_half_distance < 1)
        ticks_per_half_distance = 1;
    if (value_scale <= 0.0)
        value_scale = 1.0;
    const int digits = h_->significant_figures;

    out << "\n" << std::setw(12) << "Value" << " " << std::setw(14) << "Percentile" << " "
        << std::setw(10) << "TotalCount" << " " << std::setw(14) << "1/(1-Percentile)" << "\n\n";
    out << std::fixed;

    if (h_->total_count > 0) {
        hdr_iter iter;
        hdr_iter_percentile_init(&iter, h_.get(), ticks_per_half_distance);
        while (hdr_iter_next(&iter)) {
            const double fraction = iter.specifics.percentiles.percentile / 100.0;
            out << std::setprecision(digits) << std::setw(12)
                << static_cast<double>(iter.highest_equivalent_value) / value_scale << " "
                << std::setprecision(12) << std::setw(2) << fraction << " "
                << std::setw(10) << iter.cumulative_count;
            if (fraction < 1.0)
                out << " " << std::setprecision(2) << std::setw(14) << 1.0 / (1.0 - fraction);
            out << "\n";
        }
    }

    out << std::setprecision(digits)
        << "#[Mean    = " << std::setw(12) << mean() / value_scale
        << ", StdDeviation   = " << std::setw(12) << stddev() / value_scale << "]\n"
        << "#[Max     = " << std::setw(12) << static_cast<double>(maxValue()) / value_scale
        << ", Total count    = " << std::setw(12) << h_->total_count << "]\n"
        << "#[Buckets = " << std::setw(12) << h_->bucket_count
        << ", SubBuckets     = " << std::setw(12) << h_->sub_bucket_count << "]\n";

    out.copyfmt(saved);
}

std::int64_t LatencyHistogram::clamp_(std::int64_t v) const
{
    if (v < 0)
        return 0;
    if (v > h_->highest_trackable_value)
        return h_->highest_trackable_value;
    return v;
}

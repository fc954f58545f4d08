#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct PrimerOptions {
    // Reporting
    bool verbose = false;               // progress markers + percentile tables
    bool two_pass = false;              // run a second pass after settling
    std::string log_file;               // empty = stdout

    // Latency histogram (samples are nanoseconds)
    std::int64_t hist_highest_trackable = 100LL * 1000 * 1000 * 1000; // 100 s
    int hist_significant_digits = 2;
    int hist_ticks_per_half_distance = 5;

    // Delays
    int post_priming_delay_ms = 3000;   // controller sleeps this long before joining
    int settle_delay_ms = 10000;        // between pass 1 and pass 2

    // Sizing (MB = 1 MiB)
    int estimated_max_mb = 0;
    int unit_shape_size = 500;          // int64 elements per allocation unit
    int delta_mb_from_estimate = 100;
    int second_pass_delta_mb = -1000;
    int calibration_volume_mb = 256;

    // Throughput cap, 0 = unthrottled
    int alloc_rate_mb_per_sec = 800;

    // Widened so any combination of int options sums without overflow;
    // validate() requires both to fit in int.
    std::int64_t firstPassMB() const {
        return static_cast<std::int64_t>(estimated_max_mb) + delta_mb_from_estimate;
    }
    std::int64_t secondPassMB() const { return firstPassMB() + second_pass_delta_mb; }

    // Throws ConfigurationError.
    void validate() const;
};

// Parses heapprimer arguments (argv without the program name). Empty
// arguments are skipped. Throws ConfigurationError on any malformed input.
PrimerOptions parsePrimerArgs(const std::vector<std::string>& args, int estimated_max_mb);

const char* primerUsage();

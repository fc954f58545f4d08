#include "primer/primerConfig.hpp"
#include "primer/primerErrors.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

namespace
{
    int parseInt(const std::string &flag, const std::string &value)
    {
        if (value.empty())
            throw ConfigurationError(flag + ": empty value");
        errno = 0;
        char *end = nullptr;
        const long v = std::strtol(value.c_str(), &end, 10);
        if (errno == ERANGE || *end != '\0' || v < INT_MIN || v > INT_MAX)
            throw ConfigurationError(flag + ": not an integer: " + value);
        return static_cast<int>(v);
    }

    const std::string &valueFor(const std::vector<std::string> &args, std::size_t &i)
    {
        if (i + 1 >= args.size())
            throw ConfigurationError(args[i] + ": missing value");
        return args[++i];
    }
}

void PrimerOptions::validate() const
{
    if (unit_shape_size <= 0)
        throw ConfigurationError("unit shape size must be > 0");
    if (alloc_rate_mb_per_sec < 0)
        throw ConfigurationError("allocation rate must be >= 0 (0 = unthrottled)");
    if (post_priming_delay_ms < 0 || settle_delay_ms < 0)
        throw ConfigurationError("delays must be >= 0");
    if (calibration_volume_mb <= 0)
        throw ConfigurationError("calibration volume must be > 0");
    if (estimated_max_mb < 0)
        throw ConfigurationError("estimated maximum occupancy must be >= 0");
    if (hist_highest_trackable < 2)
        throw ConfigurationError("histogram highest trackable value must be >= 2");
    if (hist_significant_digits < 1 || hist_significant_digits > 5)
        throw ConfigurationError("histogram significant digits must be in [1, 5]");
    if (hist_ticks_per_half_distance < 1)
        throw ConfigurationError("percentile ticks per half distance must be >= 1");
    if (firstPassMB() < INT_MIN || firstPassMB() > INT_MAX)
        throw ConfigurationError("first pass size (estimate + delta) is out of range");
    if (two_pass && (secondPassMB() < INT_MIN || secondPassMB() > INT_MAX))
        throw ConfigurationError("second pass size (first pass + second pass delta) is out of range");
}

PrimerOptions parsePrimerArgs(const std::vector<std::string> &args, int estimated_max_mb)
{
    PrimerOptions o;
    o.estimated_max_mb = estimated_max_mb;

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string &a = args[i];
        if (a.empty())
            continue; // an empty agent-style option string splits into one empty arg
        else if (a == "-v")
            o.verbose = true;
        else if (a == "-s")
            o.two_pass = true;
        else if (a == "-i")
            o.unit_shape_size = parseInt(a, valueFor(args, i));
        else if (a == "-t")
            o.post_priming_delay_ms = parseInt(a, valueFor(args, i));
        else if (a == "-a")
            o.alloc_rate_mb_per_sec = parseInt(a, valueFor(args, i));
        else if (a == "-d")
            o.delta_mb_from_estimate = parseInt(a, valueFor(args, i));
        else if (a == "-x")
            o.second_pass_delta_mb = parseInt(a, valueFor(args, i));
        else if (a == "-m")
            o.estimated_max_mb = parseInt(a, valueFor(args, i));
        else if (a == "-w")
            o.settle_delay_ms = parseInt(a, valueFor(args, i));
        else if (a == "-l")
            o.log_file = valueFor(args, i);
        else
            throw ConfigurationError("unknown option: " + a);
    }

    o.validate();
    return o;
}

const char *primerUsage()
{
    return "Usage: heapprimer [-v] [-t postPrimingDelayMsec] [-a allocRateMBPerSec] "
           "[-d deltaMBFromEstimatedHeapSize] [-s] [-x secondPassDeltaMBFromFirstPass] "
           "[-i individualLongArrayLength] [-m estimatedHeapMB] [-w settleDelayMsec] [-l logFileName]";
}

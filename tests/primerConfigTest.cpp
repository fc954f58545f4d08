#include "primer/primerConfig.hpp"
#include "primer/primerErrors.hpp"
#include "primer/throttledAllocator.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

static void require(bool cond, const char *msg)
{
    if (!cond)
    {
        std::cerr << "[TEST] " << msg << "\n";
        std::abort();
    }
}

static bool rejects(const std::vector<std::string> &args)
{
    try
    {
        (void)parsePrimerArgs(args, 1024);
    }
    catch (const ConfigurationError &)
    {
        return true;
    }
    return false;
}

int main()
{
    std::cout << "\n==== primerConfigTest ====\n";

    {
        std::cout << "[A] defaults\n";
        PrimerOptions o = parsePrimerArgs({}, 1024);
        require(!o.verbose && !o.two_pass, "A1: quiet single pass by default");
        require(o.unit_shape_size == 500, "A2: shape size");
        require(o.post_priming_delay_ms == 3000, "A3: post-priming delay");
        require(o.alloc_rate_mb_per_sec == 800, "A4: rate");
        require(o.delta_mb_from_estimate == 100, "A5: pass-1 delta");
        require(o.second_pass_delta_mb == -1000, "A6: pass-2 delta");
        require(o.settle_delay_ms == 10000, "A7: settle delay");
        require(o.log_file.empty(), "A8: log to stdout");
        require(o.hist_highest_trackable == 100000000000LL, "A9: highest trackable");
        require(o.hist_significant_digits == 2 && o.hist_ticks_per_half_distance == 5, "A10: histogram precision");
        require(o.estimated_max_mb == 1024, "A11: estimate passed through");
    }

    {
        std::cout << "[B] every flag\n";
        PrimerOptions o = parsePrimerArgs({"-v", "-s", "-i", "250", "-t", "0", "-a", "0", "-d", "-50",
                                           "-x", "200", "-m", "2048", "-w", "5", "-l", "/tmp/primer.log"},
                                          1024);
        require(o.verbose && o.two_pass, "B1: -v -s");
        require(o.unit_shape_size == 250, "B2: -i");
        require(o.post_priming_delay_ms == 0, "B3: -t");
        require(o.alloc_rate_mb_per_sec == 0, "B4: -a 0 means unthrottled");
        require(o.delta_mb_from_estimate == -50, "B5: negative -d");
        require(o.second_pass_delta_mb == 200, "B6: -x");
        require(o.estimated_max_mb == 2048, "B7: -m overrides the estimate");
        require(o.settle_delay_ms == 5, "B8: -w");
        require(o.log_file == "/tmp/primer.log", "B9: -l");
        require(o.firstPassMB() == 1998, "B10: pass-1 size");
        require(o.secondPassMB() == 2198, "B11: pass-2 size");
    }

    {
        std::cout << "[C] empty arguments are skipped\n";
        PrimerOptions o = parsePrimerArgs({"", "-v", ""}, 1024);
        require(o.verbose, "C1: -v between empty args");
    }

    {
        std::cout << "[D] malformed input\n";
        require(rejects({"-q"}), "D1: unknown flag");
        require(rejects({"-a"}), "D2: missing value");
        require(rejects({"-a", "fast"}), "D3: non-integer value");
        require(rejects({"-a", "12x"}), "D4: trailing garbage");
        require(rejects({"-a", "-1"}), "D5: negative rate");
        require(rejects({"-i", "0"}), "D6: zero shape size");
        require(rejects({"-t", "-5"}), "D7: negative delay");
        require(rejects({"-d", "99999999999"}), "D8: out of int range");
        require(rejects({"-m", "100", "-d", "2147483647"}), "D9: pass-1 size overflows int");
        require(rejects({"-m", "-1"}), "D10: negative estimate");
        require(rejects({"-s", "-m", "100", "-d", "0", "-x", "2147483647"}), "D11: pass-2 size overflows int");
        require(!rejects({"-m", "100", "-d", "0", "-x", "2147483647"}), "D12: pass-2 size ignored without -s");
        PrimerOptions wide = parsePrimerArgs({"-m", "2147483647", "-d", "-2147483648", "-x", "-2147483648"}, 0);
        require(wide.firstPassMB() == -1, "D13: extreme deltas sum without overflow");
        require(wide.secondPassMB() == -2147483649LL, "D14: pass-2 size is computed wide");
    }

    {
        std::cout << "[E] reference scenario sizing\n";
        PrimerOptions o;
        o.estimated_max_mb = 1024;
        require(o.firstPassMB() == 1124, "E1: 1024 + 100");
        require(RateThrottledAllocator::blocksFor(o.firstPassMB()) == 113, "E2: 113 blocks of 10 MB");
        const std::int64_t floorNs =
            113LL * RateThrottledAllocator::kBlockMB * RateThrottledAllocator::nanosPerMB(o.alloc_rate_mb_per_sec);
        require(floorNs == 2825LL * 1000 * 1000, "E3: 113 blocks at 800 MB/s take at least 2825 ms");
    }

    std::cout << "[OK] primerConfigTest passed.\n";
    return 0;
}

// main.cpp
#include <signal.h>
#include <time.h>

#include <chrono>
#include <exception>
#include <fstream>
#include <iostream>
#include <new>
#include <string>
#include <vector>

#include "primer/heapProbe.hpp"
#include "primer/primerConfig.hpp"
#include "primer/primerErrors.hpp"
#include "primer/primingSession.hpp"
#include "utils/backgroundTask.hpp"

int main(int argc, char **argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);

    PrimerOptions opts;
    try
    {
        opts = parsePrimerArgs(args, estimateMaxHeapMB());
    }
    catch (const ConfigurationError &e)
    {
        std::cerr << "heapprimer: " << e.what() << "\n" << primerUsage() << "\n";
        return 1;
    }

    std::ofstream logFile;
    std::ostream *log = &std::cout;
    if (!opts.log_file.empty())
    {
        logFile.open(opts.log_file, std::ios::out | std::ios::trunc);
        if (!logFile)
        {
            std::cerr << "heapprimer: Failed to open log file.\n";
            return 1;
        }
        log = &logFile;
    }

    if (opts.verbose)
    {
        *log << "Executing: heapprimer";
        for (const auto &a : args)
            *log << " " << a;
        *log << "\n";
    }

    // SIGINT/SIGTERM are taken synchronously by the watcher task below so the
    // priming worker can stop between allocations and still report.
    sigset_t stopSignals;
    sigemptyset(&stopSignals);
    sigaddset(&stopSignals, SIGINT);
    sigaddset(&stopSignals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr) != 0)
        std::cerr << "[Primer] could not block SIGINT/SIGTERM; interrupts will not be reported\n";

    MallocHeapProbe heap;
    BackgroundTask primer("HeapPrimer");
    BackgroundTask watcher("HeapPrimerSig");
    PrimingSession session(opts, heap, *log, &primer.stopSignal());
    SessionResult result;

    primer.start([&session, &result](const StopSignal &) { result = session.execute(); });
    watcher.start([&primer, stopSignals](const StopSignal &stop) {
        while (!stop.stopRequested())
        {
            struct timespec timeout = {0, 100 * 1000 * 1000};
            if (sigtimedwait(&stopSignals, nullptr, &timeout) > 0)
            {
                primer.requestStop();
                return;
            }
        }
    });

    // Woken early only if a signal already stopped the worker.
    (void)primer.stopSignal().waitFor(std::chrono::milliseconds(opts.post_priming_delay_ms));

    int rc = 0;
    try
    {
        primer.join();
    }
    catch (const std::bad_alloc &e)
    {
        log->flush();
        std::cerr << "heapprimer: allocation failed: " << e.what() << "\n";
        rc = 2;
    }
    catch (const std::exception &e)
    {
        log->flush();
        std::cerr << "heapprimer: " << e.what() << "\n";
        rc = 2;
    }

    watcher.requestStop();
    watcher.join();

    if (rc == 0 && opts.verbose && (result.first.interrupted || result.settle_interrupted ||
                                    (result.second && result.second->interrupted)))
        *log << "heapprimer: priming interrupted\n";
    log->flush();
    return rc;
}

// idle.cpp: idles for a while, exits early when stdin is severed.
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

#include "utils/backgroundTask.hpp"

struct IdleOptions
{
    long long run_time_ms = 10000; // 0 = until stdin closes
    bool verbose = false;
};

static bool parse(int argc, char **argv, IdleOptions &o)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string a = argv[i];
        if (a == "-v")
        {
            o.verbose = true;
        }
        else if (a == "-t" && i + 1 < argc)
        {
            char *end = nullptr;
            errno = 0;
            o.run_time_ms = std::strtoll(argv[++i], &end, 10);
            if (errno != 0 || *end != '\0' || o.run_time_ms < 0)
                return false;
        }
        else
        {
            return false;
        }
    }
    return true;
}

int main(int argc, char **argv)
{
    IdleOptions o;
    if (!parse(argc, argv, o))
    {
        std::cerr << "Usage: idle [-v] [-t runTimeMs]\n";
        return 1;
    }

    if (o.verbose)
    {
        std::cout << "Executing: idle";
        for (int i = 1; i < argc; ++i)
            std::cout << " " << argv[i];
        std::cout << "\n";
    }

    BackgroundTask idler("Idle");
    BackgroundTask reader("IdleReader");
    bool severed = false; // written by reader, read after reader.join()

    idler.start([&o](const StopSignal &stop) {
        if (o.verbose)
            std::cout << "Idling for " << o.run_time_ms << "msec..." << std::endl;
        const auto started = std::chrono::steady_clock::now();
        const auto runTime = std::chrono::milliseconds(o.run_time_ms);
        while (o.run_time_ms == 0 || std::chrono::steady_clock::now() - started < runTime)
        {
            if (stop.waitFor(std::chrono::milliseconds(100)))
            {
                if (o.verbose)
                    std::cout << "Idle terminating..." << std::endl;
                return;
            }
        }
    });

    reader.start([&idler, &severed](const StopSignal &stop) {
        struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
        char buf[512];
        while (!stop.stopRequested())
        {
            const int ready = poll(&pfd, 1, 100);
            if (ready == 0)
                continue;
            if (ready < 0)
            {
                if (errno == EINTR)
                    continue;
                severed = true;
                break;
            }
            const ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
            if (n > 0 || (n < 0 && errno == EINTR))
                continue;
            severed = true; // EOF or read error
            break;
        }
        if (severed)
            idler.requestStop();
    });

    idler.join();
    reader.requestStop();
    reader.join();
    return severed ? 1 : 0;
}

#ifndef LOGGING_HH
#define LOGGING_HH

#include <sys/resource.h> // getrusage
#include <sys/time.h> // gettimeofday
#include <stdio.h>
#include <stdlib.h>
#include <string.h> // strncmp
#include <string>
#include <iostream>
#include <chrono>
#include <thread>
#include <atomic>

/** Progress messages on stderr, prefixed by elapsed time and resident
 *  memory:
 *     logging log("route_sp");
 *     double t = log.lap();
 *     ...
 *     log.cerr(t) << "read "<< m <<" edges\n"; // "route_sp +0.12s 3m : ..."
 *  A quiet logger swallows messages. Clock and memory are sampled by a
 *  background thread every 10ms. */
class logging {

private:

    static long long int mem_usage_kb() {
        FILE* file = fopen("/proc/self/status", "r");
        if (file) {
            long long int result = -1;
            char line[128];
            while (fgets(line, 128, file) != NULL) {
                if (strncmp(line, "VmRSS:", 6) == 0) {
                    const char* p = line;
                    while (*p != '\0' && (*p < '0' || *p > '9')) p++;
                    result = atoll(p); // stops at " kB"
                    break;
                }
            }
            fclose(file);
            return result;
        }
        struct rusage usage;
        getrusage(RUSAGE_SELF, &usage);
        return usage.ru_maxrss; // kB on linux
    }

    static double time_s() {
        struct timeval tv;
        gettimeofday(&tv, NULL);
        return tv.tv_sec + tv.tv_usec * 1e-6;
    }

    // Discards everything written to it.
    class null_buffer : public std::streambuf {
    protected:
        int overflow(int c) override { return traits_type::not_eof(c); }
    };

    std::atomic<double> t_now;
    std::atomic<long long int> mem_now;
    std::atomic<bool> running;
    std::thread sampler;

    double t_init, t_last, t_prog;
    std::string prefix;
    bool quiet;
    null_buffer null_buf;
    std::ostream null_out;

public:
    logging(std::string pref = "", bool quiet = false)
        : prefix(pref), quiet(quiet), null_out(&null_buf) {
        t_now = time_s();
        mem_now = mem_usage_kb();
        running = true;
        sampler = std::thread([this](){
                std::chrono::milliseconds ms10(10);
                while (running.load(std::memory_order_acquire)) {
                    std::this_thread::sleep_for(ms10);
                    t_now.store(time_s(), std::memory_order_release);
                    mem_now.store(mem_usage_kb(), std::memory_order_release);
                }
            });
        t_init = t_now;
        t_last = 0.;
        t_prog = 1.;
    }

    ~logging() {
        running.store(false, std::memory_order_release);
        sampler.join();
    }

    double lap() {
        t_now = time_s();
        return t_now;
    }

    // True at geometrically spaced times, to throttle messages in loops.
    bool progress(float fact = 1.0) {
        if (t_now.load(std::memory_order_acquire) >= t_last + fact*t_prog) {
            t_last = t_now.load(std::memory_order_acquire);
            t_prog *= 1.2;
            return true;
        }
        return false;
    }

    // Time is relative to [t_lap] if given, to creation otherwise.
    std::ostream & cerr(double t_lap = 0.) {
        if (quiet) return null_out;
        bool incr = true;
        if (t_lap == 0.) { t_lap = t_init; incr = false; }
        std::cerr << prefix << (prefix.size() > 0 ? " " : "")
                  << (incr ? "+" : "")
                  << (t_now.load(std::memory_order_acquire) - t_lap) <<"s "
                  << mem_now.load(std::memory_order_acquire) / 1000 << "m "
                  <<": ";
        return std::cerr;
    }

};

#endif // LOGGING_HH

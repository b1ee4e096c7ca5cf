/*
 * Copyright 2017-2018 Tom van Dijk, Johannes Kepler University Linz
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sys/time.h>

#include <boost/iostreams/categories.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <cxxopts.hpp>

#include "roundrobin/verifier.hpp"

using namespace rr;

/*------------------------------------------------------------------------*/

static double
wctime()
{
    struct timeval time;
    gettimeofday(&time, NULL);
    return time.tv_sec + 1E-6 * time.tv_usec;
}

static double t_start;

/*------------------------------------------------------------------------*/

// timestamp_filter adds a timestamp at the beginning of every line.
namespace io = boost::iostreams;
class timestamp_filter : public io::output_filter
{
public:
    timestamp_filter() {}
    struct category : io::output_filter::category, io::flushable_tag { };

    template<typename Sink> bool put(Sink& snk, char c);
    template<typename Device> void close(Device&);
    template<typename Sink> bool flush(Sink& snk);

private:
    bool is_start = true;
    char sz[16];
    const char* pos = NULL;
    const char* end = NULL;
};

template<typename Sink>
bool timestamp_filter::put(Sink& dest, char c)
{
    if (is_start) {
        is_start = false;
        pos = sz;
        end = sz + snprintf(sz, 16, "[% 8.2f] ", wctime() - t_start);
    }

    while (pos != end) {
        if (!io::put(dest, *pos)) return false;
        pos++;
    }

    if (!io::put(dest, c)) return false;
    if (c == '\n') is_start = true;

    return true;
}

template<typename Sink>
bool timestamp_filter::flush(Sink& dest)
{
    while (pos != end) {
        if (!io::put(dest, *pos)) return false;
        pos++;
    }

    return io::flush(dest);
}

template<typename Device>
void timestamp_filter::close(Device&)
{
    is_start = true;
    pos = end = NULL;
}

// global variable so the signal handler can work with it
io::filtering_ostream out;

/*------------------------------------------------------------------------*/

static void (*sig_int_handler)(int);

static void
catchsig(int sig)
{
    if (sig == SIGINT) {
        (void)signal(SIGINT, sig_int_handler);
        out << std::endl << "received INT signal" << std::endl;
        out.flush();
        exit(-SIGINT);
    }
}

/*------------------------------------------------------------------------*/

int main(int argc, char **argv)
{
    t_start = wctime();

    cxxopts::Options opts(argv[0], "Verify the round robin matchings for a range of vertex counts");
    opts.custom_help("[OPTIONS...] [[MIN] MAX]");
    opts.add_options()
        ("help", "Print help")
        ("t,trace", "Log every matching")
        ("w,workers", "Number of workers, or -1 for sequential, 0 for autodetect", cxxopts::value<int>()->default_value("-1"))
        ("bounds", "Range of vertex counts", cxxopts::value<std::vector<int>>())
        ;
    opts.parse_positional(std::vector<std::string>({"bounds"}));

    /* Parse command line */
    auto options = opts.parse(argc, argv);

    if (options.count("help")) {
        std::cout << opts.help() << std::endl;
        return 0;
    }

    // no bounds: 2 .. 100, one bound: 2 .. MAX, two bounds: MIN .. MAX
    int min_n = 2, max_n = 100;
    if (options.count("bounds")) {
        auto bounds = options["bounds"].as<std::vector<int>>();
        if (bounds.size() == 1) {
            max_n = bounds[0];
        } else if (bounds.size() == 2) {
            min_n = bounds[0];
            max_n = bounds[1];
        } else {
            std::cerr << "expecting at most two bounds" << std::endl;
            return -1;
        }
    }

    /* Setup timestamp filter */

    out.push(timestamp_filter());
    out.push(std::cout);

    sig_int_handler = signal(SIGINT, catchsig);

    Verifier v(out);
    v.setWorkers(options["workers"].as<int>());
    v.setTrace(options.count("trace"));

    double begin = wctime();
    int failed = v.verify_range(min_n, max_n);
    double end = wctime();

    out << "Test complete: vertices from " << min_n << " to " << max_n << " tested." << std::endl;
    out << v.numberOfPairs() << " pairs checked in " << std::fixed << std::setprecision(2) << (end-begin) << " sec." << std::endl;
    if (failed) out << "\033[1;31m" << failed << " vertex counts failed\033[m" << std::endl;

    (void)signal(SIGINT, sig_int_handler);
    return failed ? 1 : 0;
}

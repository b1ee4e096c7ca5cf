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

#ifndef RR_VERIFIER_HPP
#define RR_VERIFIER_HPP

#include <atomic>
#include <iostream>
#include <string>
#include <vector>

#include <boost/dynamic_bitset.hpp>

#include "roundrobin/error.hpp"
#include "roundrobin/factorization.hpp"
#include "lace.h"

namespace rr {

class Verifier
{
public:
    Verifier(std::ostream &logger=std::cout) : logger(logger) { }

    /**
     * Check that <matchings> is a 1-factorization of the complete graph on <n> vertices.
     * Throws DuplicatePairError if a pair occurs twice,
     * or IncompleteCoverageError if some pair never occurs.
     */
    template <typename Sequence> void check(int n, const Sequence &matchings);

    /**
     * Generate the matchings for <n> vertices and check them.
     */
    void verify(int n);

    /**
     * Verify every even n with min_n <= n < max_n.
     * Every n is reported to the logger; a failure does not stop the scan.
     * Returns the number of n that failed.
     */
    int verify_range(int min_n, int max_n);

    /**
     * Set the number of Lace workers for verify_range.
     * -1 for sequential code, 0 for autodetect.
     */
    void setWorkers(int count) { workers = count; }

    /**
     * Set verbosity level (0 = normal, 1 = log every matching)
     */
    void setTrace(int level) { trace = level; }

    /**
     * Return the number of checked pairs.
     */
    long numberOfPairs(void) { return n_pairs; }

    int verify_range_rec(WorkerP*, Task*, int first, int count);
    void run_par(WorkerP*, Task*);

protected:
    /**
     * Verify <n> and store the diagnostic in <message> (empty when passed).
     */
    bool verify_one(int n, std::string &message);

    std::ostream &logger;
    int workers = -1;
    int trace = 0;
    std::atomic<long> n_pairs{0};

    // state of a parallel range run, task i verifies n = par_first + 2*i
    int par_first = 0;
    int par_count = 0;
    int par_failed = 0;
    std::vector<std::string> messages;
};

template <typename Sequence>
void
Verifier::check(int n, const Sequence &matchings)
{
    typedef boost::dynamic_bitset<unsigned long long> bitset;
    std::vector<bitset> data(n, bitset(n));

    long pairs = 0;
    int index = 0;
    for (const Matching &matching : matchings) {
        if (trace) logger << "matching " << (++index) << ": " << matching << std::endl;
        for (auto &p : matching) {
            const int a = p.first, b = p.second;
            if (a < 0 or a >= n or b < 0 or b >= n or a == b) LOGIC_ERROR;
            if (data[b][a]) throw DuplicatePairError(a, b, __FILE__, __LINE__);
            if (data[a][b]) throw DuplicatePairError(b, a, __FILE__, __LINE__);
            data[a][b] = true;
            data[b][a] = true;
            pairs++;
        }
    }
    n_pairs += pairs;

    for (int v=0; v<n; v++) {
        const int count = (int)data[v].count();
        if (count != n-1) throw IncompleteCoverageError(v, count, n-1, __FILE__, __LINE__);
    }
}

}

#endif

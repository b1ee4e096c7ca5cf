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

#include <boost/dynamic_bitset.hpp>

#include "roundrobin/matching.hpp"
#include "roundrobin/error.hpp"

namespace rr {

int
two_factors(long n)
{
    if (n == 0) throw InvalidInputError("two_factors input cannot be zero", __FILE__, __LINE__);
    if (n < 0) n = -n;

    int count = 0;
    while ((n & 1) == 0) {
        n >>= 1;
        count++;
    }
    return count;
}

bool
is_perfect_matching(int n, const Matching &matching)
{
    if (n <= 0 or (n & 1)) return false;
    if ((long)matching.size() * 2 != n) return false;

    boost::dynamic_bitset<unsigned long long> seen(n);
    for (auto &p : matching) {
        if (p.first < 0 or p.first >= n) return false;
        if (p.second < 0 or p.second >= n) return false;
        if (p.first == p.second) return false;
        if (seen[p.first] or seen[p.second]) return false;
        seen[p.first] = true;
        seen[p.second] = true;
    }
    return seen.all();
}

std::ostream&
operator<<(std::ostream &out, const Pair &pair)
{
    out << "(" << pair.first << "," << pair.second << ")";
    return out;
}

std::ostream&
operator<<(std::ostream &out, const Matching &matching)
{
    bool first = true;
    for (auto &p : matching) {
        if (!first) out << " ";
        out << p;
        first = false;
    }
    return out;
}

}

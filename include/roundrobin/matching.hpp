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

#ifndef RR_MATCHING_HPP
#define RR_MATCHING_HPP

#include <ostream>
#include <utility>
#include <vector>

namespace rr {

/**
 * A pair of distinct vertices. Vertices are the integers 0 .. n-1.
 */
typedef std::pair<int, int> Pair;

/**
 * A perfect matching: n/2 pairs such that every vertex occurs in exactly one pair.
 */
typedef std::vector<Pair> Matching;

/**
 * Number of times <n> is divisible by 2 before it becomes odd.
 * Throws InvalidInputError for 0.
 */
int two_factors(long n);

/**
 * Element of <elements> at position <index> modulo the number of elements.
 * The index may be negative or exceed the size.
 */
inline int wrap_at(const std::vector<int> &elements, long index)
{
    const long len = (long)elements.size();
    long i = index % len;
    if (i < 0) i += len;
    return elements[i];
}

/**
 * Check whether the pairs of <matching> partition the vertices 0 .. n-1.
 */
bool is_perfect_matching(int n, const Matching &matching);

std::ostream& operator<<(std::ostream &out, const Pair &pair);
std::ostream& operator<<(std::ostream &out, const Matching &matching);

}

#endif

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

#include <algorithm>
#include <iostream>
#include <set>
#include <vector>

#include "roundrobin/factorization.hpp"

using namespace rr;

static int failures = 0;

static void
report(bool good, const std::string &what)
{
    if (good) {
        std::cout << "\033[38;5;82mok\033[m " << what << std::endl;
    } else {
        std::cout << "\033[38;5;196mFAILED\033[m " << what << std::endl;
        failures++;
    }
}

static Pair
normalized(const Pair &p)
{
    return p.first < p.second ? p : Pair(p.second, p.first);
}

/**
 * Every matching is perfect and every pair occurs exactly once.
 */
static bool
is_one_factorization(int n, const std::vector<Matching> &matchings)
{
    if ((int)matchings.size() != n-1) return false;
    std::set<Pair> seen;
    for (auto &m : matchings) {
        if (!is_perfect_matching(n, m)) return false;
        for (auto &p : m) {
            if (!seen.insert(normalized(p)).second) return false;
        }
    }
    return (long)seen.size() == (long)n*(n-1)/2;
}

template <typename E>
static bool
throws(int n)
{
    try {
        generate(n);
    } catch (E &err) {
        return true;
    }
    return false;
}

static void
test_two_factors()
{
    report(two_factors(2) == 1, "two_factors(2) == 1");
    report(two_factors(12) == 2, "two_factors(12) == 2");
    report(two_factors(96) == 5, "two_factors(96) == 5");
    report(two_factors(7) == 0, "two_factors(7) == 0");
    report(two_factors(-8) == 3, "two_factors(-8) == 3");

    bool thrown = false;
    try {
        two_factors(0);
    } catch (InvalidInputError &err) {
        thrown = true;
    }
    report(thrown, "two_factors(0) throws InvalidInputError");
}

static void
test_wrap_at()
{
    std::vector<int> elements = {10, 11, 12, 13, 14, 15};
    report(wrap_at(elements, 0) == 10, "wrap_at index 0");
    report(wrap_at(elements, 7) == 11, "wrap_at index past the end");
    report(wrap_at(elements, -1) == 15, "wrap_at index -1");
    report(wrap_at(elements, -8) == 14, "wrap_at index below -size");
}

static void
test_invalid_input()
{
    report(throws<InvalidInputError>(0), "zero vertices rejected");
    report(throws<InvalidInputError>(5), "odd number of vertices rejected");
    report(throws<InvalidInputError>(-4), "negative number of vertices rejected");
    report(!throws<InvalidInputError>(8), "eight vertices accepted");

    std::string zero, odd;
    try { generate(0); } catch (InvalidInputError &err) { zero = err.message(); }
    try { generate(3); } catch (InvalidInputError &err) { odd = err.message(); }
    report(zero != odd, "zero has its own diagnostic");
}

static void
test_small_cases()
{
    {
        auto m = generate(2).collect();
        report(m.size() == 1 and m[0] == Matching{{0, 1}}, "2 vertices: [(0,1)]");
    }
    {
        auto m = generate(4).collect();
        std::vector<Matching> expected = {
            {{0, 1}, {2, 3}},
            {{0, 3}, {2, 1}},
            {{0, 2}, {1, 3}},
        };
        report(m == expected, "4 vertices: offsets 1 and 3, then one rotation matching");
    }
    {
        auto m = generate(6).collect();
        std::vector<Matching> expected = {
            {{0, 1}, {2, 3}, {4, 5}},
            {{0, 5}, {4, 3}, {2, 1}},
            {{0, 3}, {1, 5}, {2, 4}},
            {{1, 4}, {2, 0}, {3, 5}},
            {{2, 5}, {3, 1}, {4, 0}},
        };
        report(m == expected, "6 vertices: two offset matchings, three rotation matchings");
        report(is_one_factorization(6, m), "6 vertices: all 15 pairs exactly once");
    }
}

static void
test_regimes()
{
    // 12 = 4*3: offsets 4 and 8 (multiples of 4) and 6 (n/2) are rotation offsets
    std::vector<int> rotation;
    for (int i=1; i<12; i++) if (is_rotation_offset(12, i)) rotation.push_back(i);
    report(rotation == std::vector<int>({4, 6, 8}), "rotation offsets of 12");
    report(rotation_count(12) == 3, "12 vertices: 3 rotation matchings");
    report(rotation_subgraph(12, 1) == std::vector<int>({1, 3, 5, 7, 9, 11}), "rotation subgraph 1 of 12");

    // 8 = 8*1: every odd offset is an offset matching, the rest is one rotation matching
    report(rotation_count(8) == 1, "8 vertices: 1 rotation matching");
    report(rotation_matching(8, 0) == Matching{{0, 4}, {1, 5}, {2, 6}, {3, 7}}, "8 vertices: rotation matching pairs opposite vertices");

    // gcd(12, 10) = 2: two cycles of length 6
    report(offset_matching(12, 10) == Matching{{0, 10}, {8, 6}, {4, 2}, {1, 11}, {9, 7}, {5, 3}}, "offset matching with two cycles");

    std::vector<int> elements = {0, 1, 2, 3, 4, 5};
    report(rotate_pairs(elements, 0) == Matching{{0, 3}, {1, 5}, {2, 4}}, "rotation step 0");
    report(rotate_pairs(elements, 2) == Matching{{2, 5}, {3, 1}, {4, 0}}, "rotation step 2");
}

static void
test_range()
{
    bool count = true, valid = true;
    for (int n=2; n<=130; n+=2) {
        Factorization f = generate(n);
        int matchings = 0;
        for (auto it=f.begin(); it!=f.end(); ++it) matchings++;
        if (matchings != n-1 or f.size() != n-1) count = false;
        if (!is_one_factorization(n, f.collect())) {
            std::cout << "not a 1-factorization: " << n << " vertices" << std::endl;
            valid = false;
        }
    }
    report(count, "n-1 matchings for every even n up to 130");
    report(valid, "1-factorization for every even n up to 130");
}

static void
test_restart()
{
    Factorization f = generate(30);
    auto first = f.collect();
    auto second = f.collect();
    auto other = generate(30).collect();
    report(first == second and first == other, "iterating again yields the same sequence");

    // two iterators over the same factorization do not share state
    auto a = f.begin();
    auto b = f.begin();
    ++a;
    ++a;
    report(*b == first[0] and *a == first[2], "iterators are independent");
}

int
main(int, char**)
{
    test_two_factors();
    test_wrap_at();
    test_invalid_input();
    test_small_cases();
    test_regimes();
    test_range();
    test_restart();

    if (failures) std::cout << "\033[38;5;196m" << failures << " checks failed\033[m" << std::endl;
    return failures ? 1 : 0;
}

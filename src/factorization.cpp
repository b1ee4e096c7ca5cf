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

#include <numeric>

#include "roundrobin/factorization.hpp"

namespace rr {

bool
is_rotation_offset(int n, int offset)
{
    const int power = 1 << two_factors(n); // largest power of two dividing n
    return (offset % power) == 0 or offset == n/2;
}

Matching
offset_matching(int n, int offset)
{
    Matching res;
    res.reserve(n/2);

    // stepping by <offset> gives <g> cycles of length <len>, each of even length
    const int g = std::gcd(n, offset);
    const int len = n / g;
    if (len & 1) LOGIC_ERROR;

    for (int k=0; k<g; k++) {
        for (int j=0; j<len; j+=2) {
            const int a = (int)((k + (long)j * offset) % n);
            const int b = (int)((k + (long)(j+1) * offset) % n);
            res.emplace_back(a, b);
        }
    }
    return res;
}

int
rotation_count(int n)
{
    const int r = 1 << (two_factors(n) - 1);
    return n / r / 2;
}

std::vector<int>
rotation_subgraph(int n, int s)
{
    const int r = 1 << (two_factors(n) - 1);
    std::vector<int> res;
    res.reserve(n / r);
    for (int i=s; i<s+n; i+=r) res.push_back(i % n);
    return res;
}

Matching
rotate_pairs(const std::vector<int> &elements, int step)
{
    if (elements.empty() or (elements.size() & 1)) LOGIC_ERROR;

    const int halflen = (int)elements.size() / 2;

    Matching res;
    res.reserve(halflen);
    res.emplace_back(wrap_at(elements, step), wrap_at(elements, step + halflen));
    for (int d=1; d<halflen; d++) {
        res.emplace_back(wrap_at(elements, step + d), wrap_at(elements, step - d));
    }
    return res;
}

Matching
rotation_matching(int n, int step)
{
    const int r = 1 << (two_factors(n) - 1);

    Matching res;
    res.reserve(n/2);
    for (int s=0; s<r; s++) {
        Matching part = rotate_pairs(rotation_subgraph(n, s), step);
        res.insert(res.end(), part.begin(), part.end());
    }
    return res;
}

Factorization::Factorization(int n) : n(n)
{
    if (n == 0) throw InvalidInputError("number of vertices cannot be zero", __FILE__, __LINE__);
    if (n < 0) throw InvalidInputError("number of vertices must be positive", __FILE__, __LINE__);
    if (n & 1) throw InvalidInputError("number of vertices must be even", __FILE__, __LINE__);
}

std::vector<Matching>
Factorization::collect() const
{
    std::vector<Matching> res;
    res.reserve(size());
    for (auto &m : *this) res.push_back(m);
    return res;
}

Factorization::const_iterator::const_iterator(int n, int offset, int step) : n(n), offset(offset), step(step)
{
    skip_rotation_offsets();
    load();
}

void
Factorization::const_iterator::skip_rotation_offsets()
{
    while (offset < n and is_rotation_offset(n, offset)) offset++;
}

void
Factorization::const_iterator::load()
{
    if (offset < n) current = offset_matching(n, offset);
    else if (step < rotation_count(n)) current = rotation_matching(n, step);
    else current.clear();
}

Factorization::const_iterator&
Factorization::const_iterator::operator++()
{
    if (offset < n) {
        offset++;
        skip_rotation_offsets();
    } else {
        step++;
    }
    load();
    return *this;
}

}

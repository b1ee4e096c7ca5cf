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

#ifndef RR_FACTORIZATION_HPP
#define RR_FACTORIZATION_HPP

#include <cstddef>
#include <iterator>
#include <vector>

#include "roundrobin/error.hpp"
#include "roundrobin/matching.hpp"

namespace rr {

/**
 * Offset matchings.
 *
 * Stepping around the n-cycle of vertices by <offset> splits the vertices into
 * gcd(n, offset) cycles of length n/gcd(n, offset). If that length is even, every
 * other edge of each cycle together form a perfect matching.
 *
 * The offsets for which this does not work (multiples of the largest power of two
 * dividing n, and n/2 itself) are covered by the rotation matchings instead.
 */
bool is_rotation_offset(int n, int offset);

/**
 * The perfect matching obtained by taking alternate edges of the cycles of step <offset>.
 * Requires !is_rotation_offset(n, offset).
 */
Matching offset_matching(int n, int offset);

/**
 * Rotation matchings.
 *
 * The vertices are split into r = 2^(two_factors(n)-1) subgraphs by residue
 * modulo r. Every subgraph has twice an odd number of vertices. Each subgraph
 * is matched with its "diametric" pair plus the pairs symmetric around it,
 * which is then rotated one position per step.
 */
int rotation_count(int n);

/**
 * The vertices s, s+r, s+2r, ... of rotation subgraph <s>.
 */
std::vector<int> rotation_subgraph(int n, int s);

/**
 * Rotation construction on a single (even-sized) list of vertices, treated as a circle.
 */
Matching rotate_pairs(const std::vector<int> &elements, int step);

/**
 * Rotation matching <step> of all subgraphs together (all subgraphs at the same step).
 */
Matching rotation_matching(int n, int step);

/**
 * The full sequence of n-1 perfect matchings of the complete graph on n vertices,
 * such that every pair of vertices occurs in exactly one matching.
 *
 * Matchings are computed when the iterator reaches them. Every call to begin()
 * starts a fresh iteration that yields the same sequence:
 * first the offset matchings by increasing offset, then the rotation matchings by step.
 */
class Factorization
{
public:
    /**
     * Throws InvalidInputError if <n> is not a positive even number.
     */
    explicit Factorization(int n);

    class const_iterator
    {
    public:
        typedef std::input_iterator_tag iterator_category;
        typedef Matching value_type;
        typedef std::ptrdiff_t difference_type;
        typedef const Matching* pointer;
        typedef const Matching& reference;

        const_iterator() { }

        reference operator*() const { return current; }
        pointer operator->() const { return &current; }

        const_iterator& operator++();
        const_iterator operator++(int) { const_iterator res(*this); ++(*this); return res; }

        bool operator==(const const_iterator &other) const { return n == other.n and offset == other.offset and step == other.step; }
        bool operator!=(const const_iterator &other) const { return !(*this == other); }

    private:
        friend class Factorization;

        const_iterator(int n, int offset, int step);

        void skip_rotation_offsets();
        void load();

        int n = 0;
        int offset = 0; // current offset, or n when the offset matchings are done
        int step = 0;   // current rotation step
        Matching current;
    };

    typedef const_iterator iterator;

    const_iterator begin() const { return const_iterator(n, 1, 0); }
    const_iterator end() const { return const_iterator(n, n, rotation_count(n)); }

    int vertexcount() const { return n; }

    /**
     * Number of matchings (n-1).
     */
    int size() const { return n - 1; }

    /**
     * Compute the whole sequence.
     */
    std::vector<Matching> collect() const;

private:
    int n;
};

/**
 * Validate <n> and return the matching sequence for the complete graph on n vertices.
 */
inline Factorization generate(int n)
{
    return Factorization(n);
}

}

#endif

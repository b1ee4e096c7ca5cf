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

#ifndef RR_ROSTER_HPP
#define RR_ROSTER_HPP

#include <iostream>
#include <string>
#include <vector>

#include "roundrobin/matching.hpp"

namespace rr {

/**
 * The participants of a round robin, one label per vertex.
 *
 * The algorithm needs an even number of vertices, so an odd list of names gets
 * an extra placeholder participant. Whoever is paired with the placeholder sits out.
 */
class Roster
{
public:
    Roster() { }
    Roster(const std::vector<std::string> &names, const std::string &placeholder="");

    /**
     * Read whitespace separated names. Blank lines are ignored.
     */
    static Roster parse(std::istream &in, const std::string &placeholder="");

    /**
     * Read names from the file <filename>. Files ending in .gz or .bz2 are decompressed.
     * Throws std::runtime_error if the file cannot be read.
     */
    static Roster load(const std::string &filename, const std::string &placeholder="");

    /**
     * A roster labelling <count> participants "0" .. "<count-1>".
     */
    static Roster numbered(int count, const std::string &placeholder="");

    /**
     * Number of vertices (always even).
     */
    int size() const { return (int)labels.size(); }

    /**
     * Number of participants before padding.
     */
    int participants() const { return n_participants; }

    bool padded() const { return size() != n_participants; }
    bool empty() const { return labels.empty(); }

    const std::string& label(int vertex) const { return labels.at(vertex); }

    /**
     * Write matching <number> as one line per pair, the first name right-aligned in <padding> columns.
     */
    void write_matching(std::ostream &out, const Matching &matching, int number, int padding=25) const;

private:
    std::vector<std::string> labels;
    int n_participants = 0;
};

}

#endif

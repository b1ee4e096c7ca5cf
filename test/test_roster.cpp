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

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "roundrobin/factorization.hpp"
#include "roundrobin/roster.hpp"

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

static void
test_parse()
{
    std::istringstream in("alice\nbob\n\n  carol\n\ndave\n");
    Roster r = Roster::parse(in);
    report(r.size() == 4 and r.participants() == 4 and !r.padded(), "four names, no padding");
    report(r.label(0) == "alice" and r.label(2) == "carol" and r.label(3) == "dave", "labels in file order, blank lines ignored");
}

static void
test_padding()
{
    std::istringstream in("alice\nbob\ncarol\n");
    Roster r = Roster::parse(in, "(bye)");
    report(r.size() == 4 and r.participants() == 3 and r.padded(), "odd roster padded to even");
    report(r.label(3) == "(bye)", "placeholder is the last vertex");

    std::istringstream blank("\n\n   \n");
    report(Roster::parse(blank).empty(), "only blank lines gives an empty roster");

    bool thrown = false;
    try {
        r.label(4);
    } catch (std::out_of_range &err) {
        thrown = true;
    }
    report(thrown, "label outside the roster rejected");
}

static void
test_numbered()
{
    Roster r = Roster::numbered(5);
    report(r.size() == 6 and r.label(4) == "4" and r.label(5) == "", "numbered roster padded with empty label");
}

static void
test_write()
{
    std::istringstream in("alice bob carol dave");
    Roster r = Roster::parse(in);

    std::ostringstream out;
    r.write_matching(out, Matching{{0, 3}, {2, 1}}, 2, 8);
    report(out.str() == "Matching 2:\n   alice --- dave\n   carol --- bob\n\n", "matching written with right-aligned first names");

    // a roster can be walked through the whole schedule
    std::ostringstream all;
    int number = 0;
    for (auto &m : generate(r.size())) r.write_matching(all, m, ++number);
    report(number == 3 and all.str().find("Matching 3:") != std::string::npos, "whole schedule written");
}

static void
test_load()
{
    const std::string filename = "test_roster_names.txt";
    {
        std::ofstream file(filename);
        file << "alice\nbob\ncarol\n";
    }
    Roster r = Roster::load(filename, "-");
    report(r.size() == 4 and r.label(1) == "bob" and r.label(3) == "-", "roster loaded from file");
    std::remove(filename.c_str());

    bool thrown = false;
    try {
        Roster::load("does_not_exist_names.txt");
    } catch (std::runtime_error &err) {
        thrown = true;
    }
    report(thrown, "missing file rejected");
}

int
main(int, char**)
{
    test_parse();
    test_padding();
    test_numbered();
    test_write();
    test_load();

    if (failures) std::cout << "\033[38;5;196m" << failures << " checks failed\033[m" << std::endl;
    return failures ? 1 : 0;
}

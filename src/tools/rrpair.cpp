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

#include <cctype>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include <cxxopts.hpp>

#include "roundrobin/factorization.hpp"
#include "roundrobin/roster.hpp"

using namespace rr;
namespace fs = boost::filesystem;

/*------------------------------------------------------------------------*/

static void (*sig_int_handler)(int);

static void
catchsig(int sig)
{
    if (sig == SIGINT) {
        (void)signal(SIGINT, sig_int_handler);
        std::cout << std::endl;
        exit(0);
    }
}

/*------------------------------------------------------------------------*/

/**
 * Wait for the user to press enter. Returns false at end of input.
 */
static bool
wait_for_enter(const char *prompt)
{
    std::cout << prompt << std::flush;
    std::string line;
    return (bool)std::getline(std::cin, line);
}

/**
 * Ask whether to start again until the answer is y or n.
 * End of input counts as n.
 */
static bool
ask_start_again()
{
    std::string line;
    while (true) {
        std::cout << "All matchings complete. Start again? Y/N: " << std::flush;
        if (!std::getline(std::cin, line)) return false;
        if (line.size() != 1) continue;
        char c = (char)std::tolower((unsigned char)line[0]);
        if (c == 'y') return true;
        if (c == 'n') return false;
    }
}

int
main(int argc, char **argv)
{
    cxxopts::Options opts(argv[0], "Pair up participants so that everyone meets everyone exactly once");
    opts.add_options()
        ("help", "Print help")
        ("i,input", "File with the names of the participants", cxxopts::value<std::string>()->default_value("names.txt"))
        ("n,vertices", "Number the participants instead of reading names", cxxopts::value<int>())
        ("a,all", "Print all matchings without waiting for enter")
        ("padding", "Width of the first name column", cxxopts::value<int>()->default_value("25"))
        ("placeholder", "Name of the extra participant for an odd number of names", cxxopts::value<std::string>()->default_value(""))
        ;

    /* Parse command line */
    opts.parse_positional(std::vector<std::string>({"input"}));
    auto options = opts.parse(argc, argv);

    if (options.count("help")) {
        std::cout << opts.help() << std::endl;
        return 0;
    }

    const bool interactive = options.count("all") == 0;
    const int padding = options["padding"].as<int>();
    const std::string placeholder = options["placeholder"].as<std::string>();

    sig_int_handler = signal(SIGINT, catchsig);

    /**
     * STEP 1
     * Obtain the participants.
     */

    Roster roster;

    if (options.count("vertices")) {
        roster = Roster::numbered(options["vertices"].as<int>(), placeholder);
    } else {
        const std::string filename = options["input"].as<std::string>();
        if (interactive) {
            std::cout << "Usage: Run this program in the same location as the file '" << filename << "', "
                         "which should be a file with a list of names in, each name on a new line, "
                         "with blank lines ignored." << std::endl;
            if (!wait_for_enter("Press Control-C at any time to quit. Press enter to continue.")) return 0;
        }

        if (!fs::exists(filename)) {
            std::cout << "Could not find the names file - is the file '" << filename << "' in the same directory?" << std::endl;
            return -1;
        }
        try {
            roster = Roster::load(filename, placeholder);
        } catch (std::runtime_error &err) {
            std::cout << "There was a problem with opening the file: " << err.what() << std::endl;
            return -1;
        }
    }

    if (roster.empty()) {
        std::cout << "There are no participants. Terminating process." << std::endl;
        return -1;
    }

    /**
     * STEP 2
     * Show the matchings, one at a time, until the user is done.
     */

    try {
        Factorization matchings = generate(roster.size());

        bool start_again = true;
        while (start_again) {
            int number = 0;
            for (const Matching &matching : matchings) {
                if (interactive and !wait_for_enter("Press enter for the next matching.")) return 0;
                roster.write_matching(std::cout, matching, ++number, padding);
            }

            start_again = interactive and ask_start_again();
            if (start_again) {
                std::cout << "Starting again!" << std::endl;
                std::cout << "." << std::endl << "." << std::endl << "." << std::endl << std::endl;
            }
        }
    } catch (rr::Error &err) {
        std::cout << "error: " << err.what() << std::endl;
        return -1;
    }

    (void)signal(SIGINT, sig_int_handler);
    return 0;
}

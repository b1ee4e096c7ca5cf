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

#include <fstream>
#include <iomanip>
#include <stdexcept>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/bzip2.hpp>
#include <boost/iostreams/filter/gzip.hpp>

#include "roundrobin/roster.hpp"

namespace io = boost::iostreams;

namespace rr {

Roster::Roster(const std::vector<std::string> &names, const std::string &placeholder) : labels(names)
{
    n_participants = (int)names.size();
    if (n_participants & 1) labels.push_back(placeholder);
}

Roster
Roster::parse(std::istream &in, const std::string &placeholder)
{
    std::vector<std::string> names;
    std::string name;
    while (in >> name) names.push_back(name);
    if (in.bad()) throw std::runtime_error("error reading names");
    return Roster(names, placeholder);
}

Roster
Roster::load(const std::string &filename, const std::string &placeholder)
{
    std::ifstream file(filename, std::ios_base::binary);
    if (!file) throw std::runtime_error("cannot open file " + filename);

    io::filtering_istream in;
    if (boost::algorithm::ends_with(filename, ".bz2")) in.push(io::bzip2_decompressor());
    if (boost::algorithm::ends_with(filename, ".gz")) in.push(io::gzip_decompressor());
    in.push(file);

    Roster res = parse(in, placeholder);
    file.close();
    return res;
}

Roster
Roster::numbered(int count, const std::string &placeholder)
{
    std::vector<std::string> names;
    for (int i=0; i<count; i++) names.push_back(std::to_string(i));
    return Roster(names, placeholder);
}

void
Roster::write_matching(std::ostream &out, const Matching &matching, int number, int padding) const
{
    out << "Matching " << number << ":" << std::endl;
    for (auto &p : matching) {
        out << std::setw(padding) << std::right << label(p.first) << " --- " << label(p.second) << std::endl;
    }
    out << std::endl;
}

}

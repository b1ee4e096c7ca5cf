/*
 * Copyright 2019 Tom van Dijk
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

#ifndef RR_ERROR_HPP
#define RR_ERROR_HPP

#include <stdexcept>
#include <sstream>
#include <string>

#define THROW_ERROR(msg) { throw rr::Error(msg, __FILE__, __LINE__); }
#define LOGIC_ERROR THROW_ERROR("logic error")

namespace rr {

class Error : public std::exception {
protected:
    std::string msg;
    const char *file;
    const unsigned int line;
    std::string thewhat;
public:
    Error(const std::string &msg, const char *file, const unsigned int line) : msg(msg), file(file), line(line) {
        std::ostringstream o;
        o << msg << " (at " << file << ":" << line << ")";
        thewhat = o.str();
    }
    ~Error() throw() { }
    const char *what() const noexcept {
        return thewhat.c_str();
    }
    const std::string& message() const { return msg; }
};

/**
 * The requested number of vertices has no 1-factorization (zero, negative or odd).
 */
class InvalidInputError : public Error {
public:
    InvalidInputError(const std::string &msg, const char *file, const unsigned int line) : Error(msg, file, line) { }
};

/**
 * A vertex pair was emitted twice.
 */
class DuplicatePairError : public Error {
public:
    DuplicatePairError(int a, int b, const char *file, const unsigned int line) : Error(describe(a, b), file, line), a(a), b(b) { }

    int first() const { return a; }
    int second() const { return b; }

private:
    int a, b;

    static std::string describe(int a, int b) {
        std::ostringstream o;
        o << "pair (" << a << "," << b << ") appears in more than one matching";
        return o.str();
    }
};

/**
 * After all matchings, a vertex is not adjacent to every other vertex.
 */
class IncompleteCoverageError : public Error {
public:
    IncompleteCoverageError(int v, int count, int expected, const char *file, const unsigned int line) :
        Error(describe(v, count, expected), file, line), v(v), n_count(count), n_expected(expected) { }

    int vertex() const { return v; }
    int count() const { return n_count; }
    int expected() const { return n_expected; }

private:
    int v, n_count, n_expected;

    static std::string describe(int v, int count, int expected) {
        std::ostringstream o;
        o << "vertex " << v << " has only " << count << " edges, expected " << expected;
        return o.str();
    }
};

}

#endif

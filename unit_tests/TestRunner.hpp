/*******************************************************************************
 *
 *
 *    opcomp - decoder table compiler
 *    Copyright (C) 2017 snickerbockers
 *
 *    This program is free software: you can redistribute it and/or modify
 *    it under the terms of the GNU General Public License as published by
 *    the Free Software Foundation, either version 3 of the License, or
 *    (at your option) any later version.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU General Public License for more details.
 *
 *    You should have received a copy of the GNU General Public License
 *    along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 *
 ******************************************************************************/


#ifndef TESTRUNNER_HPP_
#define TESTRUNNER_HPP_

#include <unistd.h>

#include <ctime>
#include <cstdlib>
#include <string>
#include <iostream>

#include "opcomp/types.hpp"
#include "opcomp/BaseException.hpp"
#include "opcomp/log.h"

#include "RandGenerator.hpp"

typedef RandGenerator<opcode_t> TestRandGen;

// returns 0 on success
typedef int(*unit_test_func_t)(TestRandGen *gen);

struct unit_test {
    char const *name;
    unit_test_func_t func;
};

template<typename T>
static bool check_eq(char const *what, T const& expect, T const& actual) {
    if (expect == actual)
        return true;

    std::cout << "Failure: " << what << ": expected " << expect <<
        " but got " << actual << std::endl;
    return false;
}

static inline bool check_hex(char const *what, opcode_t expect,
                             opcode_t actual) {
    if (expect == actual)
        return true;

    std::cout << "Failure: " << what << ": expected 0x" << std::hex <<
        expect << " but got 0x" << actual << std::dec << std::endl;
    return false;
}

static inline bool check_contains(char const *what, std::string const& txt,
                                  std::string const& needle) {
    if (txt.find(needle) != std::string::npos)
        return true;

    std::cout << "Failure: " << what << ": \"" << needle <<
        "\" not found in:" << std::endl << txt << std::endl;
    return false;
}

static inline unsigned random_width(TestRandGen *gen) {
    static unsigned const widths[] = { 8, 16, 32, 64 };
    return widths[gen->pick_range(4)];
}

/*
 * random pattern string for an opcode of the given width.  Variables are
 * named a, b or c and have at most max_var_bits bits between all of them.
 */
static inline std::string random_pattern_txt(TestRandGen *gen, unsigned width,
                                             unsigned max_var_bits) {
    std::string txt;
    unsigned var_bits = 0;

    for (unsigned idx = 0; idx < width; idx++) {
        if (idx && idx % 4 == 0)
            txt.push_back(OPCOMP_PATTERN_SEP);

        switch (gen->pick_range(4)) {
        case 0:
            txt.push_back('0');
            break;
        case 1:
            txt.push_back('1');
            break;
        case 2:
            txt.push_back('_');
            break;
        default:
            if (var_bits < max_var_bits) {
                txt.push_back(char('a' + gen->pick_range(3)));
                var_bits++;
            } else {
                txt.push_back('0');
            }
        }
    }

    return txt;
}

/*
 * Runs every test in the NULL-terminated tests array and prints a summary.
 * Options are -s <seed> to repeat a previous run's random values and -v to
 * show debug logs.  Returns the process exit code.
 */
static int run_unit_tests(struct unit_test const *tests, int argc,
                          char **argv) {
    unsigned int seed = time(NULL);
    bool verbose = false;
    int n_success = 0, n_tests = 0;
    int opt;

    while ((opt = getopt(argc, argv, "s:v")) > 0) {
        if (opt == 's')
            seed = atoi(optarg);
        else if (opt == 'v')
            verbose = true;
    }

    log_init(false, verbose);

    TestRandGen gen(seed);
    gen.reset();

    for (struct unit_test const *test = tests; test->name; test++) {
        int test_ret;

        std::cout << "Trying " << test->name << "..." << std::endl;

        try {
            test_ret = test->func(&gen);
        } catch (BaseException& err) {
            std::cout << boost::diagnostic_information(err);
            test_ret = 1;
        }

        if (test_ret != 0) {
            std::cout << test->name << " FAIL" << std::endl;
        } else {
            std::cout << test->name << " SUCCESS" << std::endl;
            n_success++;
        }

        n_tests++;
    }

    double percent = 100.0 * double(n_success) / double(n_tests);
    std::cout << std::dec << n_tests << " tests run - " << n_success <<
        " successes " << "(" << percent << "%)" << std::endl;

    log_cleanup();

    return n_success == n_tests ? 0 : 1;
}

#endif

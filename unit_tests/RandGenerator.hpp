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


#ifndef RANDGENERATOR_HPP_
#define RANDGENERATOR_HPP_

#include <ctime>
#include <cstdlib>
#include <string>
#include <sstream>
#include <iostream>

#include <boost/cstdint.hpp>

#include "opcomp/types.hpp"

// Generator that returns pseudo-random values.
template<typename T>
class RandGenerator {
public:
    RandGenerator() {
        this->seed = time(NULL);
        this->first_val = true;
    }

    RandGenerator(unsigned int seed) {
        this->seed = seed;
        this->first_val = true;
    }

    /*
     * cause subsequent calls to pick_val to return the same values as they did
     * after the last time reset was called for this generator.
     *
     * YOU MUST CALL RESET YOURSELF BEFORE THE FIRST CALL TO pick_val
     */
    void reset() {
        if (first_val) {
            std::cout << name() << " using seed=" << this->seed << std::endl;
            first_val = false;
        }
        srand(this->seed);
    }

    T pick_val() {
        return (T)rand();
    }

    // random value in [0, n_vals)
    unsigned pick_range(unsigned n_vals) {
        return unsigned(rand()) % n_vals;
    }

    std::string name() const {
        std::stringstream ss;
        ss << "RandGenerator<" << (sizeof(T) * 8) << " bits>";
        return ss.str();
    }
private:
    unsigned seed;
    bool first_val; // used to print the 'using seed=' message only once
};

/*
 * rand only returns 31 random bits on most platforms, so opcodes need a
 * special version of RandGenerator that combines several calls.
 */
template<>
class RandGenerator<opcode_t> {
public:
    RandGenerator() {
        this->seed = time(NULL);
        this->first_val = true;
    }

    RandGenerator(unsigned int seed) {
        this->seed = seed;
        this->first_val = true;
    }

    void reset() {
        if (first_val) {
            std::cout << name() << " using seed=" << this->seed << std::endl;
            first_val = false;
        }
        srand(this->seed);
    }

    opcode_t pick_val() {
        return opcode_t(rand() & 0xffff) |
            (opcode_t(rand() & 0xffff) << 16) |
            (opcode_t(rand() & 0xffff) << 32) |
            (opcode_t(rand() & 0xffff) << 48);
    }

    // random value that fits in n_bits bits
    opcode_t pick_bits(unsigned n_bits) {
        return pick_val() & opcomp_low_mask(n_bits);
    }

    // random value in [0, n_vals)
    unsigned pick_range(unsigned n_vals) {
        return unsigned(rand()) % n_vals;
    }

    std::string name() const {
        std::stringstream ss;
        ss << "RandGenerator<" << (sizeof(opcode_t) * 8) << " bits>";
        return ss.str();
    }
private:
    unsigned seed;
    bool first_val; // used to print the 'using seed=' message only once
};

#endif

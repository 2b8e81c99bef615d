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

#ifndef OPCOMP_TYPES_HPP_
#define OPCOMP_TYPES_HPP_

#include <boost/cstdint.hpp>

/*
 * opcode_t is wide enough to hold an opcode of any supported width.  Every
 * mask and expected-value in the compiler is carried around as an opcode_t
 * regardless of the width the rule table declares; bits above the declared
 * width are always zero.
 */
typedef boost::uint64_t opcode_t;

// index of a bit within a pattern.  0 is the most-significant bit.
typedef unsigned bit_idx_t;

#define OPCOMP_MAX_WIDTH 64

// the separator character inside of a pattern string, it has no meaning
#define OPCOMP_PATTERN_SEP '\''

static inline bool opcomp_valid_width(unsigned width) {
    return width == 8 || width == 16 || width == 32 || width == 64;
}

// mask with the lowest n_bits bits set.  n_bits may be as large as 64.
static inline opcode_t opcomp_low_mask(unsigned n_bits) {
    if (n_bits >= OPCOMP_MAX_WIDTH)
        return ~opcode_t(0);
    return (opcode_t(1) << n_bits) - 1;
}

// convert an MSB-first pattern index into a shift amount
static inline unsigned opcomp_idx_to_shift(bit_idx_t idx, unsigned width) {
    return width - 1 - idx;
}

#endif

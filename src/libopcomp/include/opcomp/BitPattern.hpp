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

#ifndef OPCOMP_BITPATTERN_HPP_
#define OPCOMP_BITPATTERN_HPP_

#include <string>
#include <vector>

#include "opcomp/types.hpp"

enum bit_spec_tp {
    BIT_SPEC_ZERO,
    BIT_SPEC_ONE,
    BIT_SPEC_WILDCARD,
    BIT_SPEC_VAR
};

struct BitSpec {
    enum bit_spec_tp tp;

    // only has meaning for BIT_SPEC_VAR
    char var_name;
};

/*
 * A parsed bit-pattern such as "0100'nnnn'0001'0101".
 *
 * Positions are numbered from the most-significant bit, so position 0 of an
 * 8-bit pattern corresponds to bit 7 of the opcode.  Wildcard positions are
 * not part of any test; every other position is.
 */
class BitPattern {
public:
    typedef std::vector<BitSpec> SpecList;
    typedef std::vector<bit_idx_t> PosList;

    BitPattern();

    /*
     * parse txt, which must contain exactly width pattern characters after
     * separators are thrown away.  Throws MalformedPatternError if it
     * doesn't, or InvalidParamError if width is not 8, 16, 32 or 64.
     */
    BitPattern(std::string const& txt, unsigned width);

    unsigned width() const {
        return n_bits;
    }

    BitSpec const& at(bit_idx_t idx) const;

    // the pattern string exactly as it was given to the constructor
    std::string const& src_txt() const {
        return txt;
    }

    // one character per position, no separators
    std::string to_string() const;

    // positions which are literal 0 or 1
    opcode_t fixed_mask() const {
        return mask_fixed;
    }

    // literal value of the fixed positions
    opcode_t fixed_val() const {
        return val_fixed;
    }

    opcode_t wildcard_mask() const {
        return mask_wildcard;
    }

    // every position which is not a wildcard
    opcode_t base_mask() const;

    // number of positions which are not wildcards
    unsigned n_significant() const;

    // variable letters in the order of their most-significant occurrence
    std::string const& var_names() const {
        return vars;
    }

    bool has_var(char name) const;

    // positions of the given variable, most-significant first
    PosList var_positions(char name) const;

    unsigned var_n_bits(char name) const;

    opcode_t var_mask(char name) const;

    /*
     * scatter raw into the positions of the given variable.  The
     * most-significant bit of raw lands in the variable's first position.
     * Throws VariableWidthOverflowError if raw has more bits than the
     * variable does.
     */
    opcode_t deposit(char name, opcode_t raw) const;

    // the inverse of deposit: gather the variable's bits out of an opcode
    opcode_t extract(char name, opcode_t opcode) const;

private:
    std::string txt;
    unsigned n_bits;
    SpecList specs;

    opcode_t mask_fixed;
    opcode_t val_fixed;
    opcode_t mask_wildcard;

    std::string vars;

    static bool valid_char(char ch);
};

#endif

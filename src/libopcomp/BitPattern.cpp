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

#include "opcomp/BaseException.hpp"

#include "opcomp/BitPattern.hpp"

BitPattern::BitPattern() : n_bits(0), mask_fixed(0), val_fixed(0),
                           mask_wildcard(0) {
}

bool BitPattern::valid_char(char ch) {
    return ch == '0' || ch == '1' || ch == '_' || (ch >= 'a' && ch <= 'z');
}

BitPattern::BitPattern(std::string const& txt, unsigned width) {
    std::string stripped;

    if (!opcomp_valid_width(width)) {
        BOOST_THROW_EXCEPTION(InvalidParamError("Unsupported opcode width") <<
                              errinfo_param_name("width") <<
                              errinfo_width(width));
    }

    for (std::string::const_iterator it = txt.begin(); it != txt.end();
         it++) {
        if (*it == OPCOMP_PATTERN_SEP)
            continue;

        if (!valid_char(*it)) {
            BOOST_THROW_EXCEPTION(MalformedPatternError("Invalid character "
                                                        "in bit pattern") <<
                                  errinfo_pattern(txt) <<
                                  errinfo_char(*it));
        }

        stripped.push_back(*it);
    }

    if (stripped.size() != width) {
        BOOST_THROW_EXCEPTION(MalformedPatternError("Bit pattern length does "
                                                    "not match the opcode "
                                                    "width") <<
                              errinfo_pattern(txt) <<
                              errinfo_length(stripped.size()) <<
                              errinfo_length_expect(width));
    }

    this->txt = txt;
    n_bits = width;
    mask_fixed = val_fixed = mask_wildcard = 0;

    for (unsigned idx = 0; idx < width; idx++) {
        char ch = stripped[idx];
        BitSpec spec;

        val_fixed <<= 1;
        mask_fixed <<= 1;
        mask_wildcard <<= 1;

        spec.var_name = '\0';
        if (ch == '1' || ch == '0') {
            mask_fixed |= 1;
            spec.tp = (ch == '1') ? BIT_SPEC_ONE : BIT_SPEC_ZERO;
        } else if (ch == '_') {
            mask_wildcard |= 1;
            spec.tp = BIT_SPEC_WILDCARD;
        } else {
            spec.tp = BIT_SPEC_VAR;
            spec.var_name = ch;
            if (vars.find(ch) == std::string::npos)
                vars.push_back(ch);
        }

        if (ch == '1')
            val_fixed |= 1;

        specs.push_back(spec);
    }
}

BitSpec const& BitPattern::at(bit_idx_t idx) const {
    if (idx >= specs.size()) {
        BOOST_THROW_EXCEPTION(InvalidParamError("Pattern index out of range") <<
                              errinfo_length(idx) <<
                              errinfo_length_expect(specs.size()));
    }
    return specs[idx];
}

std::string BitPattern::to_string() const {
    std::string ret;

    for (SpecList::const_iterator it = specs.begin(); it != specs.end();
         it++) {
        switch (it->tp) {
        case BIT_SPEC_ZERO:
            ret.push_back('0');
            break;
        case BIT_SPEC_ONE:
            ret.push_back('1');
            break;
        case BIT_SPEC_WILDCARD:
            ret.push_back('_');
            break;
        case BIT_SPEC_VAR:
            ret.push_back(it->var_name);
            break;
        }
    }

    return ret;
}

opcode_t BitPattern::base_mask() const {
    return opcomp_low_mask(n_bits) & ~mask_wildcard;
}

unsigned BitPattern::n_significant() const {
    unsigned count = 0;

    for (SpecList::const_iterator it = specs.begin(); it != specs.end();
         it++) {
        if (it->tp != BIT_SPEC_WILDCARD)
            count++;
    }

    return count;
}

bool BitPattern::has_var(char name) const {
    return vars.find(name) != std::string::npos;
}

BitPattern::PosList BitPattern::var_positions(char name) const {
    PosList ret;

    for (bit_idx_t idx = 0; idx < specs.size(); idx++) {
        if (specs[idx].tp == BIT_SPEC_VAR && specs[idx].var_name == name)
            ret.push_back(idx);
    }

    return ret;
}

unsigned BitPattern::var_n_bits(char name) const {
    return var_positions(name).size();
}

opcode_t BitPattern::var_mask(char name) const {
    PosList pos = var_positions(name);
    opcode_t mask = 0;

    for (PosList::const_iterator it = pos.begin(); it != pos.end(); it++)
        mask |= opcode_t(1) << opcomp_idx_to_shift(*it, n_bits);

    return mask;
}

opcode_t BitPattern::deposit(char name, opcode_t raw) const {
    PosList pos = var_positions(name);
    unsigned n_var_bits = pos.size();
    opcode_t ret = 0;

    if (!n_var_bits) {
        BOOST_THROW_EXCEPTION(InvalidParamError("No such variable in "
                                                "pattern") <<
                              errinfo_pattern(txt) <<
                              errinfo_var_name(name));
    }

    if (raw & ~opcomp_low_mask(n_var_bits)) {
        BOOST_THROW_EXCEPTION(VariableWidthOverflowError() <<
                              errinfo_pattern(txt) <<
                              errinfo_var_name(name) <<
                              errinfo_raw_val(raw) <<
                              errinfo_n_bits(n_var_bits));
    }

    for (unsigned bit_no = 0; bit_no < n_var_bits; bit_no++) {
        unsigned src_shift = n_var_bits - 1 - bit_no;
        if ((raw >> src_shift) & 1) {
            ret |= opcode_t(1) <<
                opcomp_idx_to_shift(pos[bit_no], n_bits);
        }
    }

    return ret;
}

opcode_t BitPattern::extract(char name, opcode_t opcode) const {
    PosList pos = var_positions(name);
    opcode_t ret = 0;

    for (PosList::const_iterator it = pos.begin(); it != pos.end(); it++) {
        ret <<= 1;
        ret |= (opcode >> opcomp_idx_to_shift(*it, n_bits)) & 1;
    }

    return ret;
}

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


#include <iostream>

#include "opcomp/BaseException.hpp"
#include "opcomp/BitPattern.hpp"

#include "TestRunner.hpp"

static int parse_round_trip_test(TestRandGen *gen) {
    BitPattern ptrn("0001'rr__", 8);
    static enum bit_spec_tp const expect_tp[8] = {
        BIT_SPEC_ZERO, BIT_SPEC_ZERO, BIT_SPEC_ZERO, BIT_SPEC_ONE,
        BIT_SPEC_VAR, BIT_SPEC_VAR, BIT_SPEC_WILDCARD, BIT_SPEC_WILDCARD
    };

    for (bit_idx_t idx = 0; idx < 8; idx++) {
        if (ptrn.at(idx).tp != expect_tp[idx]) {
            std::cout << "Failure: wrong bit spec at position " << idx <<
                std::endl;
            return 1;
        }
    }

    BitPattern::PosList pos = ptrn.var_positions('r');
    if (!check_eq<size_t>("number of positions of r", 2, pos.size()) ||
        !check_eq<bit_idx_t>("first position of r", 4, pos[0]) ||
        !check_eq<bit_idx_t>("second position of r", 5, pos[1]))
        return 1;

    if (!check_hex("fixed mask", 0xf0, ptrn.fixed_mask()) ||
        !check_hex("fixed value", 0x10, ptrn.fixed_val()) ||
        !check_hex("wildcard mask", 0x03, ptrn.wildcard_mask()) ||
        !check_hex("base mask", 0xfc, ptrn.base_mask()) ||
        !check_hex("mask of r", 0x0c, ptrn.var_mask('r')) ||
        !check_hex("r=0b10 deposited", 0x08, ptrn.deposit('r', 2)) ||
        !check_eq<unsigned>("significant bits", 6, ptrn.n_significant()))
        return 1;

    if (!check_eq<std::string>("variables", "r", ptrn.var_names()))
        return 1;

    return 0;
}

static int separator_test(TestRandGen *gen) {
    BitPattern with_sep("0'1'0'1'____", 8);
    BitPattern without_sep("0101____", 8);

    if (!check_eq<std::string>("stripped pattern", "0101____",
                               with_sep.to_string()))
        return 1;

    if (!check_eq<std::string>("source text", "0'1'0'1'____",
                               with_sep.src_txt()))
        return 1;

    if (!check_hex("fixed mask", without_sep.fixed_mask(),
                   with_sep.fixed_mask()) ||
        !check_hex("fixed value", without_sep.fixed_val(),
                   with_sep.fixed_val()))
        return 1;

    return 0;
}

static int short_pattern_test(TestRandGen *gen) {
    try {
        BitPattern ptrn("0101'010", 8);
    } catch (MalformedPatternError& err) {
        size_t const *len = boost::get_error_info<errinfo_length>(err);
        if (!len || *len != 7) {
            std::cout << "Failure: error doesn't report a length of 7" <<
                std::endl;
            return 1;
        }
        return 0;
    }

    std::cout << "Failure: 7-character pattern was accepted for an 8-bit "
        "opcode" << std::endl;
    return 1;
}

static int long_pattern_test(TestRandGen *gen) {
    try {
        BitPattern ptrn("0101'0101'0", 8);
    } catch (MalformedPatternError& err) {
        return 0;
    }

    std::cout << "Failure: 9-character pattern was accepted for an 8-bit "
        "opcode" << std::endl;
    return 1;
}

static int bad_char_test(TestRandGen *gen) {
    char const *bad_ptrns[] = {
        "0101'X___", "0101'2___", "0101 ____", "0101-____", NULL
    };

    for (char const **ptrn_txt = bad_ptrns; *ptrn_txt; ptrn_txt++) {
        try {
            BitPattern ptrn(*ptrn_txt, 8);
            std::cout << "Failure: \"" << *ptrn_txt << "\" was accepted" <<
                std::endl;
            return 1;
        } catch (MalformedPatternError& err) {
            if (!boost::get_error_info<errinfo_char>(err)) {
                std::cout << "Failure: error doesn't name the bad character" <<
                    std::endl;
                return 1;
            }
        }
    }

    return 0;
}

static int bad_width_test(TestRandGen *gen) {
    try {
        BitPattern ptrn("0101'0101'0101", 12);
    } catch (InvalidParamError& err) {
        return 0;
    }

    std::cout << "Failure: 12-bit opcode width was accepted" << std::endl;
    return 1;
}

static int noncontiguous_var_test(TestRandGen *gen) {
    BitPattern ptrn("a0a1'a___", 8);

    if (!check_eq<unsigned>("bits in a", 3, ptrn.var_n_bits('a')) ||
        !check_hex("mask of a", 0xa8, ptrn.var_mask('a')) ||
        !check_hex("a=0b101 deposited", 0x88, ptrn.deposit('a', 5)) ||
        !check_hex("a=0b010 deposited", 0x20, ptrn.deposit('a', 2)) ||
        !check_hex("a extracted", 5, ptrn.extract('a', 0x88 | 0x10)))
        return 1;

    try {
        ptrn.deposit('a', 8);
    } catch (VariableWidthOverflowError& err) {
        return 0;
    }

    std::cout << "Failure: 4-bit value was deposited into a 3-bit "
        "variable" << std::endl;
    return 1;
}

static int wide_pattern_test(TestRandGen *gen) {
    std::string txt("1");
    for (unsigned idx = 0; idx < 62; idx++)
        txt.push_back(idx % 2 ? '_' : 'x');
    txt.push_back('0');

    BitPattern ptrn(txt, 64);

    if (!check_hex("fixed mask", 0x8000000000000001ull, ptrn.fixed_mask()) ||
        !check_hex("fixed value", 0x8000000000000000ull, ptrn.fixed_val()) ||
        !check_eq<unsigned>("bits in x", 31, ptrn.var_n_bits('x')) ||
        !check_hex("x=all ones deposited", 0x5555555555555554ull,
                   ptrn.deposit('x', 0x7fffffff)))
        return 1;

    return 0;
}

static int random_deposit_extract_test(TestRandGen *gen) {
    for (unsigned iteration = 0; iteration < 256; iteration++) {
        unsigned width = random_width(gen);
        BitPattern ptrn(random_pattern_txt(gen, width, width), width);
        std::string const& names = ptrn.var_names();

        for (std::string::const_iterator it = names.begin();
             it != names.end(); it++) {
            opcode_t raw = gen->pick_bits(ptrn.var_n_bits(*it));
            opcode_t deposited = ptrn.deposit(*it, raw);

            if (deposited & ~ptrn.var_mask(*it)) {
                std::cout << "Failure: \"" << ptrn.src_txt() <<
                    "\": deposited bits outside of " << *it << std::endl;
                return 1;
            }

            if (!check_hex("extracted value", raw,
                           ptrn.extract(*it, deposited | ptrn.fixed_val())))
                return 1;
        }

        if (ptrn.fixed_mask() & ptrn.wildcard_mask()) {
            std::cout << "Failure: \"" << ptrn.src_txt() <<
                "\": a position is both fixed and wildcard" << std::endl;
            return 1;
        }
    }

    return 0;
}

struct unit_test tests[] = {
    { "parse_round_trip_test", parse_round_trip_test },
    { "separator_test", separator_test },
    { "short_pattern_test", short_pattern_test },
    { "long_pattern_test", long_pattern_test },
    { "bad_char_test", bad_char_test },
    { "bad_width_test", bad_width_test },
    { "noncontiguous_var_test", noncontiguous_var_test },
    { "wide_pattern_test", wide_pattern_test },
    { "random_deposit_extract_test", random_deposit_extract_test },
    { NULL, NULL }
};

int main(int argc, char **argv) {
    return run_unit_tests(tests, argc, argv);
}

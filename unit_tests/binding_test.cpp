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
#include "opcomp/Binding.hpp"
#include "opcomp/Rule.hpp"

#include "TestRunner.hpp"

static LiteralEntryList reg_table(unsigned n_entries) {
    static char const *names[] = { "R0", "R1", "R2", "R3" };
    LiteralEntryList table;

    for (unsigned idx = 0; idx < n_entries; idx++) {
        LiteralEntry ent;
        ent.raw = idx;
        ent.value = names[idx];
        table.push_back(ent);
    }

    return table;
}

static int undeclared_raw_test(TestRandGen *gen) {
    BitPattern ptrn("0010'ddss", 8);
    VarGroupMap groups = resolve_bindings(ptrn, VarDeclList());

    if (!check_eq<size_t>("number of groups", 2, groups.size()))
        return 1;

    VariableGroup const& grp = groups['d'];
    if (grp.kind != BINDING_RAW_INTEGER) {
        std::cout << "Failure: undeclared variable isn't a raw integer" <<
            std::endl;
        return 1;
    }

    if (!check_eq<unsigned>("bits in d", 2, grp.n_bits()) ||
        !check_hex("domain size", 4, grp.domain_size()) ||
        !check_eq<std::string>("d=3 bound", "3", grp.bind(3)))
        return 1;

    return 0;
}

static int raw_types_test(TestRandGen *gen) {
    char const *raw_types[] = {
        "uint8_t", "boost::uint16_t", "std::uint32_t", "unsigned",
        "unsigned int", NULL
    };

    for (char const **tp = raw_types; *tp; tp++) {
        BitPattern ptrn("0000'nnnn", 8);
        VarDeclList decls;
        decls.push_back(decl_raw('n', *tp));

        VarGroupMap groups = resolve_bindings(ptrn, decls);
        if (groups['n'].kind != BINDING_RAW_INTEGER) {
            std::cout << "Failure: " << *tp << " isn't a raw integer" <<
                std::endl;
            return 1;
        }
    }

    return 0;
}

static int missing_mapping_test(TestRandGen *gen) {
    BitPattern ptrn("11rr'____", 8);
    VarDeclList decls;
    decls.push_back(decl_raw('r', "Register"));

    try {
        resolve_bindings(ptrn, decls);
    } catch (MissingMappingError& err) {
        std::string const *tp = boost::get_error_info<errinfo_type_name>(err);
        if (!tp || !check_eq<std::string>("type name", "Register", *tp))
            return 1;
        return 0;
    }

    std::cout << "Failure: Register variable without a mapping was "
        "accepted" << std::endl;
    return 1;
}

static int literal_table_test(TestRandGen *gen) {
    BitPattern ptrn("11rr'____", 8);
    VarDeclList decls;
    decls.push_back(decl_table('r', "Register", reg_table(4)));

    VarGroupMap groups = resolve_bindings(ptrn, decls);
    VariableGroup const& grp = groups['r'];

    if (grp.kind != BINDING_LITERAL_MAP) {
        std::cout << "Failure: r isn't a literal map" << std::endl;
        return 1;
    }

    VariableGroup::Domain dom = grp.domain();
    if (!check_eq<size_t>("domain size", 4, dom.size()))
        return 1;

    for (opcode_t raw = 0; raw < 4; raw++) {
        if (!check_hex("domain value", raw, dom[raw]))
            return 1;
    }

    if (!check_eq<std::string>("r=2 bound", "R2", grp.bind(2)))
        return 1;

    return 0;
}

static int unmapped_combination_test(TestRandGen *gen) {
    BitPattern ptrn("11rr'____", 8);
    VarDeclList decls;
    decls.push_back(decl_table('r', "Register", reg_table(3)));

    try {
        resolve_bindings(ptrn, decls);
    } catch (UnmappedCombinationError& err) {
        opcode_t const *raw = boost::get_error_info<errinfo_raw_val>(err);
        if (!raw) {
            std::cout << "Failure: error doesn't name the raw value" <<
                std::endl;
            return 1;
        }
        return check_hex("missing raw value", 3, *raw) ? 0 : 1;
    }

    std::cout << "Failure: incomplete literal table was accepted" << std::endl;
    return 1;
}

static int key_overflow_test(TestRandGen *gen) {
    BitPattern ptrn("11rr'____", 8);
    LiteralEntryList table = reg_table(4);
    VarDeclList decls;

    LiteralEntry extra;
    extra.raw = 4;
    extra.value = "R4";
    table.push_back(extra);
    decls.push_back(decl_table('r', "Register", table));

    try {
        resolve_bindings(ptrn, decls);
    } catch (VariableWidthOverflowError& err) {
        return 0;
    }

    std::cout << "Failure: 3-bit key was accepted for a 2-bit variable" <<
        std::endl;
    return 1;
}

static int duplicate_key_test(TestRandGen *gen) {
    BitPattern ptrn("11rr'____", 8);
    LiteralEntryList table = reg_table(4);
    VarDeclList decls;

    table[3].raw = 2;
    decls.push_back(decl_table('r', "Register", table));

    try {
        resolve_bindings(ptrn, decls);
    } catch (ParseError& err) {
        return 0;
    }

    std::cout << "Failure: duplicate key was accepted" << std::endl;
    return 1;
}

static int bad_declaration_test(TestRandGen *gen) {
    BitPattern ptrn("11rr'____", 8);
    VarDeclList not_in_pattern, twice;

    not_in_pattern.push_back(decl_raw('q'));
    twice.push_back(decl_raw('r'));
    twice.push_back(decl_raw('r'));

    try {
        resolve_bindings(ptrn, not_in_pattern);
        std::cout << "Failure: declaration of a variable that isn't in the "
            "pattern was accepted" << std::endl;
        return 1;
    } catch (ParseError& err) {
    }

    try {
        resolve_bindings(ptrn, twice);
        std::cout << "Failure: variable declared twice was accepted" <<
            std::endl;
        return 1;
    } catch (ParseError& err) {
    }

    return 0;
}

static int external_function_test(TestRandGen *gen) {
    BitPattern ptrn("00mm'____", 8);
    VarDeclList decls;
    decls.push_back(decl_func('m', "Mode", "decode_mode"));

    VarGroupMap groups = resolve_bindings(ptrn, decls);
    VariableGroup const& grp = groups['m'];

    if (grp.kind != BINDING_PURE_FUNCTION) {
        std::cout << "Failure: m isn't a pure function binding" << std::endl;
        return 1;
    }

    if (!check_eq<std::string>("m=2 bound", "decode_mode(2)", grp.bind(2)))
        return 1;

    return 0;
}

static int native_function_test(TestRandGen *gen) {
    BitPattern ptrn("0000'c___", 8);
    VarDeclList decls;
    MappingFuncPtr nonzero(new NativeMappingFunction("nonzero", map_nonzero));
    decls.push_back(decl_func('c', "bool", "nonzero", nonzero));

    VarGroupMap groups = resolve_bindings(ptrn, decls);
    VariableGroup const& grp = groups['c'];

    if (!check_eq<std::string>("c=0 bound", "false", grp.bind(0)) ||
        !check_eq<std::string>("c=1 bound", "true", grp.bind(1)))
        return 1;

    return 0;
}

static int raw_literal_test(TestRandGen *gen) {
    if (!check_eq<std::string>("small literal", "42",
                               format_raw_literal(42)) ||
        !check_eq<std::string>("large literal", "0xdeadbeefull",
                               format_raw_literal(0xdeadbeef)))
        return 1;

    for (unsigned iteration = 0; iteration < 64; iteration++) {
        opcode_t raw = gen->pick_val();
        std::string txt = format_raw_literal(raw);
        if (raw > 0x7fffffff &&
            txt.compare(txt.size() - 3, 3, "ull") != 0) {
            std::cout << "Failure: " << txt << " has no ull suffix" <<
                std::endl;
            return 1;
        }
    }

    return 0;
}

struct unit_test tests[] = {
    { "undeclared_raw_test", undeclared_raw_test },
    { "raw_types_test", raw_types_test },
    { "missing_mapping_test", missing_mapping_test },
    { "literal_table_test", literal_table_test },
    { "unmapped_combination_test", unmapped_combination_test },
    { "key_overflow_test", key_overflow_test },
    { "duplicate_key_test", duplicate_key_test },
    { "bad_declaration_test", bad_declaration_test },
    { "external_function_test", external_function_test },
    { "native_function_test", native_function_test },
    { "raw_literal_test", raw_literal_test },
    { NULL, NULL }
};

int main(int argc, char **argv) {
    return run_unit_tests(tests, argc, argv);
}

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
#include "opcomp/Rule.hpp"
#include "opcomp/RuleParser.hpp"
#include "opcomp/Compiler.hpp"

#include "TestRunner.hpp"

static char const *simple_vm_txt =
    "// register machine with four registers\n"
    "opcode = uint8_t;\n"
    "dispatcher = dispatch;\n"
    "context = Vm;\n"
    "\n"
    "# ADD r0-r3, imm\n"
    "\"11rr'____\" => impl_add<Register::{r}> where {\n"
    "    r: Register = { 0b00 => R0, 0b01 => R1, 0b10 => R2, 0b11 => R3 }\n"
    "};\n"
    "\n"
    "\"0010'ddss\" => impl_move<Register::{d}, Register::{s}> where {\n"
    "    d: Register = { 00 => R0, 01 => R1, 10 => R2, 11 => R3 },\n"
    "    s: Register = { 0x0 => R0, 0x1 => R1, 0x2 => R2, 0x3 => R3 },\n"
    "};\n"
    "\n"
    "\"01dd'____\" => impl_load<Register::{d}> where {\n"
    "    d: Register = { 0b00 => R0, 0b01 => R1, 0b10 => R2, 0b11 => R3 }\n"
    "};\n";

/*
 * check that parsing txt throws a ParseError (or subclass of BaseException
 * given by Exc) that points at the given line
 */
template<class Exc>
static int expect_error(char const *txt, unsigned line_no) {
    try {
        RuleParser::parse(txt);
    } catch (Exc& err) {
        unsigned const *line = boost::get_error_info<errinfo_line_no>(err);
        if (!line) {
            std::cout << "Failure: error has no line number" << std::endl;
            return 1;
        }
        return check_eq<unsigned>("line number", line_no, *line) ? 0 : 1;
    }

    std::cout << "Failure: this was accepted:" << std::endl << txt <<
        std::endl;
    return 1;
}

static int tokenize_test(TestRandGen *gen) {
    TokList toks = RuleParser::tokenize_line("\"01'__\" => h<Reg::{r}, 0x1f>;",
                                             7);
    static char const *expect_txt[] = {
        "01'__", "=>", "h", "<", "Reg", "::", "{", "r", "}", ",", "0x1f", ">",
        ";", NULL
    };
    static enum token_tp const expect_tp[] = {
        TOK_STRING, TOK_PUNCT, TOK_IDENT, TOK_PUNCT, TOK_IDENT, TOK_PUNCT,
        TOK_PUNCT, TOK_IDENT, TOK_PUNCT, TOK_PUNCT, TOK_NUMBER, TOK_PUNCT,
        TOK_PUNCT
    };

    for (unsigned idx = 0; expect_txt[idx]; idx++) {
        if (idx >= toks.size()) {
            std::cout << "Failure: ran out of tokens at " << expect_txt[idx] <<
                std::endl;
            return 1;
        }

        if (!check_eq<std::string>("token", expect_txt[idx], toks[idx].txt))
            return 1;

        if (toks[idx].tp != expect_tp[idx] || toks[idx].line_no != 7) {
            std::cout << "Failure: token " << toks[idx].txt <<
                " has the wrong type or line" << std::endl;
            return 1;
        }
    }

    if (!check_eq<size_t>("number of tokens", 13, toks.size()))
        return 1;

    return 0;
}

static int comment_test(TestRandGen *gen) {
    if (!check_eq<std::string>("// comment", "opcode = uint8_t; ",
                               RuleParser::preprocess_line("opcode = uint8_t; "
                                                           "// width")) ||
        !check_eq<std::string>("# comment", "",
                               RuleParser::preprocess_line("# whole line")) ||
        !check_eq<std::string>("string", "\"01#_\" => h;",
                               RuleParser::preprocess_line("\"01#_\" => h;")))
        return 1;

    return 0;
}

static int parse_key_test(TestRandGen *gen) {
    if (!check_hex("0b10", 2, RuleParser::parse_key("0b10")) ||
        !check_hex("10", 2, RuleParser::parse_key("10")) ||
        !check_hex("0x1f", 0x1f, RuleParser::parse_key("0x1f")) ||
        !check_hex("0B0111", 7, RuleParser::parse_key("0B0111")))
        return 1;

    char const *bad_keys[] = { "12", "0b2", "0x", "0xg", NULL };
    for (char const **key = bad_keys; *key; key++) {
        try {
            RuleParser::parse_key(*key);
            std::cout << "Failure: key " << *key << " was accepted" <<
                std::endl;
            return 1;
        } catch (ParseError& err) {
        }
    }

    return 0;
}

static int simple_vm_test(TestRandGen *gen) {
    RuleTable tbl = RuleParser::parse(simple_vm_txt);

    if (!check_eq<std::string>("opcode type", "uint8_t",
                               tbl.hdr.opcode_type) ||
        !check_eq<unsigned>("width", 8, tbl.hdr.width) ||
        !check_eq<std::string>("dispatcher", "dispatch",
                               tbl.hdr.dispatcher_name) ||
        !check_eq<std::string>("context", "Vm", tbl.hdr.context_type) ||
        !check_eq<std::string>("fallback", "", tbl.hdr.fallback) ||
        !check_eq<size_t>("number of rules", 3, tbl.rules.size()))
        return 1;

    Rule const& mov = tbl.rules[1];
    if (!check_eq<std::string>("pattern", "0010'ddss", mov.pattern_txt) ||
        !check_eq<std::string>("handler", "impl_move", mov.handler) ||
        !check_eq<unsigned>("line", 11, mov.line_no) ||
        !check_eq<size_t>("number of generics", 2, mov.generics.size()) ||
        !check_eq<size_t>("number of declarations", 2, mov.decls.size()))
        return 1;

    if (mov.generics[1].tp != GENERIC_ARG_VAR ||
        mov.generics[1].var_name != 's' ||
        !check_eq<std::string>("prefix", "Register", mov.generics[1].prefix))
        return 1;

    VarDecl const& s = mov.decls[1];
    if (s.mapping != VAR_MAPPING_TABLE ||
        !check_eq<std::string>("type", "Register", s.type_name) ||
        !check_eq<size_t>("table size", 4, s.table.size()) ||
        !check_hex("key", 3, s.table[3].raw) ||
        !check_eq<std::string>("value", "R3", s.table[3].value))
        return 1;

    DecisionTable res = TableCompiler().compile(tbl);
    if (!check_eq<size_t>("number of entries", 4 + 16 + 4,
                          res.entries().size()))
        return 1;

    int idx = res.find(0x24);
    if (idx < 0 ||
        !check_eq<std::string>("call for 0x24",
                               "impl_move<Register::R1, Register::R0>",
                               res.entries()[idx].call_txt()))
        return 1;

    return 0;
}

static int generic_args_test(TestRandGen *gen) {
    RuleTable tbl = RuleParser::parse(
        "opcode = uint16_t; dispatcher = decode; context = ns::Cpu;\n"
        "fallback = illegal;\n"
        "\"0000'iiii'____'____\" => op<{i}, 4, { 1 + 2 }, sizeof(int), "
        "Foo<8>, -1, ns::Mode::{m}> where { m: ns::Mode = nonzero(m) };\n");

    if (!check_eq<std::string>("context", "ns::Cpu", tbl.hdr.context_type) ||
        !check_eq<std::string>("fallback", "illegal", tbl.hdr.fallback) ||
        !check_eq<size_t>("number of rules", 1, tbl.rules.size()))
        return 1;

    GenericArgList const& args = tbl.rules[0].generics;
    if (!check_eq<size_t>("number of generics", 7, args.size()) ||
        !check_eq<std::string>("fixed", "4", args[1].txt) ||
        !check_eq<std::string>("braced", "(1 + 2)", args[2].txt) ||
        !check_eq<std::string>("call", "sizeof(int)", args[3].txt) ||
        !check_eq<std::string>("template", "Foo<8>", args[4].txt) ||
        !check_eq<std::string>("negative", "-1", args[5].txt) ||
        !check_eq<std::string>("prefix", "ns::Mode", args[6].prefix))
        return 1;

    if (args[0].tp != GENERIC_ARG_VAR || args[0].var_name != 'i' ||
        args[2].tp != GENERIC_ARG_FIXED) {
        std::cout << "Failure: generic arguments were misclassified" <<
            std::endl;
        return 1;
    }

    VarDecl const& m = tbl.rules[0].decls[0];
    if (m.mapping != VAR_MAPPING_FUNC ||
        !check_eq<std::string>("function", "nonzero", m.func_name) ||
        !check_eq<std::string>("type", "ns::Mode", m.type_name))
        return 1;

    return 0;
}

/*
 * < and > inside a braced expression are operators, so they mustn't stop
 * the rules after it from being parsed
 */
static int braced_operator_test(TestRandGen *gen) {
    static char const *exprs[] = {
        "1 << 2", "N < 4", "a > b", "(x >> 1) < y", NULL
    };

    for (char const **expr = exprs; *expr; expr++) {
        std::string txt("opcode = uint8_t; dispatcher = run; context = Cpu;\n"
                        "\"0000'0000\" => h<{ ");
        txt += *expr;
        txt += " }, Foo<2>>;\n"
            "\"0000'0001\" => g;\n";

        RuleTable tbl = RuleParser::parse(txt);

        if (!check_eq<size_t>("number of rules", 2, tbl.rules.size()) ||
            !check_eq<size_t>("number of generics", 2,
                              tbl.rules[0].generics.size()) ||
            !check_eq<std::string>("braced", std::string("(") + *expr + ")",
                                   tbl.rules[0].generics[0].txt) ||
            !check_eq<std::string>("template", "Foo<2>",
                                   tbl.rules[0].generics[1].txt) ||
            !check_eq<std::string>("second handler", "g",
                                   tbl.rules[1].handler) ||
            !check_eq<unsigned>("second rule line", 3, tbl.rules[1].line_no))
            return 1;
    }

    DecisionTable res = TableCompiler().compile_txt(
        "opcode = uint8_t; dispatcher = run; context = Cpu;\n"
        "\"0000'000a\" => h<{ 1 << 2 }, {a}>;\n"
        "\"1111'1111\" => g;\n");
    if (!check_eq<size_t>("number of entries", 3, res.entries().size()) ||
        !check_eq<std::string>("call", "h<(1 << 2), 1>",
                               res.entries()[1].call_txt()))
        return 1;

    return 0;
}

// bytes above 0x7f outside of strings are just punctuation
static int high_byte_test(TestRandGen *gen) {
    TokList toks = RuleParser::tokenize_line("h \xe9\xff x", 4);

    if (!check_eq<size_t>("number of tokens", 4, toks.size()) ||
        !check_eq<std::string>("identifier", "x", toks[3].txt))
        return 1;

    if (toks[1].tp != TOK_PUNCT || toks[2].tp != TOK_PUNCT ||
        toks[3].tp != TOK_IDENT) {
        std::cout << "Failure: high bytes were misclassified" << std::endl;
        return 1;
    }

    return 0;
}

static int missing_header_test(TestRandGen *gen) {
    return expect_error<ParseError>("opcode = uint8_t;\n"
                                    "context = Cpu;\n"
                                    "\"0000'0000\" => nop;\n", 3);
}

static int late_header_test(TestRandGen *gen) {
    return expect_error<ParseError>("opcode = uint8_t;\n"
                                    "dispatcher = d;\n"
                                    "context = Cpu;\n"
                                    "\"0000'0000\" => nop;\n"
                                    "fallback = illegal;\n", 5);
}

static int duplicate_header_test(TestRandGen *gen) {
    return expect_error<ParseError>("opcode = uint8_t;\n"
                                    "dispatcher = d;\n"
                                    "opcode = uint16_t;\n", 3);
}

static int bad_opcode_type_test(TestRandGen *gen) {
    return expect_error<InvalidParamError>("dispatcher = d;\n"
                                           "opcode = int;\n", 2);
}

static int syntax_error_test(TestRandGen *gen) {
    if (expect_error<ParseError>("opcode = uint8_t; dispatcher = d; "
                                 "context = Cpu;\n"
                                 "\"0000'0000\" => nop\n"
                                 "\"0000'0001\" => nop2;\n", 3) != 0)
        return 1;

    if (expect_error<ParseError>("opcode = uint8_t; dispatcher = d; "
                                 "context = Cpu;\n"
                                 "\"0000'000\n", 2) != 0)
        return 1;

    if (expect_error<ParseError>("opcode = uint8_t; dispatcher = d; "
                                 "context = Cpu;\n\n"
                                 "\"0000'iiii\" => op<{i}> where {\n"
                                 "    i: bool = nonzero(j)\n"
                                 "};\n", 4) != 0)
        return 1;

    return expect_error<ParseError>("opcode = uint8_t; dispatcher = d; "
                                    "context = Cpu;\n"
                                    "\"11rr'____\" => op<{r}> where {\n"
                                    "    r: Reg = { 0b00 => R0, 0b21 => R1 }\n"
                                    "};\n", 3);
}

// errors found while compiling point back at the rule's line
static int compile_error_line_test(TestRandGen *gen) {
    try {
        TableCompiler().compile_txt("opcode = uint8_t;\n"
                                    "dispatcher = d;\n"
                                    "context = Cpu;\n"
                                    "\"0000'0000\" => nop;\n"
                                    "\"0000'000\" => truncated;\n");
    } catch (MalformedPatternError& err) {
        unsigned const *line = boost::get_error_info<errinfo_line_no>(err);
        unsigned const *rule_idx = boost::get_error_info<errinfo_rule_idx>(err);
        if (!line || !rule_idx ||
            !check_eq<unsigned>("line", 5, *line) ||
            !check_eq<unsigned>("rule index", 1, *rule_idx))
            return 1;
        return 0;
    }

    std::cout << "Failure: 7-character pattern was accepted" << std::endl;
    return 1;
}

static int unmapped_line_test(TestRandGen *gen) {
    try {
        TableCompiler().compile_txt("opcode = uint8_t;\n"
                                    "dispatcher = d;\n"
                                    "context = Cpu;\n"
                                    "\"11rr'____\" => op<Reg::{r}> where {\n"
                                    "    r: Reg = { 0b00 => R0, 0b01 => R1, "
                                    "0b10 => R2 }\n"
                                    "};\n");
    } catch (UnmappedCombinationError& err) {
        unsigned const *line = boost::get_error_info<errinfo_line_no>(err);
        opcode_t const *raw = boost::get_error_info<errinfo_raw_val>(err);
        if (!line || !raw || !check_eq<unsigned>("line", 4, *line) ||
            !check_hex("missing raw value", 3, *raw))
            return 1;
        return 0;
    }

    std::cout << "Failure: incomplete literal table was accepted" << std::endl;
    return 1;
}

struct unit_test tests[] = {
    { "tokenize_test", tokenize_test },
    { "comment_test", comment_test },
    { "parse_key_test", parse_key_test },
    { "simple_vm_test", simple_vm_test },
    { "generic_args_test", generic_args_test },
    { "braced_operator_test", braced_operator_test },
    { "high_byte_test", high_byte_test },
    { "missing_header_test", missing_header_test },
    { "late_header_test", late_header_test },
    { "duplicate_header_test", duplicate_header_test },
    { "bad_opcode_type_test", bad_opcode_type_test },
    { "syntax_error_test", syntax_error_test },
    { "compile_error_line_test", compile_error_line_test },
    { "unmapped_line_test", unmapped_line_test },
    { NULL, NULL }
};

int main(int argc, char **argv) {
    return run_unit_tests(tests, argc, argv);
}

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

#ifndef OPCOMP_RULE_HPP_
#define OPCOMP_RULE_HPP_

#include <string>
#include <vector>

#include "opcomp/types.hpp"
#include "opcomp/BitPattern.hpp"
#include "opcomp/Binding.hpp"

enum generic_arg_tp {
    // reference to one of the pattern's variables, like {r} or Register::{r}
    GENERIC_ARG_VAR,

    // anything else, copied through to the handler untouched
    GENERIC_ARG_FIXED
};

struct GenericArg {
    enum generic_arg_tp tp;

    // only has meaning for GENERIC_ARG_VAR
    char var_name;

    /*
     * qualification written in front of a variable reference, eg "Register"
     * in Register::{r}.  It gets glued onto literal-table values.
     */
    std::string prefix;

    // only has meaning for GENERIC_ARG_FIXED
    std::string txt;

    static GenericArg var(char var_name, std::string const& prefix = "");
    static GenericArg fixed(std::string const& txt);
};

typedef std::vector<GenericArg> GenericArgList;

/*
 * One declaration out of the rule table:
 *
 *     pattern => handler<generics> where { decls };
 *
 * pattern and groups are empty until the compiler has parsed the pattern
 * and resolved the variable bindings.
 */
struct Rule {
    std::string pattern_txt;
    std::string handler;
    GenericArgList generics;
    VarDeclList decls;

    // line in the rule table text, 0 for rules that were built in code
    unsigned line_no;

    BitPattern pattern;
    VarGroupMap groups;

    Rule();
    Rule(std::string const& pattern_txt, std::string const& handler);

    Rule& arg_var(char var_name, std::string const& prefix = "");
    Rule& arg_fixed(std::string const& txt);
    Rule& declare(VarDecl const& decl);

    // for log messages: "\"0101'____\" => specific"
    std::string describe() const;
};

typedef std::vector<Rule> RuleList;

// everything about the generated dispatcher that isn't a rule
struct TableHeader {
    // C++ type of the opcode, as written
    std::string opcode_type;

    // opcode width in bits
    unsigned width;

    std::string dispatcher_name;
    std::string context_type;

    // handler for opcodes that match nothing; empty means fail-fast
    std::string fallback;

    TableHeader() : width(0) {
    }
};

struct RuleTable {
    TableHeader hdr;
    RuleList rules;

    /*
     * set the opcode type, and derive the width from it.  Throws
     * InvalidParamError for types that aren't a fixed-width unsigned integer.
     */
    void set_opcode_type(std::string const& type_name);
};

// width in bits of the given fixed-width unsigned type, or 0 if unknown
unsigned opcode_type_width(std::string const& type_name);

VarDecl decl_raw(char name, std::string const& type_name = "");
VarDecl decl_table(char name, std::string const& type_name,
                   LiteralEntryList const& table);
VarDecl decl_func(char name, std::string const& type_name,
                  std::string const& func_name,
                  MappingFuncPtr func = MappingFuncPtr());

#endif

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

#include <sstream>

#include "opcomp/BaseException.hpp"

#include "opcomp/Rule.hpp"

GenericArg GenericArg::var(char var_name, std::string const& prefix) {
    GenericArg arg;
    arg.tp = GENERIC_ARG_VAR;
    arg.var_name = var_name;
    arg.prefix = prefix;
    return arg;
}

GenericArg GenericArg::fixed(std::string const& txt) {
    GenericArg arg;
    arg.tp = GENERIC_ARG_FIXED;
    arg.var_name = '\0';
    arg.txt = txt;
    return arg;
}

Rule::Rule() : line_no(0) {
}

Rule::Rule(std::string const& pattern_txt, std::string const& handler) {
    this->pattern_txt = pattern_txt;
    this->handler = handler;
    this->line_no = 0;
}

Rule& Rule::arg_var(char var_name, std::string const& prefix) {
    generics.push_back(GenericArg::var(var_name, prefix));
    return *this;
}

Rule& Rule::arg_fixed(std::string const& txt) {
    generics.push_back(GenericArg::fixed(txt));
    return *this;
}

Rule& Rule::declare(VarDecl const& decl) {
    decls.push_back(decl);
    return *this;
}

std::string Rule::describe() const {
    std::stringstream ss;

    ss << "\"" << pattern_txt << "\" => " << handler;
    if (generics.size()) {
        ss << "<";
        for (GenericArgList::const_iterator it = generics.begin();
             it != generics.end(); it++) {
            if (it != generics.begin())
                ss << ", ";
            if (it->tp == GENERIC_ARG_VAR) {
                if (it->prefix.size())
                    ss << it->prefix << "::";
                ss << "{" << it->var_name << "}";
            } else {
                ss << it->txt;
            }
        }
        ss << ">";
    }

    if (line_no)
        ss << " (line " << line_no << ")";

    return ss.str();
}

unsigned opcode_type_width(std::string const& type_name) {
    static struct type_width {
        char const *name;
        unsigned width;
    } const widths[] = {
        { "uint8_t", 8 },
        { "uint16_t", 16 },
        { "uint32_t", 32 },
        { "uint64_t", 64 },
        { "std::uint8_t", 8 },
        { "std::uint16_t", 16 },
        { "std::uint32_t", 32 },
        { "std::uint64_t", 64 },
        { "boost::uint8_t", 8 },
        { "boost::uint16_t", 16 },
        { "boost::uint32_t", 32 },
        { "boost::uint64_t", 64 },
        { NULL, 0 }
    };

    for (struct type_width const *tw = widths; tw->name; tw++)
        if (type_name == tw->name)
            return tw->width;

    return 0;
}

void RuleTable::set_opcode_type(std::string const& type_name) {
    unsigned width = opcode_type_width(type_name);

    if (!width) {
        BOOST_THROW_EXCEPTION(InvalidParamError("Opcode type must be a "
                                                "fixed-width unsigned "
                                                "integer") <<
                              errinfo_type_name(type_name));
    }

    hdr.opcode_type = type_name;
    hdr.width = width;
}

VarDecl decl_raw(char name, std::string const& type_name) {
    VarDecl decl;
    decl.name = name;
    decl.type_name = type_name;
    decl.mapping = VAR_MAPPING_NONE;
    return decl;
}

VarDecl decl_table(char name, std::string const& type_name,
                   LiteralEntryList const& table) {
    VarDecl decl;
    decl.name = name;
    decl.type_name = type_name;
    decl.mapping = VAR_MAPPING_TABLE;
    decl.table = table;
    return decl;
}

VarDecl decl_func(char name, std::string const& type_name,
                  std::string const& func_name, MappingFuncPtr func) {
    VarDecl decl;
    decl.name = name;
    decl.type_name = type_name;
    decl.mapping = VAR_MAPPING_FUNC;
    decl.func_name = func_name;
    decl.func = func;
    return decl;
}

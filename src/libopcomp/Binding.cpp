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
#include "opcomp/log.h"

#include "opcomp/Binding.hpp"

char const *binding_kind_name(enum binding_kind kind) {
    switch (kind) {
    case BINDING_RAW_INTEGER:
        return "raw";
    case BINDING_LITERAL_MAP:
        return "table";
    case BINDING_PURE_FUNCTION:
        return "function";
    }

    BOOST_THROW_EXCEPTION(IntegrityError("Unknown binding kind"));
}

std::string format_raw_literal(opcode_t raw) {
    std::stringstream ss;

    /*
     * anything that doesn't fit in a signed 32-bit int gets a suffix so the
     * C++ compiler doesn't pick a signed type for it
     */
    if (raw <= 0x7fffffff)
        ss << raw;
    else
        ss << "0x" << std::hex << raw << "ull";

    return ss.str();
}

std::string ExternalMappingFunction::apply(opcode_t raw) const {
    return func_name + "(" + format_raw_literal(raw) + ")";
}

std::string map_nonzero(opcode_t raw) {
    return raw ? "true" : "false";
}

std::string map_identity(opcode_t raw) {
    return format_raw_literal(raw);
}

opcode_t VariableGroup::domain_size() const {
    if (kind == BINDING_LITERAL_MAP)
        return literals.size();
    if (n_bits() >= OPCOMP_MAX_WIDTH)
        return ~opcode_t(0);
    return opcode_t(1) << n_bits();
}

VariableGroup::Domain VariableGroup::domain() const {
    Domain dom;

    if (kind == BINDING_LITERAL_MAP) {
        for (LiteralMap::const_iterator it = literals.begin();
             it != literals.end(); it++) {
            dom.push_back(it->first);
        }
    } else {
        if (n_bits() >= OPCOMP_MAX_WIDTH) {
            BOOST_THROW_EXCEPTION(ExpansionLimitError() <<
                                  errinfo_var_name(name) <<
                                  errinfo_n_bits(n_bits()));
        }

        opcode_t n_vals = opcode_t(1) << n_bits();
        for (opcode_t raw = 0; raw < n_vals; raw++)
            dom.push_back(raw);
    }

    return dom;
}

std::string VariableGroup::bind(opcode_t raw) const {
    if (raw & ~opcomp_low_mask(n_bits())) {
        BOOST_THROW_EXCEPTION(VariableWidthOverflowError() <<
                              errinfo_var_name(name) <<
                              errinfo_raw_val(raw) <<
                              errinfo_n_bits(n_bits()));
    }

    switch (kind) {
    case BINDING_RAW_INTEGER:
        return format_raw_literal(raw);
    case BINDING_LITERAL_MAP:
        {
            LiteralMap::const_iterator it = literals.find(raw);
            if (it == literals.end()) {
                BOOST_THROW_EXCEPTION(UnmappedCombinationError() <<
                                      errinfo_var_name(name) <<
                                      errinfo_raw_val(raw));
            }
            return it->second;
        }
    case BINDING_PURE_FUNCTION:
        if (!func) {
            BOOST_THROW_EXCEPTION(IntegrityError("Function binding without "
                                                 "a function") <<
                                  errinfo_var_name(name));
        }
        return func->apply(raw);
    }

    BOOST_THROW_EXCEPTION(IntegrityError("Unknown binding kind"));
}

bool is_raw_integer_type(std::string const& type_name) {
    static char const *raw_types[] = {
        "uint8_t", "uint16_t", "uint32_t", "uint64_t",
        "std::uint8_t", "std::uint16_t", "std::uint32_t", "std::uint64_t",
        "boost::uint8_t", "boost::uint16_t", "boost::uint32_t",
        "boost::uint64_t",
        "unsigned", "unsigned int", "unsigned long", "unsigned long long",
        "opcode_t",
        NULL
    };

    for (char const **tp = raw_types; *tp; tp++)
        if (type_name == *tp)
            return true;
    return false;
}

static void resolve_literal_table(VariableGroup *grp, VarDecl const& decl,
                                  BitPattern const& ptrn) {
    opcode_t max_raw = opcomp_low_mask(grp->n_bits());

    for (LiteralEntryList::const_iterator it = decl.table.begin();
         it != decl.table.end(); it++) {
        if (it->raw > max_raw) {
            BOOST_THROW_EXCEPTION(VariableWidthOverflowError("Literal table "
                                                             "key does not "
                                                             "fit in the "
                                                             "variable") <<
                                  errinfo_pattern(ptrn.src_txt()) <<
                                  errinfo_var_name(decl.name) <<
                                  errinfo_raw_val(it->raw) <<
                                  errinfo_n_bits(grp->n_bits()));
        }

        if (grp->literals.count(it->raw)) {
            BOOST_THROW_EXCEPTION(ParseError("Duplicate key in literal "
                                             "table") <<
                                  errinfo_pattern(ptrn.src_txt()) <<
                                  errinfo_var_name(decl.name) <<
                                  errinfo_raw_val(it->raw));
        }

        grp->literals[it->raw] = it->value;
    }

    /*
     * Every raw value is reachable because nothing in the pattern constrains
     * a variable's bits, so the table has to be complete.
     */
    for (opcode_t raw = 0; raw <= max_raw; raw++) {
        if (!grp->literals.count(raw)) {
            BOOST_THROW_EXCEPTION(UnmappedCombinationError() <<
                                  errinfo_pattern(ptrn.src_txt()) <<
                                  errinfo_var_name(decl.name) <<
                                  errinfo_raw_val(raw) <<
                                  errinfo_n_bits(grp->n_bits()));
        }
    }
}

VarGroupMap resolve_bindings(BitPattern const& ptrn, VarDeclList const& decls) {
    VarGroupMap groups;
    std::string const& names = ptrn.var_names();

    for (std::string::const_iterator it = names.begin(); it != names.end();
         it++) {
        VariableGroup grp;
        grp.name = *it;
        grp.positions = ptrn.var_positions(*it);
        grp.kind = BINDING_RAW_INTEGER;
        groups[*it] = grp;
    }

    std::string seen;
    for (VarDeclList::const_iterator it = decls.begin(); it != decls.end();
         it++) {
        VarGroupMap::iterator grp_it = groups.find(it->name);

        if (grp_it == groups.end()) {
            BOOST_THROW_EXCEPTION(ParseError("Declared variable does not "
                                             "appear in the pattern") <<
                                  errinfo_pattern(ptrn.src_txt()) <<
                                  errinfo_var_name(it->name));
        }

        if (seen.find(it->name) != std::string::npos) {
            BOOST_THROW_EXCEPTION(ParseError("Variable declared more than "
                                             "once") <<
                                  errinfo_pattern(ptrn.src_txt()) <<
                                  errinfo_var_name(it->name));
        }
        seen.push_back(it->name);

        VariableGroup *grp = &grp_it->second;
        grp->type_name = it->type_name;

        switch (it->mapping) {
        case VAR_MAPPING_NONE:
            if (it->type_name.size() && !is_raw_integer_type(it->type_name)) {
                BOOST_THROW_EXCEPTION(MissingMappingError() <<
                                      errinfo_pattern(ptrn.src_txt()) <<
                                      errinfo_var_name(it->name) <<
                                      errinfo_type_name(it->type_name));
            }
            grp->kind = BINDING_RAW_INTEGER;
            break;
        case VAR_MAPPING_TABLE:
            grp->kind = BINDING_LITERAL_MAP;
            resolve_literal_table(grp, *it, ptrn);
            break;
        case VAR_MAPPING_FUNC:
            grp->kind = BINDING_PURE_FUNCTION;
            if (it->func)
                grp->func = it->func;
            else
                grp->func = MappingFuncPtr(new ExternalMappingFunction(it->func_name));
            break;
        }

        LOG_DBG("variable '%c' of \"%s\": %u bit(s), %s binding\n",
                grp->name, ptrn.src_txt().c_str(), grp->n_bits(),
                binding_kind_name(grp->kind));
    }

    return groups;
}

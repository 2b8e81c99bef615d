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

#ifndef OPCOMP_BINDING_HPP_
#define OPCOMP_BINDING_HPP_

#include <map>
#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>

#include "opcomp/types.hpp"
#include "opcomp/BitPattern.hpp"

enum binding_kind {
    // the natural unsigned value of the variable's bits
    BINDING_RAW_INTEGER,

    // explicit table from raw value to constant
    BINDING_LITERAL_MAP,

    // raw value is handed to a mapping function
    BINDING_PURE_FUNCTION
};

char const *binding_kind_name(enum binding_kind kind);

/*
 * A mapping function turns the raw bits of a variable into the C++ constant
 * expression that the handler gets specialized on.  Mapping functions are
 * trusted to be total and pure over [0, 2^n_bits); nothing here checks that.
 */
class MappingFunction {
public:
    virtual ~MappingFunction() {
    }

    virtual std::string name() const = 0;

    virtual std::string apply(opcode_t raw) const = 0;
};

typedef boost::shared_ptr<MappingFunction> MappingFuncPtr;

/*
 * A function that lives in the program which includes the generated
 * dispatcher.  We never evaluate it; apply() just writes a call which the
 * C++ compiler evaluates, so the function needs to be constexpr.
 */
class ExternalMappingFunction : public MappingFunction {
public:
    ExternalMappingFunction(std::string const& func_name) {
        this->func_name = func_name;
    }

    virtual std::string name() const {
        return func_name;
    }

    virtual std::string apply(opcode_t raw) const;

private:
    std::string func_name;
};

// A function linked into the compiler itself, evaluated during expansion
class NativeMappingFunction : public MappingFunction {
public:
    typedef std::string(*map_func_t)(opcode_t raw);

    NativeMappingFunction(std::string const& func_name, map_func_t func) {
        this->func_name = func_name;
        this->func = func;
    }

    virtual std::string name() const {
        return func_name;
    }

    virtual std::string apply(opcode_t raw) const {
        return func(raw);
    }

private:
    std::string func_name;
    map_func_t func;
};

// builtin native mappings
std::string map_nonzero(opcode_t raw);
std::string map_identity(opcode_t raw);

// render a raw value as a C++ integer literal
std::string format_raw_literal(opcode_t raw);

enum var_mapping_tp {
    VAR_MAPPING_NONE,
    VAR_MAPPING_TABLE,
    VAR_MAPPING_FUNC
};

struct LiteralEntry {
    opcode_t raw;
    std::string value;
};

typedef std::vector<LiteralEntry> LiteralEntryList;

/*
 * a variable as it was declared in a rule's where clause.  type_name is
 * empty if the declaration didn't name a type.
 */
struct VarDecl {
    char name;
    std::string type_name;
    enum var_mapping_tp mapping;

    // only has meaning for VAR_MAPPING_TABLE
    LiteralEntryList table;

    // only has meaning for VAR_MAPPING_FUNC
    std::string func_name;
    MappingFuncPtr func; // NULL means treat func_name as external

    VarDecl() : name('\0'), mapping(VAR_MAPPING_NONE) {
    }
};

typedef std::vector<VarDecl> VarDeclList;

/*
 * every position a variable occupies in one pattern, along with how its raw
 * value gets turned into a constant.
 */
struct VariableGroup {
    typedef std::map<opcode_t, std::string> LiteralMap;
    typedef std::vector<opcode_t> Domain;

    char name;
    std::string type_name;
    enum binding_kind kind;

    // most-significant first
    BitPattern::PosList positions;

    LiteralMap literals;
    MappingFuncPtr func;

    VariableGroup() : name('\0'), kind(BINDING_RAW_INTEGER) {
    }

    unsigned n_bits() const {
        return positions.size();
    }

    /*
     * number of raw values this variable enumerates.  Saturates instead of
     * overflowing for a 64-bit variable.
     */
    opcode_t domain_size() const;

    // every raw value this variable enumerates, in ascending order
    Domain domain() const;

    // the constant expression raw maps to
    std::string bind(opcode_t raw) const;
};

typedef std::map<char, VariableGroup> VarGroupMap;

bool is_raw_integer_type(std::string const& type_name);

/*
 * build a VariableGroup for every variable in ptrn.  Variables with no
 * declaration are raw integers.
 *
 * Throws MissingMappingError, UnmappedCombinationError,
 * VariableWidthOverflowError, or ParseError if a declaration names a
 * variable that isn't in the pattern or the same variable is declared twice.
 */
VarGroupMap resolve_bindings(BitPattern const& ptrn, VarDeclList const& decls);

#endif

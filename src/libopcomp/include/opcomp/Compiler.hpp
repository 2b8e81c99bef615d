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


#ifndef OPCOMP_COMPILER_HPP_
#define OPCOMP_COMPILER_HPP_

#include <map>
#include <string>

#include "opcomp/types.hpp"
#include "opcomp/Binding.hpp"
#include "opcomp/Rule.hpp"
#include "opcomp/DecisionTable.hpp"
#include "opcomp/CompileOptions.hpp"

/*
 * runs a rule table through the whole pipeline: pattern parsing, variable
 * binding, expansion and priority resolution.
 *
 * Errors thrown out of compile have errinfo_rule_idx (and errinfo_line_no
 * for rules that came from text) attached so the user can find the rule
 * that caused them.
 */
class TableCompiler {
public:
    typedef std::map<std::string, MappingFuncPtr> FuncMap;

    TableCompiler();
    TableCompiler(CompileOptions const& opts);

    CompileOptions const& options() const {
        return opts;
    }

    void set_options(CompileOptions const& opts) {
        this->opts = opts;
    }

    /*
     * make a native mapping function available to where clauses under
     * func->name().  A function mapping that doesn't name a registered
     * function is emitted as a call to a constexpr function of that name.
     *
     * "nonzero" and "identity" are always registered.
     */
    void register_function(MappingFuncPtr func);

    bool has_function(std::string const& name) const;

    DecisionTable compile(RuleTable const& tbl) const;

    // parse then compile
    DecisionTable compile_txt(std::string const& txt) const;

private:
    CompileOptions opts;
    FuncMap funcs;

    void prepare_rule(Rule *rule, unsigned width) const;
};

#endif

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

#ifndef OPCOMP_EXPANSION_HPP_
#define OPCOMP_EXPANSION_HPP_

#include <map>

#include "opcomp/types.hpp"
#include "opcomp/BitPattern.hpp"
#include "opcomp/Rule.hpp"
#include "opcomp/DecisionTable.hpp"

// raw value of every variable in a pattern
typedef std::map<char, opcode_t> VarAssignment;

/*
 * derive the single (opcode & mask) == expected test for one assignment of
 * the pattern's variables.  assign needs a value for every variable in the
 * pattern and nothing else.  Wildcards are left out of both outputs.
 */
void derive_test(BitPattern const& ptrn, VarAssignment const& assign,
                 opcode_t *mask, opcode_t *expected);

/*
 * number of entries expand_rule would produce for rule, saturating at
 * ~0UL.  rule.groups must already be resolved.
 */
unsigned long expansion_size(Rule const& rule);

/*
 * expand a rule whose pattern and variable groups have been resolved into
 * one dispatch entry per combination of its variables' raw values.  The
 * first variable in the pattern varies slowest.
 *
 * Throws ExpansionLimitError if that would be more than max_entries
 * entries, or ParseError if a generic argument names a variable that isn't
 * in the pattern.
 */
DecisionTable::EntryList expand_rule(Rule const& rule, unsigned rule_idx,
                                     unsigned long max_entries);

#endif

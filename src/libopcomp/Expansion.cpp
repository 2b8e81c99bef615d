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

#include <vector>

#include "opcomp/BaseException.hpp"
#include "opcomp/log.h"

#include "opcomp/Expansion.hpp"

static unsigned count_bits(opcode_t val) {
    unsigned count = 0;
    while (val) {
        val &= val - 1;
        count++;
    }
    return count;
}

void derive_test(BitPattern const& ptrn, VarAssignment const& assign,
                 opcode_t *mask, opcode_t *expected) {
    opcode_t mask_out = ptrn.fixed_mask();
    opcode_t expect_out = ptrn.fixed_val();
    std::string const& names = ptrn.var_names();

    if (assign.size() != names.size()) {
        BOOST_THROW_EXCEPTION(InvalidParamError("Assignment does not match "
                                                "the pattern's variables") <<
                              errinfo_pattern(ptrn.src_txt()) <<
                              errinfo_length(assign.size()) <<
                              errinfo_length_expect(names.size()));
    }

    for (VarAssignment::const_iterator it = assign.begin(); it != assign.end();
         it++) {
        if (!ptrn.has_var(it->first)) {
            BOOST_THROW_EXCEPTION(InvalidParamError("Assignment to a variable "
                                                    "that isn't in the "
                                                    "pattern") <<
                                  errinfo_pattern(ptrn.src_txt()) <<
                                  errinfo_var_name(it->first));
        }

        mask_out |= ptrn.var_mask(it->first);
        expect_out |= ptrn.deposit(it->first, it->second);
    }

    *mask = mask_out;
    *expected = expect_out;
}

unsigned long expansion_size(Rule const& rule) {
    unsigned long total = 1;

    for (VarGroupMap::const_iterator it = rule.groups.begin();
         it != rule.groups.end(); it++) {
        opcode_t n_vals = it->second.domain_size();

        if (n_vals == 0)
            return 0;
        if (n_vals > ~0UL / total)
            return ~0UL;
        total *= n_vals;
    }

    return total;
}

static BoundValueList bind_generics(Rule const& rule,
                                    VarAssignment const& assign) {
    BoundValueList bound;

    for (GenericArgList::const_iterator it = rule.generics.begin();
         it != rule.generics.end(); it++) {
        BoundValue val;

        if (it->tp == GENERIC_ARG_FIXED) {
            val.txt = it->txt;
            val.from_var = false;
        } else {
            VariableGroup const& grp = rule.groups.find(it->var_name)->second;
            opcode_t raw = assign.find(it->var_name)->second;

            val.from_var = true;
            val.var_name = it->var_name;
            val.raw = raw;
            val.txt = grp.bind(raw);
            if (it->prefix.size() && grp.kind == BINDING_LITERAL_MAP)
                val.txt = it->prefix + "::" + val.txt;
        }

        bound.push_back(val);
    }

    return bound;
}

DecisionTable::EntryList expand_rule(Rule const& rule, unsigned rule_idx,
                                     unsigned long max_entries) {
    DecisionTable::EntryList entries;
    BitPattern const& ptrn = rule.pattern;
    std::string const& names = ptrn.var_names();

    for (GenericArgList::const_iterator it = rule.generics.begin();
         it != rule.generics.end(); it++) {
        if (it->tp == GENERIC_ARG_VAR && !rule.groups.count(it->var_name)) {
            BOOST_THROW_EXCEPTION(ParseError("Generic argument refers to a "
                                             "variable that isn't in the "
                                             "pattern") <<
                                  errinfo_pattern(rule.pattern_txt) <<
                                  errinfo_var_name(it->var_name));
        }
    }

    if (rule.groups.size() != names.size()) {
        BOOST_THROW_EXCEPTION(IntegrityError("Rule variables were not "
                                             "resolved") <<
                              errinfo_pattern(rule.pattern_txt));
    }

    unsigned long n_entries = expansion_size(rule);
    if (n_entries > max_entries) {
        BOOST_THROW_EXCEPTION(ExpansionLimitError() <<
                              errinfo_pattern(rule.pattern_txt) <<
                              errinfo_limit(max_entries));
    }

    // one domain per variable, in pattern order
    std::vector<VariableGroup::Domain> domains;
    for (std::string::const_iterator it = names.begin(); it != names.end();
         it++) {
        domains.push_back(rule.groups.find(*it)->second.domain());
    }

    /*
     * odometer over the domains; the last variable is the fastest-moving
     * digit.  A rule without variables goes through the loop exactly once.
     */
    std::vector<size_t> digits(names.size(), 0);
    bool done = false;
    while (!done) {
        VarAssignment assign;
        for (size_t var_no = 0; var_no < names.size(); var_no++)
            assign[names[var_no]] = domains[var_no][digits[var_no]];

        DispatchEntry ent;
        derive_test(ptrn, assign, &ent.mask, &ent.expected);
        ent.handler = rule.handler;
        ent.rule_idx = rule_idx;
        ent.bound = bind_generics(rule, assign);

        if ((ent.expected & ~ent.mask) ||
            count_bits(ent.mask) != ptrn.n_significant()) {
            BOOST_THROW_EXCEPTION(IntegrityError("Derived test does not "
                                                 "agree with its pattern") <<
                                  errinfo_pattern(rule.pattern_txt) <<
                                  errinfo_mask(ent.mask) <<
                                  errinfo_expected(ent.expected));
        }

        entries.push_back(ent);

        done = true;
        for (size_t var_no = names.size(); var_no > 0; var_no--) {
            size_t idx = var_no - 1;
            if (++digits[idx] < domains[idx].size()) {
                done = false;
                break;
            }
            digits[idx] = 0;
        }
    }

    LOG_DBG("%s expanded into %u dispatch entries\n",
            rule.describe().c_str(), unsigned(entries.size()));

    return entries;
}

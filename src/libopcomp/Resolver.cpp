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

#include <map>
#include <set>
#include <utility>
#include <sstream>

#include "opcomp/BaseException.hpp"
#include "opcomp/log.h"

#include "opcomp/Resolver.hpp"

enum cover_result cube_covered(Cube const& cube, CubeList const& covers,
                               unsigned long *budget) {
    if (!*budget)
        return COVER_UNKNOWN;
    (*budget)--;

    CubeList hits;
    for (CubeList::const_iterator it = covers.begin(); it != covers.end();
         it++) {
        if (it->contains(cube))
            return COVER_YES;
        if (it->intersects(cube))
            hits.push_back(*it);
    }

    if (hits.empty())
        return COVER_NO;

    /*
     * hits[0] overlaps the cube without containing it, which means it tests
     * at least one bit that the cube leaves free.  Split the cube on that
     * bit; it's covered if and only if both halves are.
     */
    opcode_t free_bits = hits[0].mask & ~cube.mask;
    opcode_t split = free_bits & (~free_bits + 1);

    if (!split)
        BOOST_THROW_EXCEPTION(IntegrityError("Cube split on a fixed bit"));

    Cube lo(cube.mask | split, cube.val & ~split);
    Cube hi(cube.mask | split, cube.val | split);

    enum cover_result res_lo = cube_covered(lo, hits, budget);
    if (res_lo == COVER_NO)
        return COVER_NO;

    enum cover_result res_hi = cube_covered(hi, hits, budget);
    if (res_hi == COVER_NO)
        return COVER_NO;

    if (res_lo == COVER_UNKNOWN || res_hi == COVER_UNKNOWN)
        return COVER_UNKNOWN;
    return COVER_YES;
}

// the earlier rule to blame for shadowing rules[rule_idx]
static unsigned find_shadowing_rule(CubeList const& prior, Cube const& cube) {
    for (unsigned idx = 0; idx < prior.size(); idx++)
        if (prior[idx].contains(cube))
            return idx;

    for (unsigned idx = 0; idx < prior.size(); idx++)
        if (prior[idx].intersects(cube))
            return idx;

    BOOST_THROW_EXCEPTION(IntegrityError("Covered rule does not overlap any "
                                         "earlier rule"));
}

static void check_reachable(RuleList const& rules, unsigned rule_idx,
                            CubeList const& prior, CompileOptions const& opts,
                            DecisionTable::DiagList *diags) {
    Rule const& rule = rules[rule_idx];
    Cube cube(rule.pattern.fixed_mask(), rule.pattern.fixed_val());
    unsigned long budget = opts.cover_budget;

    switch (cube_covered(cube, prior, &budget)) {
    case COVER_NO:
        return;
    case COVER_UNKNOWN:
        LOG_DBG("unable to prove whether %s is reachable, assuming it is\n",
                rule.describe().c_str());
        return;
    case COVER_YES:
        break;
    }

    unsigned other_idx = find_shadowing_rule(prior, cube);

    if (!opts.suppress_unreachable) {
        UnreachablePatternError err;
        err << errinfo_pattern(rule.pattern_txt) <<
            errinfo_rule_idx(rule_idx) <<
            errinfo_other_rule_idx(other_idx);
        if (rule.line_no)
            err << errinfo_line_no(rule.line_no);
        err << errinfo_advice("move the rule in front of the rules that "
                              "shadow it, or delete it");
        BOOST_THROW_EXCEPTION(err);
    }

    std::stringstream ss;
    ss << rule.describe() << " can never match, every opcode it matches is "
        "already matched by earlier rules such as " <<
        rules[other_idx].describe();

    Diagnostic diag;
    diag.kind = DIAG_UNREACHABLE_PATTERN;
    diag.rule_idx = rule_idx;
    diag.other_rule_idx = other_idx;
    diag.msg = ss.str();
    diags->push_back(diag);

    LOG_WARN("%s\n", diag.msg.c_str());
}

DecisionTable
resolve_priority(TableHeader const& hdr, RuleList const& rules,
                 std::vector<DecisionTable::EntryList> const& expanded,
                 CompileOptions const& opts) {
    typedef std::pair<opcode_t, opcode_t> TestKey;
    typedef std::map<TestKey, size_t> TestMap;

    DecisionTable::EntryList all;
    DecisionTable::DiagList diags;
    CubeList prior;
    TestMap first_seen;
    std::set<std::pair<unsigned, unsigned> > reported;

    if (expanded.size() != rules.size()) {
        BOOST_THROW_EXCEPTION(InvalidParamError("Expanded entries do not "
                                                "match the rule list") <<
                              errinfo_length(expanded.size()) <<
                              errinfo_length_expect(rules.size()));
    }

    for (unsigned rule_idx = 0; rule_idx < rules.size(); rule_idx++) {
        check_reachable(rules, rule_idx, prior, opts, &diags);
        prior.push_back(Cube(rules[rule_idx].pattern.fixed_mask(),
                             rules[rule_idx].pattern.fixed_val()));

        DecisionTable::EntryList const& ents = expanded[rule_idx];
        for (DecisionTable::EntryList::const_iterator it = ents.begin();
             it != ents.end(); it++) {
            TestKey key(it->mask, it->expected);
            TestMap::iterator seen = first_seen.find(key);

            if (seen == first_seen.end()) {
                first_seen[key] = all.size();
                all.push_back(*it);
                continue;
            }

            DispatchEntry const& prev = all[seen->second];
            if (prev.rule_idx == rule_idx) {
                BOOST_THROW_EXCEPTION(IntegrityError("Two entries of one rule "
                                                     "share a test") <<
                                      errinfo_pattern(rules[rule_idx].pattern_txt) <<
                                      errinfo_mask(it->mask) <<
                                      errinfo_expected(it->expected));
            }

            std::pair<unsigned, unsigned> rule_pair(prev.rule_idx, rule_idx);
            if (prev.call_txt() != it->call_txt() && !reported.count(rule_pair)) {
                reported.insert(rule_pair);

                if (opts.ambiguous_fatal) {
                    BOOST_THROW_EXCEPTION(AmbiguousPatternError() <<
                                          errinfo_pattern(rules[rule_idx].pattern_txt) <<
                                          errinfo_rule_idx(rule_idx) <<
                                          errinfo_other_rule_idx(prev.rule_idx) <<
                                          errinfo_mask(it->mask) <<
                                          errinfo_expected(it->expected));
                }

                std::stringstream ss;
                ss << rules[rule_idx].describe() << " and " <<
                    rules[prev.rule_idx].describe() <<
                    " both test (opcode & 0x" << std::hex << it->mask <<
                    ") == 0x" << it->expected << "; " << prev.call_txt() <<
                    " wins over " << it->call_txt();

                Diagnostic diag;
                diag.kind = DIAG_AMBIGUOUS_PATTERN;
                diag.rule_idx = rule_idx;
                diag.other_rule_idx = prev.rule_idx;
                diag.msg = ss.str();
                diags.push_back(diag);

                LOG_WARN("%s\n", diag.msg.c_str());
            }

            all.push_back(*it);
        }
    }

    LOG_DBG("decision table has %u entries from %u rules\n",
            unsigned(all.size()), unsigned(rules.size()));

    return DecisionTable(hdr, rules.size(), all, diags);
}

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

#ifndef OPCOMP_COMPILEOPTIONS_HPP_
#define OPCOMP_COMPILEOPTIONS_HPP_

#include <string>

#define OPCOMP_DEFAULT_MAX_ENTRIES_PER_RULE (1UL << 16)
#define OPCOMP_DEFAULT_COVER_BUDGET (1UL << 20)

struct CompileOptions {
    // report unreachable rules as warnings instead of failing
    bool suppress_unreachable;

    // fail instead of warning when two handlers share the same test
    bool ambiguous_fatal;

    // limit on how many dispatch entries a single rule may expand into
    unsigned long max_entries_per_rule;

    /*
     * limit on how many cubes the unreachable-rule check may visit for a
     * single rule.  Once it runs out the rule is assumed to be reachable.
     */
    unsigned long cover_budget;

    // if not empty, overrides the fallback handler named by the rule table
    std::string fallback;

    CompileOptions() : suppress_unreachable(false), ambiguous_fatal(false),
                       max_entries_per_rule(OPCOMP_DEFAULT_MAX_ENTRIES_PER_RULE),
                       cover_budget(OPCOMP_DEFAULT_COVER_BUDGET) {
    }
};

/*
 * overwrite opts with whatever the config file sets:
 *
 *     opcomp.suppress-unreachable   bool
 *     opcomp.ambiguous-fatal        bool
 *     opcomp.max-entries-per-rule   int
 *     opcomp.cover-budget           int
 *     opcomp.emit.fallback          handler name
 *
 * keys that aren't in the config file leave opts alone.  A value that
 * doesn't parse, or a limit that isn't positive, throws InvalidParamError.
 */
void compile_options_load_cfg(CompileOptions *opts);

#endif

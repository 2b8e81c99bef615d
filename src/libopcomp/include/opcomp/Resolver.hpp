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

#ifndef OPCOMP_RESOLVER_HPP_
#define OPCOMP_RESOLVER_HPP_

#include <vector>

#include "opcomp/types.hpp"
#include "opcomp/Rule.hpp"
#include "opcomp/DecisionTable.hpp"
#include "opcomp/CompileOptions.hpp"

/*
 * the set of opcodes matched by one mask/expected pair.  Bits outside the
 * mask are free, so a cube with k free bits holds 2^k opcodes.
 */
struct Cube {
    opcode_t mask;
    opcode_t val;

    Cube() : mask(0), val(0) {
    }

    Cube(opcode_t mask, opcode_t val) : mask(mask), val(val) {
    }

    bool intersects(Cube const& other) const {
        return !((val ^ other.val) & mask & other.mask);
    }

    // true if every opcode in other is also in this cube
    bool contains(Cube const& other) const {
        return !(mask & ~other.mask) && !((val ^ other.val) & mask);
    }
};

typedef std::vector<Cube> CubeList;

enum cover_result {
    COVER_NO,
    COVER_YES,

    // ran out of budget before an answer was found
    COVER_UNKNOWN
};

/*
 * decide whether every opcode in cube is matched by at least one of covers.
 * Each cube visited costs one unit of *budget.
 */
enum cover_result cube_covered(Cube const& cube, CubeList const& covers,
                               unsigned long *budget);

/*
 * Put the expanded rules into their final dispatch order and check them.
 *
 * Rules are never reordered: entries of an earlier rule always come first.
 * A rule that can't match any opcode that an earlier rule doesn't already
 * match throws UnreachablePatternError unless opts.suppress_unreachable is
 * set.  Entries from different rules with identical tests but different
 * handler calls are reported as a warning (or AmbiguousPatternError with
 * opts.ambiguous_fatal).
 *
 * expanded[i] holds the entries of rules[i].
 */
DecisionTable
resolve_priority(TableHeader const& hdr, RuleList const& rules,
                 std::vector<DecisionTable::EntryList> const& expanded,
                 CompileOptions const& opts);

#endif

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

#ifndef OPCOMP_DECISIONTABLE_HPP_
#define OPCOMP_DECISIONTABLE_HPP_

#include <set>
#include <string>
#include <vector>

#include "opcomp/types.hpp"
#include "opcomp/Rule.hpp"

struct BoundValue {
    // constant expression the handler gets specialized on
    std::string txt;

    // true if this came from a variable, false for a fixed generic argument
    bool from_var;
    char var_name;
    opcode_t raw;

    BoundValue() : from_var(false), var_name('\0'), raw(0) {
    }
};

typedef std::vector<BoundValue> BoundValueList;

struct DispatchEntry {
    opcode_t mask;
    opcode_t expected;
    std::string handler;
    BoundValueList bound;

    // index of the rule this entry was expanded from
    unsigned rule_idx;

    DispatchEntry() : mask(0), expected(0), rule_idx(0) {
    }

    bool matches(opcode_t opcode) const {
        return (opcode & mask) == expected;
    }

    // "handler<a, b>", or just "handler" if there are no bound values
    std::string call_txt() const;
};

enum diag_kind {
    DIAG_AMBIGUOUS_PATTERN,
    DIAG_UNREACHABLE_PATTERN
};

// a non-fatal problem found while the table was being built
struct Diagnostic {
    enum diag_kind kind;
    unsigned rule_idx;
    unsigned other_rule_idx;
    std::string msg;
};

/*
 * The compiled artifact: every dispatch entry of every rule in the order the
 * dispatcher must test them.  A DecisionTable can't be modified once it's
 * been built.
 */
class DecisionTable {
public:
    typedef std::vector<DispatchEntry> EntryList;
    typedef std::vector<Diagnostic> DiagList;

    DecisionTable(TableHeader const& hdr, unsigned n_rules,
                  EntryList const& entries, DiagList const& diags);

    TableHeader const& header() const {
        return hdr;
    }

    unsigned width() const {
        return hdr.width;
    }

    unsigned n_rules() const {
        return rule_count;
    }

    EntryList const& entries() const {
        return entry_list;
    }

    DiagList const& diagnostics() const {
        return diag_list;
    }

    // index of the first entry that matches opcode, or -1 if nothing does
    int find(opcode_t opcode) const;

    // number of entries that were expanded from the given rule
    unsigned n_rule_entries(unsigned rule_idx) const;

    std::set<std::string> handler_names() const;

private:
    TableHeader hdr;
    unsigned rule_count;
    EntryList entry_list;
    DiagList diag_list;
};

#endif

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

#include "opcomp/DecisionTable.hpp"

std::string DispatchEntry::call_txt() const {
    std::string txt(handler);

    if (bound.empty())
        return txt;

    txt += "<";
    for (BoundValueList::const_iterator it = bound.begin(); it != bound.end();
         it++) {
        if (it != bound.begin())
            txt += ", ";
        txt += it->txt;
    }
    txt += ">";

    return txt;
}

DecisionTable::DecisionTable(TableHeader const& hdr, unsigned n_rules,
                             EntryList const& entries, DiagList const& diags) :
    hdr(hdr), rule_count(n_rules), entry_list(entries), diag_list(diags) {
}

int DecisionTable::find(opcode_t opcode) const {
    for (EntryList::size_type idx = 0; idx < entry_list.size(); idx++) {
        if (entry_list[idx].matches(opcode))
            return int(idx);
    }

    return -1;
}

unsigned DecisionTable::n_rule_entries(unsigned rule_idx) const {
    unsigned count = 0;

    for (EntryList::const_iterator it = entry_list.begin();
         it != entry_list.end(); it++) {
        if (it->rule_idx == rule_idx)
            count++;
    }

    return count;
}

std::set<std::string> DecisionTable::handler_names() const {
    std::set<std::string> names;

    for (EntryList::const_iterator it = entry_list.begin();
         it != entry_list.end(); it++) {
        names.insert(it->handler);
    }

    return names;
}

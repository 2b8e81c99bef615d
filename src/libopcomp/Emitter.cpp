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


#include <set>
#include <cctype>
#include <iomanip>
#include <sstream>

#include "opcomp/BaseException.hpp"
#include "opcomp/log.h"

#include "opcomp/Emitter.hpp"

enum emit_style emit_style_from_name(std::string const& name) {
    if (name == "chain")
        return EMIT_STYLE_CHAIN;
    else if (name == "switch")
        return EMIT_STYLE_SWITCH;
    else if (name == "listing")
        return EMIT_STYLE_LISTING;

    BOOST_THROW_EXCEPTION(InvalidParamError("Unknown emitter style") <<
                          errinfo_param_name("emit style") <<
                          errinfo_token(name) <<
                          errinfo_advice("use chain, switch or listing"));
}

char const *emit_style_name(enum emit_style style) {
    switch (style) {
    case EMIT_STYLE_CHAIN:
        return "chain";
    case EMIT_STYLE_SWITCH:
        return "switch";
    case EMIT_STYLE_LISTING:
        return "listing";
    }

    BOOST_THROW_EXCEPTION(IntegrityError("Unknown emitter style"));
}

std::string DispatchEmitter::emit_txt(DecisionTable const& tbl) const {
    std::stringstream ss;
    emit(tbl, &ss);
    return ss.str();
}

std::string SourceEmitter::hex_literal(opcode_t val, unsigned width) {
    std::stringstream ss;

    ss << "0x" << std::hex << std::setfill('0') << std::setw(width / 4) <<
        val;
    if (width == 64)
        ss << "ull";

    return ss.str();
}

std::string SourceEmitter::include_guard(TableHeader const& hdr) {
    std::string guard("OPCOMP_GEN_");

    for (std::string::const_iterator it = hdr.dispatcher_name.begin();
         it != hdr.dispatcher_name.end(); it++) {
        if (isalnum((unsigned char)*it))
            guard += char(toupper((unsigned char)*it));
        else
            guard += '_';
    }

    return guard + "_HPP_";
}

static void check_header(TableHeader const& hdr) {
    if (!opcomp_valid_width(hdr.width)) {
        BOOST_THROW_EXCEPTION(InvalidParamError("Unsupported opcode width") <<
                              errinfo_width(hdr.width));
    }

    if (hdr.opcode_type.empty()) {
        BOOST_THROW_EXCEPTION(InvalidParamError("No opcode type") <<
                              errinfo_param_name("opcode"));
    }

    if (hdr.dispatcher_name.empty()) {
        BOOST_THROW_EXCEPTION(InvalidParamError("No dispatcher name") <<
                              errinfo_param_name("dispatcher"));
    }

    if (hdr.context_type.empty()) {
        BOOST_THROW_EXCEPTION(InvalidParamError("No context type") <<
                              errinfo_param_name("context"));
    }
}

void SourceEmitter::emit(DecisionTable const& tbl, std::ostream *out) const {
    TableHeader const& hdr = tbl.header();
    std::string guard(include_guard(hdr));

    check_header(hdr);

    (*out) << "/*\n" <<
        " * generated by opcomp (" << emit_style_name(style()) <<
        " style), do not edit.\n" <<
        " * " << tbl.entries().size() << " dispatch entries from " <<
        tbl.n_rules() << " rules.\n" <<
        " */\n\n" <<
        "#ifndef " << guard << "\n" <<
        "#define " << guard << "\n\n" <<
        "#include <stdint.h>\n\n" <<
        "#include \"opcomp/runtime.hpp\"\n\n" <<
        "inline void " << hdr.dispatcher_name << "(" << hdr.context_type <<
        " *ctx, " << hdr.opcode_type << " opcode) {\n";

    emit_body(tbl, out);

    if (hdr.fallback.size())
        (*out) << "    " << hdr.fallback << "(ctx, opcode);\n";
    else
        (*out) << "    opcomp_unmatched_opcode(opcode);\n";

    (*out) << "}\n\n" <<
        "#endif\n";

    LOG_DBG("emitted %s with %u entries in %s style\n",
            hdr.dispatcher_name.c_str(), unsigned(tbl.entries().size()),
            emit_style_name(style()));
}

void SourceEmitter::emit_call(DispatchEntry const& ent, char const *indent,
                              std::ostream *out) {
    (*out) << indent << ent.call_txt() << "(ctx, opcode);\n" <<
        indent << "return;\n";
}

void SourceEmitter::emit_guarded(DispatchEntry const& ent, unsigned width,
                                 std::ostream *out) {
    (*out) << "    if ((opcode & " << hex_literal(ent.mask, width) <<
        ") == " << hex_literal(ent.expected, width) << ") {\n";
    emit_call(ent, "        ", out);
    (*out) << "    }\n";
}

void ChainEmitter::emit_body(DecisionTable const& tbl,
                             std::ostream *out) const {
    DecisionTable::EntryList const& ents = tbl.entries();

    for (DecisionTable::EntryList::const_iterator it = ents.begin();
         it != ents.end(); it++) {
        emit_guarded(*it, tbl.width(), out);
    }
}

void SwitchEmitter::emit_body(DecisionTable const& tbl,
                              std::ostream *out) const {
    DecisionTable::EntryList const& ents = tbl.entries();
    opcode_t full_mask = opcomp_low_mask(tbl.width());
    size_t idx = 0;

    while (idx < ents.size()) {
        size_t run_end = idx;
        while (run_end < ents.size() && ents[run_end].mask == full_mask)
            run_end++;

        // a lone exact match doesn't need a switch
        if (run_end - idx < 2) {
            emit_guarded(ents[idx], tbl.width(), out);
            idx++;
            continue;
        }

        std::set<opcode_t> cases;
        (*out) << "    switch (opcode) {\n";
        for (; idx < run_end; idx++) {
            DispatchEntry const& ent = ents[idx];

            if (!cases.insert(ent.expected).second) {
                LOG_DBG("dropping duplicate case %s for %s\n",
                        hex_literal(ent.expected, tbl.width()).c_str(),
                        ent.call_txt().c_str());
                continue;
            }

            (*out) << "    case " << hex_literal(ent.expected, tbl.width()) <<
                ":\n";
            emit_call(ent, "        ", out);
        }
        (*out) << "    }\n";
    }
}

void ListingEmitter::emit(DecisionTable const& tbl, std::ostream *out) const {
    TableHeader const& hdr = tbl.header();
    DecisionTable::EntryList const& ents = tbl.entries();
    DecisionTable::DiagList const& diags = tbl.diagnostics();
    unsigned width = hdr.width;

    (*out) << "dispatcher " << hdr.dispatcher_name << "(" <<
        hdr.context_type << " *ctx, " << hdr.opcode_type << " opcode)\n" <<
        std::dec << ents.size() << " entries from " << tbl.n_rules() <<
        " rules\n\n";

    for (DecisionTable::EntryList::size_type idx = 0; idx < ents.size();
         idx++) {
        DispatchEntry const& ent = ents[idx];
        (*out) << std::dec << std::setfill(' ') << std::setw(6) << idx <<
            "  rule " << std::setw(4) << ent.rule_idx << "  mask " <<
            SourceEmitter::hex_literal(ent.mask, width) << "  expected " <<
            SourceEmitter::hex_literal(ent.expected, width) << "  " <<
            ent.call_txt() << "\n";
    }

    (*out) << "\nno match: " <<
        (hdr.fallback.size() ? hdr.fallback : "opcomp_unmatched_opcode") <<
        "\n";

    for (DecisionTable::DiagList::const_iterator it = diags.begin();
         it != diags.end(); it++) {
        (*out) << "warning: " << it->msg << "\n";
    }
}

EmitterPtr make_emitter(enum emit_style style) {
    switch (style) {
    case EMIT_STYLE_CHAIN:
        return EmitterPtr(new ChainEmitter());
    case EMIT_STYLE_SWITCH:
        return EmitterPtr(new SwitchEmitter());
    case EMIT_STYLE_LISTING:
        return EmitterPtr(new ListingEmitter());
    }

    BOOST_THROW_EXCEPTION(InvalidParamError("Unknown emitter style"));
}

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


#ifndef OPCOMP_EMITTER_HPP_
#define OPCOMP_EMITTER_HPP_

#include <string>
#include <ostream>

#include <boost/shared_ptr.hpp>

#include "opcomp/types.hpp"
#include "opcomp/DecisionTable.hpp"

enum emit_style {
    // one guarded if statement per dispatch entry
    EMIT_STYLE_CHAIN,

    // runs of exact-match entries are grouped into a switch statement
    EMIT_STYLE_SWITCH,

    // human-readable dump of the decision table, not compilable
    EMIT_STYLE_LISTING
};

/*
 * throws InvalidParamError if name isn't one of "chain", "switch" or
 * "listing"
 */
enum emit_style emit_style_from_name(std::string const& name);
char const *emit_style_name(enum emit_style style);

/*
 * turns a DecisionTable into text.  Emitters don't make any decisions of
 * their own; entries are always written out in table order.
 */
class DispatchEmitter {
public:
    virtual ~DispatchEmitter() {
    }

    virtual enum emit_style style() const = 0;

    virtual void emit(DecisionTable const& tbl, std::ostream *out) const = 0;

    std::string emit_txt(DecisionTable const& tbl) const;
};

typedef boost::shared_ptr<DispatchEmitter> EmitterPtr;

/*
 * Emitter for C++ source.  The output is a header holding a single inline
 * function:
 *
 *     inline void <dispatcher>(<context> *ctx, <opcode type> opcode);
 *
 * The program that includes it must declare the context type and every
 * handler template beforehand.
 */
class SourceEmitter : public DispatchEmitter {
public:
    virtual void emit(DecisionTable const& tbl, std::ostream *out) const;

    // "0x0f", padded to the opcode width; 64-bit values get a ull suffix
    static std::string hex_literal(opcode_t val, unsigned width);

    static std::string include_guard(TableHeader const& hdr);

protected:
    virtual void emit_body(DecisionTable const& tbl,
                           std::ostream *out) const = 0;

    // writes the handler call and the return that follows it
    static void emit_call(DispatchEntry const& ent, char const *indent,
                          std::ostream *out);
    static void emit_guarded(DispatchEntry const& ent, unsigned width,
                             std::ostream *out);
};

class ChainEmitter : public SourceEmitter {
public:
    virtual enum emit_style style() const {
        return EMIT_STYLE_CHAIN;
    }

protected:
    virtual void emit_body(DecisionTable const& tbl, std::ostream *out) const;
};

/*
 * Consecutive entries which test every bit of the opcode go into one switch
 * statement.  A later case for an opcode that already has one in the same
 * switch could never be reached so it's left out.  Everything else is
 * emitted the same way ChainEmitter does it.
 */
class SwitchEmitter : public SourceEmitter {
public:
    virtual enum emit_style style() const {
        return EMIT_STYLE_SWITCH;
    }

protected:
    virtual void emit_body(DecisionTable const& tbl, std::ostream *out) const;
};

class ListingEmitter : public DispatchEmitter {
public:
    virtual enum emit_style style() const {
        return EMIT_STYLE_LISTING;
    }

    virtual void emit(DecisionTable const& tbl, std::ostream *out) const;
};

EmitterPtr make_emitter(enum emit_style style);

#endif

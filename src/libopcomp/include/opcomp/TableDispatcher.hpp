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


#ifndef OPCOMP_TABLEDISPATCHER_HPP_
#define OPCOMP_TABLEDISPATCHER_HPP_

#include <map>
#include <set>
#include <string>

#include "opcomp/types.hpp"
#include "opcomp/BaseException.hpp"
#include "opcomp/DecisionTable.hpp"

/*
 * Evaluates a DecisionTable directly instead of generating code for it.
 * Handlers aren't specialized on their bound values; they get them at
 * runtime instead, in the same order the rule lists its generic arguments.
 *
 * dispatch doesn't modify anything, so one TableDispatcher can be shared
 * between threads once all of its handlers have been bound.
 */
template<class Ctx>
class TableDispatcher {
public:
    typedef void(*handler_func_t)(Ctx *ctx, opcode_t opcode,
                                  BoundValueList const& bound);
    typedef void(*fallback_func_t)(Ctx *ctx, opcode_t opcode);
    typedef std::map<std::string, handler_func_t> HandlerMap;

    TableDispatcher(DecisionTable const& tbl) : tbl(tbl), fallback(NULL) {
    }

    DecisionTable const& table() const {
        return tbl;
    }

    void bind_handler(std::string const& name, handler_func_t func) {
        handlers[name] = func;
    }

    void set_fallback(fallback_func_t func) {
        fallback = func;
    }

    /*
     * throws UnknownHandlerError if any handler in the table (including the
     * fallback) doesn't have a function bound to it.
     */
    void check_bindings() const {
        std::set<std::string> names = tbl.handler_names();

        for (std::set<std::string>::const_iterator it = names.begin();
             it != names.end(); it++) {
            if (!handlers.count(*it)) {
                BOOST_THROW_EXCEPTION(UnknownHandlerError() <<
                                      errinfo_handler_name(*it));
            }
        }

        if (tbl.header().fallback.size() && !fallback) {
            BOOST_THROW_EXCEPTION(UnknownHandlerError() <<
                                  errinfo_handler_name(tbl.header().fallback));
        }
    }

    void dispatch(Ctx *ctx, opcode_t opcode) const {
        int idx = tbl.find(opcode);

        if (idx < 0) {
            if (fallback) {
                fallback(ctx, opcode);
                return;
            }

            BOOST_THROW_EXCEPTION(UnmatchedOpcodeError() <<
                                  errinfo_opcode_val(opcode));
        }

        DispatchEntry const& ent = tbl.entries()[idx];
        typename HandlerMap::const_iterator handler = handlers.find(ent.handler);
        if (handler == handlers.end()) {
            BOOST_THROW_EXCEPTION(UnknownHandlerError() <<
                                  errinfo_handler_name(ent.handler) <<
                                  errinfo_opcode_val(opcode));
        }

        handler->second(ctx, opcode, ent.bound);
    }

private:
    DecisionTable tbl;
    HandlerMap handlers;
    fallback_func_t fallback;
};

#endif

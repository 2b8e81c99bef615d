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


#ifndef OPCOMP_RUNTIME_HPP_
#define OPCOMP_RUNTIME_HPP_

/*
 * support code for the dispatchers that opcomp generates.  This header is
 * included by every generated dispatcher and doesn't need the opcomp library
 * to be linked in.
 */

#include "opcomp/types.hpp"
#include "opcomp/BaseException.hpp"

/*
 * called by a generated dispatcher when none of its entries matched and the
 * rule table doesn't name a fallback handler.
 */
static inline void opcomp_unmatched_opcode(opcode_t opcode) {
    BOOST_THROW_EXCEPTION(UnmatchedOpcodeError() <<
                          errinfo_opcode_val(opcode));
}

#endif

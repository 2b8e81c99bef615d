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


#ifndef OPCOMP_RULEPARSER_HPP_
#define OPCOMP_RULEPARSER_HPP_

#include <string>
#include <vector>

#include <boost/tokenizer.hpp>

#include "opcomp/types.hpp"
#include "opcomp/Rule.hpp"

enum token_tp {
    TOK_IDENT,

    // anything that starts with a digit, eg 42, 0b0110 or 0x1f
    TOK_NUMBER,

    // a double-quoted pattern string.  txt doesn't include the quotes.
    TOK_STRING,

    // => and :: are one token, everything else is a single character
    TOK_PUNCT
};

struct Token {
    enum token_tp tp;
    std::string txt;
    unsigned line_no;

    // whitespace came right before this token on its line
    bool spaced;

    Token() : tp(TOK_PUNCT), line_no(0), spaced(false) {
    }

    Token(enum token_tp tp, std::string const& txt, unsigned line_no) :
        tp(tp), txt(txt), line_no(line_no), spaced(false) {
    }

    bool is(char const *punct) const {
        return tp == TOK_PUNCT && txt == punct;
    }
};

typedef std::vector<Token> TokList;

/*
 * Parser for the rule table language.  A rule table is a handful of header
 * statements followed by the rules:
 *
 *     opcode = uint16_t;
 *     dispatcher = decode;
 *     context = Cpu;
 *     fallback = illegal_inst;    // optional
 *
 *     "0101'____'____'____" => nop;
 *     "0110'nnnn'mmmm'0011" => mov<{n}, {m}>;
 *     "0000'00ss'____'____" => shift<Shift::{s}, 2> where {
 *         s: Shift = { 0b00 => LEFT, 0b01 => RIGHT, 0b10 => ROT, 0b11 => ROTC }
 *     };
 *
 * comments start with // or # and run to the end of the line.
 *
 * The parser only checks syntax.  Patterns and where clauses are checked
 * when the table is compiled.
 */
class RuleParser {
public:
    typedef boost::char_separator<char> LineSeparator;
    typedef boost::tokenizer<LineSeparator> LineTokenizer;

    // throws ParseError, with errinfo_line_no set wherever possible
    static RuleTable parse(std::string const& txt);

    // strip comments off of a line
    static std::string preprocess_line(std::string const& line);

    static TokList tokenize_line(std::string const& line, unsigned line_no);

    // splits txt into lines and tokenizes them
    static TokList tokenize(std::string const& txt);

    /*
     * parse a literal table key: 0b-prefixed binary, 0x-prefixed hex or bare
     * binary digits.
     */
    static opcode_t parse_key(std::string const& txt);

    /*
     * join tokens back into C++ source text, with spaces between them except
     * where C++ wouldn't usually put one (around ::, before commas, etc).
     */
    static std::string join_tokens(TokList::const_iterator first,
                                   TokList::const_iterator last);

    // join tokens with spaces only where the source had them
    static std::string join_verbatim(TokList::const_iterator first,
                                     TokList::const_iterator last);

private:
    TokList toks;
    size_t pos;
    RuleTable tbl;

    RuleParser(TokList const& toks);

    void parse_table();
    void parse_header_stmt(std::vector<std::string> *seen);
    void parse_rule();
    GenericArg parse_generic_arg();
    VarDecl parse_decl();
    void parse_literal_table(VarDecl *decl);
    void parse_func_mapping(VarDecl *decl);

    /*
     * collect tokens up to (not including) the first of the terminators that
     * isn't nested inside (), [] or {}, or <> when nest_angle is set.  Inside
     * (), [] or {} a < or > is an operator, not a bracket.
     */
    TokList collect_until(char const * const *terminators, bool nest_angle);

    bool at_end() const;
    Token const& peek() const;
    Token const& next();
    Token const& expect(char const *punct);
    Token const& expect_tp(enum token_tp tp, char const *what);
    unsigned cur_line() const;
};

#endif

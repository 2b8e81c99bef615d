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


#include <cctype>
#include <algorithm>

#include "opcomp/BaseException.hpp"
#include "opcomp/log.h"

#include "opcomp/RuleParser.hpp"

static bool is_var_name(std::string const& txt) {
    return txt.size() == 1 && txt[0] >= 'a' && txt[0] <= 'z';
}

std::string RuleParser::preprocess_line(std::string const& line) {
    bool in_string = false;

    for (std::string::size_type idx = 0; idx < line.size(); idx++) {
        char ch = line[idx];

        if (ch == '"') {
            in_string = !in_string;
        } else if (!in_string) {
            if (ch == '#')
                return line.substr(0, idx);
            if (ch == '/' && idx + 1 < line.size() && line[idx + 1] == '/')
                return line.substr(0, idx);
        }
    }

    return line;
}

TokList RuleParser::tokenize_line(std::string const& line, unsigned line_no) {
    TokList tok_list;
    std::string::size_type idx = 0;
    bool spaced = false;

    while (idx < line.size()) {
        unsigned char cur_char = line[idx];
        std::string::size_type end = idx + 1;

        if (isspace(cur_char)) {
            spaced = true;
            idx++;
            continue;
        }

        if (cur_char == '"') {
            end = line.find('"', idx + 1);
            if (end == std::string::npos) {
                BOOST_THROW_EXCEPTION(ParseError("Unterminated pattern "
                                                 "string") <<
                                      errinfo_line_no(line_no) <<
                                      errinfo_token(line.substr(idx)));
            }
            tok_list.push_back(Token(TOK_STRING,
                                     line.substr(idx + 1, end - idx - 1),
                                     line_no));
            tok_list.back().spaced = spaced;
            spaced = false;
            idx = end + 1;
            continue;
        }

        if (isalpha(cur_char) || cur_char == '_' || isdigit(cur_char)) {
            while (end < line.size() &&
                   (isalnum((unsigned char)line[end]) || line[end] == '_'))
                end++;
            tok_list.push_back(Token(isdigit(cur_char) ? TOK_NUMBER : TOK_IDENT,
                                     line.substr(idx, end - idx), line_no));
        } else if (line.compare(idx, 2, "=>") == 0 ||
                   line.compare(idx, 2, "::") == 0) {
            end = idx + 2;
            tok_list.push_back(Token(TOK_PUNCT, line.substr(idx, 2), line_no));
        } else {
            tok_list.push_back(Token(TOK_PUNCT, std::string(1, char(cur_char)),
                                     line_no));
        }

        tok_list.back().spaced = spaced;
        spaced = false;
        idx = end;
    }

    return tok_list;
}

TokList RuleParser::tokenize(std::string const& txt) {
    TokList all;
    unsigned line_no = 1;

    // empty lines are kept so that line numbers stay accurate
    LineTokenizer lines(txt, LineSeparator("\n", "", boost::keep_empty_tokens));

    for (LineTokenizer::iterator it = lines.begin(); it != lines.end();
         it++, line_no++) {
        TokList line_toks = tokenize_line(preprocess_line(*it), line_no);
        all.insert(all.end(), line_toks.begin(), line_toks.end());
    }

    return all;
}

opcode_t RuleParser::parse_key(std::string const& txt) {
    unsigned base = 2;
    std::string::size_type idx = 0;
    opcode_t val = 0;

    if (txt.size() > 2 && txt[0] == '0' && (txt[1] == 'b' || txt[1] == 'B')) {
        idx = 2;
    } else if (txt.size() > 2 && txt[0] == '0' &&
               (txt[1] == 'x' || txt[1] == 'X')) {
        base = 16;
        idx = 2;
    }

    if (idx >= txt.size()) {
        BOOST_THROW_EXCEPTION(ParseError("Literal table key has no digits") <<
                              errinfo_token(txt));
    }

    for (; idx < txt.size(); idx++) {
        char ch = char(tolower((unsigned char)txt[idx]));
        unsigned digit;

        if (ch >= '0' && ch <= '9')
            digit = ch - '0';
        else if (ch >= 'a' && ch <= 'f')
            digit = ch - 'a' + 10;
        else
            digit = base;

        if (digit >= base) {
            BOOST_THROW_EXCEPTION(ParseError("Literal table keys must be "
                                             "binary or hexadecimal") <<
                                  errinfo_token(txt) <<
                                  errinfo_advice("write keys as 0b0110, "
                                                 "0x6 or 0110"));
        }

        if (val > (~opcode_t(0) - digit) / base) {
            BOOST_THROW_EXCEPTION(ParseError("Literal table key is too "
                                             "large") <<
                                  errinfo_token(txt));
        }

        val = val * base + digit;
    }

    return val;
}

std::string RuleParser::join_tokens(TokList::const_iterator first,
                                    TokList::const_iterator last) {
    std::string txt;
    TokList::const_iterator prev = last;
    bool unary = false;

    for (TokList::const_iterator it = first; it != last; prev = it++) {
        if (prev != last) {
            bool space = true;

            if (unary || prev->is("::") || it->is("::") || prev->is("(") ||
                prev->is("[") || prev->is("<") || it->is(",") ||
                it->is(")") || it->is("]") || it->is(">") || it->is(";"))
                space = false;
            else if (prev->tp == TOK_IDENT && (it->is("(") || it->is("[") ||
                                               it->is("<")))
                space = false;

            if (space)
                txt += ' ';
        }

        // a sign or negation at the start or after an operator sticks to its operand
        unary = (it->is("-") || it->is("~") || it->is("!")) &&
            (prev == last || (prev->tp == TOK_PUNCT && !prev->is(")") &&
                              !prev->is("]")));

        txt += it->txt;
    }

    return txt;
}

std::string RuleParser::join_verbatim(TokList::const_iterator first,
                                      TokList::const_iterator last) {
    std::string txt;

    for (TokList::const_iterator it = first; it != last; it++) {
        if (it != first && it->spaced)
            txt += ' ';
        txt += it->txt;
    }

    return txt;
}

RuleParser::RuleParser(TokList const& toks) : toks(toks), pos(0) {
}

RuleTable RuleParser::parse(std::string const& txt) {
    RuleParser parser(tokenize(txt));
    parser.parse_table();
    return parser.tbl;
}

void RuleParser::parse_table() {
    static char const * const required[] = {
        "opcode", "dispatcher", "context", NULL
    };
    std::vector<std::string> seen;

    while (!at_end() && peek().tp == TOK_IDENT)
        parse_header_stmt(&seen);

    for (char const * const *key = required; *key; key++) {
        if (std::find(seen.begin(), seen.end(), *key) == seen.end()) {
            BOOST_THROW_EXCEPTION(ParseError("Rule table is missing a "
                                             "header statement") <<
                                  errinfo_param_name(*key) <<
                                  errinfo_line_no(cur_line()));
        }
    }

    while (!at_end()) {
        Token const& tok = peek();

        if (tok.tp == TOK_IDENT && pos + 1 < toks.size() &&
            toks[pos + 1].is("=")) {
            BOOST_THROW_EXCEPTION(ParseError("Header statements must come "
                                             "before the first rule") <<
                                  errinfo_token(tok.txt) <<
                                  errinfo_line_no(tok.line_no));
        }

        if (tok.tp != TOK_STRING) {
            BOOST_THROW_EXCEPTION(ParseError("Unexpected token") <<
                                  errinfo_token(tok.txt) <<
                                  errinfo_line_no(tok.line_no) <<
                                  errinfo_advice("expected a pattern string"));
        }

        parse_rule();
    }

    LOG_DBG("parsed %u rules for %s\n", unsigned(tbl.rules.size()),
            tbl.hdr.dispatcher_name.c_str());
}

void RuleParser::parse_header_stmt(std::vector<std::string> *seen) {
    static char const * const terms[] = { ";", NULL };
    Token const key = next();

    expect("=");
    TokList val = collect_until(terms, false);
    expect(";");

    if (val.empty()) {
        BOOST_THROW_EXCEPTION(ParseError("Header statement has no value") <<
                              errinfo_token(key.txt) <<
                              errinfo_line_no(key.line_no));
    }

    if (std::find(seen->begin(), seen->end(), key.txt) != seen->end()) {
        BOOST_THROW_EXCEPTION(ParseError("Header statement appears more than "
                                         "once") <<
                              errinfo_token(key.txt) <<
                              errinfo_line_no(key.line_no));
    }
    seen->push_back(key.txt);

    std::string txt = join_tokens(val.begin(), val.end());

    if (key.txt == "opcode") {
        try {
            tbl.set_opcode_type(txt);
        } catch (InvalidParamError& err) {
            err << errinfo_line_no(key.line_no);
            throw;
        }
    } else if (key.txt == "dispatcher") {
        if (val.size() != 1 || val[0].tp != TOK_IDENT) {
            BOOST_THROW_EXCEPTION(ParseError("Dispatcher name must be an "
                                             "identifier") <<
                                  errinfo_token(txt) <<
                                  errinfo_line_no(key.line_no));
        }
        tbl.hdr.dispatcher_name = txt;
    } else if (key.txt == "context") {
        tbl.hdr.context_type = txt;
    } else if (key.txt == "fallback") {
        tbl.hdr.fallback = txt;
    } else {
        BOOST_THROW_EXCEPTION(ParseError("Unknown header statement") <<
                              errinfo_token(key.txt) <<
                              errinfo_line_no(key.line_no) <<
                              errinfo_advice("expected opcode, dispatcher, "
                                             "context or fallback"));
    }
}

void RuleParser::parse_rule() {
    Token const& ptrn = next();
    Rule rule(ptrn.txt, "");

    rule.line_no = ptrn.line_no;

    expect("=>");
    rule.handler = expect_tp(TOK_IDENT, "handler name").txt;
    while (peek().is("::")) {
        next();
        rule.handler += "::" + expect_tp(TOK_IDENT, "handler name").txt;
    }

    if (peek().is("<")) {
        next();
        for (;;) {
            rule.generics.push_back(parse_generic_arg());
            if (!peek().is(","))
                break;
            next();
        }
        expect(">");
    }

    if (peek().tp == TOK_IDENT && peek().txt == "where") {
        next();
        expect("{");
        while (!peek().is("}")) {
            rule.declare(parse_decl());
            if (!peek().is(","))
                break;
            next();
        }
        expect("}");
    }

    expect(";");

    tbl.rules.push_back(rule);
}

GenericArg RuleParser::parse_generic_arg() {
    static char const * const terms[] = { ",", ">", NULL };
    unsigned line_no = cur_line();
    TokList arg = collect_until(terms, true);
    size_t n_toks = arg.size();

    if (arg.empty()) {
        BOOST_THROW_EXCEPTION(ParseError("Empty generic argument") <<
                              errinfo_line_no(line_no));
    }

    // {v} or Prefix::{v}
    if (n_toks >= 3 && arg[n_toks - 3].is("{") &&
        arg[n_toks - 2].tp == TOK_IDENT && is_var_name(arg[n_toks - 2].txt) &&
        arg[n_toks - 1].is("}")) {
        char var_name = arg[n_toks - 2].txt[0];

        if (n_toks == 3)
            return GenericArg::var(var_name);

        if (n_toks >= 5 && arg[n_toks - 4].is("::")) {
            bool qualified_name = (n_toks - 4) % 2 == 1;
            for (size_t idx = 0; idx < n_toks - 4; idx++) {
                if ((idx % 2 == 0 && arg[idx].tp != TOK_IDENT) ||
                    (idx % 2 == 1 && !arg[idx].is("::")))
                    qualified_name = false;
            }

            if (!qualified_name) {
                BOOST_THROW_EXCEPTION(ParseError("Variable reference has a "
                                                 "malformed prefix") <<
                                      errinfo_token(join_tokens(arg.begin(),
                                                                arg.end())) <<
                                      errinfo_line_no(line_no));
            }

            return GenericArg::var(var_name,
                                   join_tokens(arg.begin(),
                                               arg.begin() + (n_toks - 4)));
        }
    }

    // a braced constant expression becomes a parenthesized one
    if (n_toks >= 2 && arg[0].is("{") && arg[n_toks - 1].is("}")) {
        unsigned depth = 0;
        size_t close_idx = 0;
        for (size_t idx = 0; idx < n_toks; idx++) {
            if (arg[idx].is("{")) {
                depth++;
            } else if (arg[idx].is("}") && !--depth) {
                close_idx = idx;
                break;
            }
        }

        if (close_idx == n_toks - 1) {
            if (n_toks == 2) {
                BOOST_THROW_EXCEPTION(ParseError("Empty constant expression") <<
                                      errinfo_line_no(line_no));
            }
            return GenericArg::fixed("(" + join_verbatim(arg.begin() + 1,
                                                         arg.end() - 1) + ")");
        }
    }

    return GenericArg::fixed(join_tokens(arg.begin(), arg.end()));
}

VarDecl RuleParser::parse_decl() {
    static char const * const terms[] = { "=", ",", "}", NULL };
    Token const& name = expect_tp(TOK_IDENT, "variable name");
    VarDecl decl;

    if (!is_var_name(name.txt)) {
        BOOST_THROW_EXCEPTION(ParseError("Variables are named by a single "
                                         "lowercase letter") <<
                              errinfo_token(name.txt) <<
                              errinfo_line_no(name.line_no));
    }

    decl.name = name.txt[0];
    decl.mapping = VAR_MAPPING_NONE;

    if (peek().is(":")) {
        next();
        unsigned line_no = cur_line();
        TokList tp = collect_until(terms, true);
        if (tp.empty()) {
            BOOST_THROW_EXCEPTION(ParseError("Variable declaration is "
                                             "missing its type") <<
                                  errinfo_var_name(decl.name) <<
                                  errinfo_line_no(line_no));
        }
        decl.type_name = join_tokens(tp.begin(), tp.end());
    }

    if (peek().is("=")) {
        next();
        if (peek().is("{"))
            parse_literal_table(&decl);
        else
            parse_func_mapping(&decl);
    }

    return decl;
}

void RuleParser::parse_literal_table(VarDecl *decl) {
    static char const * const terms[] = { ",", "}", NULL };
    unsigned line_no = expect("{").line_no;

    decl->mapping = VAR_MAPPING_TABLE;

    while (!peek().is("}")) {
        Token const key = expect_tp(TOK_NUMBER, "literal table key");
        expect("=>");
        TokList val = collect_until(terms, true);

        if (val.empty()) {
            BOOST_THROW_EXCEPTION(ParseError("Literal table entry has no "
                                             "value") <<
                                  errinfo_token(key.txt) <<
                                  errinfo_line_no(key.line_no));
        }

        LiteralEntry ent;
        try {
            ent.raw = parse_key(key.txt);
        } catch (ParseError& err) {
            err << errinfo_line_no(key.line_no) << errinfo_var_name(decl->name);
            throw;
        }
        ent.value = join_tokens(val.begin(), val.end());
        decl->table.push_back(ent);

        if (!peek().is(","))
            break;
        next();
    }
    expect("}");

    if (decl->table.empty()) {
        BOOST_THROW_EXCEPTION(ParseError("Empty literal table") <<
                              errinfo_var_name(decl->name) <<
                              errinfo_line_no(line_no));
    }
}

void RuleParser::parse_func_mapping(VarDecl *decl) {
    std::string func_name = expect_tp(TOK_IDENT, "mapping function").txt;

    while (peek().is("::")) {
        next();
        func_name += "::" + expect_tp(TOK_IDENT, "mapping function").txt;
    }

    // fn(v) means the same thing as fn
    if (peek().is("(")) {
        next();
        Token const& arg = expect_tp(TOK_IDENT, "variable name");
        if (arg.txt != std::string(1, decl->name)) {
            BOOST_THROW_EXCEPTION(ParseError("Mapping function must be "
                                             "applied to the variable being "
                                             "declared") <<
                                  errinfo_var_name(decl->name) <<
                                  errinfo_token(arg.txt) <<
                                  errinfo_line_no(arg.line_no));
        }
        expect(")");
    }

    decl->mapping = VAR_MAPPING_FUNC;
    decl->func_name = func_name;
}

TokList RuleParser::collect_until(char const * const *terminators,
                                  bool nest_angle) {
    TokList collected;
    std::vector<char> open;

    // number of (, [ and { on the stack
    unsigned n_round = 0;

    while (!at_end()) {
        Token const& tok = toks[pos];

        if (open.empty()) {
            for (char const * const *term = terminators; *term; term++)
                if (tok.is(*term))
                    return collected;
        }

        if (tok.is("(") || tok.is("[") || tok.is("{")) {
            open.push_back(tok.txt[0]);
            n_round++;
        } else if (tok.is("<")) {
            if (nest_angle && !n_round)
                open.push_back('<');
        } else if (tok.is(">")) {
            if (!open.empty() && open.back() == '<')
                open.pop_back();
        } else if (tok.is(")") || tok.is("]") || tok.is("}")) {
            char opener = tok.is(")") ? '(' : (tok.is("]") ? '[' : '{');

            // any < still open in here was a less-than
            while (!open.empty() && open.back() == '<')
                open.pop_back();
            if (!open.empty() && open.back() == opener) {
                open.pop_back();
                n_round--;
            }
        }

        collected.push_back(tok);
        pos++;
    }

    return collected;
}

bool RuleParser::at_end() const {
    return pos >= toks.size();
}

Token const& RuleParser::peek() const {
    if (at_end()) {
        BOOST_THROW_EXCEPTION(ParseError("Unexpected end of rule table") <<
                              errinfo_line_no(cur_line()));
    }

    return toks[pos];
}

Token const& RuleParser::next() {
    Token const& tok = peek();
    pos++;
    return tok;
}

Token const& RuleParser::expect(char const *punct) {
    Token const& tok = peek();

    if (!tok.is(punct)) {
        BOOST_THROW_EXCEPTION(ParseError("Unexpected token") <<
                              errinfo_token(tok.txt) <<
                              errinfo_line_no(tok.line_no) <<
                              errinfo_advice(std::string("expected ") + punct));
    }

    pos++;
    return tok;
}

Token const& RuleParser::expect_tp(enum token_tp tp, char const *what) {
    Token const& tok = peek();

    if (tok.tp != tp) {
        BOOST_THROW_EXCEPTION(ParseError("Unexpected token") <<
                              errinfo_token(tok.txt) <<
                              errinfo_line_no(tok.line_no) <<
                              errinfo_advice(std::string("expected ") + what));
    }

    pos++;
    return tok;
}

unsigned RuleParser::cur_line() const {
    if (pos < toks.size())
        return toks[pos].line_no;
    if (toks.empty())
        return 0;
    return toks.back().line_no;
}

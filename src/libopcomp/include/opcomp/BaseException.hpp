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

#ifndef OPCOMP_BASEEXCEPTION_HPP_
#define OPCOMP_BASEEXCEPTION_HPP_

#include <string>
#include <sstream>
#include <exception>

#include <boost/exception/all.hpp>
#include <boost/cstdint.hpp>

#include "opcomp/types.hpp"

typedef boost::error_info<struct tag_param_name_error_info, std::string>
errinfo_param_name;


/*
 * errinfo_advice - for when the program already
 * knows what you need to do to fix something.
 */
typedef boost::error_info<struct tag_advice_error_info, std::string>
errinfo_advice;

typedef boost::error_info<struct tag_length_error_info, size_t> errinfo_length;
typedef boost::error_info<struct tag_length_expect_error_info, size_t>
errinfo_length_expect;

typedef boost::error_info<struct tag_path_error_info, std::string> errinfo_path;

// the pattern string of the rule that caused the error, as written
typedef boost::error_info<struct tag_pattern_error_info, std::string>
errinfo_pattern;

// position of the offending rule in the rule table (0 is the first rule)
typedef boost::error_info<struct tag_rule_idx_error_info, unsigned>
errinfo_rule_idx;

// position of the rule that shadows or collides with errinfo_rule_idx
typedef boost::error_info<struct tag_other_rule_idx_error_info, unsigned>
errinfo_other_rule_idx;

// source line of the rule table text, starting from 1
typedef boost::error_info<struct tag_line_no_error_info, unsigned>
errinfo_line_no;

typedef boost::error_info<struct tag_char_error_info, char> errinfo_char;

typedef boost::error_info<struct tag_token_error_info, std::string>
errinfo_token;

typedef boost::error_info<struct tag_var_name_error_info, char>
errinfo_var_name;

typedef boost::error_info<struct tag_type_name_error_info, std::string>
errinfo_type_name;

typedef boost::error_info<struct tag_handler_name_error_info, std::string>
errinfo_handler_name;

// raw (unmapped) value of a variable's bits
typedef boost::error_info<struct tag_raw_val_error_info, opcode_t>
errinfo_raw_val;

typedef boost::error_info<struct tag_width_error_info, unsigned>
errinfo_width;

typedef boost::error_info<struct tag_n_bits_error_info, unsigned>
errinfo_n_bits;

typedef boost::error_info<struct tag_opcode_val_error_info, opcode_t>
errinfo_opcode_val;

// opcodes read better in hex
inline std::string to_string(errinfo_opcode_val const& info) {
    std::stringstream ss;
    ss << "[opcode] = 0x" << std::hex << info.value() << "\n";
    return ss.str();
}

typedef boost::error_info<struct tag_mask_error_info, opcode_t> errinfo_mask;
typedef boost::error_info<struct tag_expected_error_info, opcode_t>
errinfo_expected;

typedef boost::error_info<struct tag_limit_error_info, unsigned long>
errinfo_limit;

class BaseException : public virtual std::exception,
                      public virtual boost::exception {
};

class InitError : public BaseException {
public:
    InitError(char const *desc) {
        this->desc = desc;
    }

    char const *what() const throw() {
        return desc;
    }
private:
    char const *desc;
};

// IntegrityError - for things that *should* be impossible
class IntegrityError : public BaseException {
public:
    IntegrityError() {
        this->desc = "IntegrityError";
    }

    IntegrityError(char const *desc) {
        this->desc = desc;
    }

    char const *what() const throw() {
        return desc;
    }
private:
    char const *desc;
};

class InvalidParamError : public BaseException {
public:
    InvalidParamError() {
        this->desc = "Invalid parameter value";
    }

    InvalidParamError(char const *desc) {
        this->desc = desc;
    }

    char const *what() const throw() {
        return desc;
    }
private:
    char const *desc;
};

// syntax error in the text of a rule table
class ParseError : public BaseException {
public:
    ParseError(char const *desc) {
        this->desc = desc;
    }

    char const *what() const throw() {
        return desc;
    }
private:
    char const *desc;
};

/*
 * a pattern string is the wrong length for the opcode width or contains a
 * character that isn't 0, 1, _, a lowercase letter or the separator.
 */
class MalformedPatternError : public BaseException {
public:
    MalformedPatternError() {
        this->desc = "Malformed bit pattern";
    }

    MalformedPatternError(char const *desc) {
        this->desc = desc;
    }

    char const *what() const throw() {
        return desc;
    }
private:
    char const *desc;
};

// a variable has a type that is not a raw integer but no mapping
class MissingMappingError : public BaseException {
public:
    char const *what() const throw() {
        return "Variable is missing a mapping for its declared type";
    }
};

// a literal table does not cover every raw value its variable can take
class UnmappedCombinationError : public BaseException {
public:
    char const *what() const throw() {
        return "Literal table does not map every raw value of the variable";
    }
};

/*
 * a raw value will not fit in the bits allotted to its variable.  Except for
 * oversized keys in a literal table this indicates a bug in the compiler.
 */
class VariableWidthOverflowError : public BaseException {
public:
    VariableWidthOverflowError() {
        this->desc = "Raw value does not fit in the variable's bits";
    }

    VariableWidthOverflowError(char const *desc) {
        this->desc = desc;
    }

    char const *what() const throw() {
        return desc;
    }
private:
    char const *desc;
};

// every opcode a rule could match is already matched by earlier rules
class UnreachablePatternError : public BaseException {
public:
    char const *what() const throw() {
        return "Pattern is completely shadowed by earlier patterns";
    }
};

/*
 * two rules produce the same mask/expected pair for different handlers.
 * This is normally only a warning; it is only thrown when configured to be
 * fatal.
 */
class AmbiguousPatternError : public BaseException {
public:
    char const *what() const throw() {
        return "Two handlers share an identical opcode test";
    }
};

// a rule expands into more dispatch entries than the configured limit
class ExpansionLimitError : public BaseException {
public:
    char const *what() const throw() {
        return "Rule expands into too many dispatch entries";
    }
};

// no dispatch entry matched an opcode at runtime
class UnmatchedOpcodeError : public BaseException {
public:
    char const *what() const throw() {
        return "Unhandled opcode";
    }
};

// the runtime dispatcher has no function bound to one of the table's handlers
class UnknownHandlerError : public BaseException {
public:
    char const *what() const throw() {
        return "No function bound to handler";
    }
};

#endif

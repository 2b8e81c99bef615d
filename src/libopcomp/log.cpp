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

#include <cstdio>
#include <cstdarg>

#include "opcomp/log.h"

static FILE *log_stream;
static bool log_verbose;

static char const *severity_prefix(enum log_severity lvl) {
    switch (lvl) {
    case log_severity_debug:
        return "DBG";
    case log_severity_info:
        return "INFO";
    case log_severity_warn:
        return "WARN";
    case log_severity_error:
        return "ERROR";
    }
    return "???";
}

void log_init(bool to_stdout, bool verbose) {
    log_stream = to_stdout ? stdout : stderr;
    log_verbose = verbose;
}

void log_do_write(enum log_severity lvl, char const *fmt, ...) {
    va_list arg;

    if (lvl == log_severity_debug && !log_verbose)
        return;

    // logging before log_init is allowed, it just goes to stderr
    FILE *stream = log_stream ? log_stream : stderr;

    fprintf(stream, "%s: ", severity_prefix(lvl));
    va_start(arg, fmt);
    vfprintf(stream, fmt, arg);
    va_end(arg);
}

void log_flush(void) {
    fflush(log_stream ? log_stream : stderr);
}

void log_cleanup(void) {
    log_flush();
    log_stream = NULL;
    log_verbose = false;
}

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


#ifndef OPCOMP_CONFIG_FILE_HPP_
#define OPCOMP_CONFIG_FILE_HPP_

/*
 * text file containing configuration settings.  Each line holds a key and a
 * value separated by whitespace, and everything after a # is a comment:
 *
 *     # let unreachable rules through
 *     opcomp.suppress-unreachable true
 *     opcomp.emit.style switch
 *
 * Settings stay in effect until cfg_cleanup.  When a key appears more than
 * once, the last one wins.
 */

void cfg_init(void);
void cfg_cleanup(void);

// feed the config parser one character at a time
void cfg_put_char(char ch);

// returns 0 on success, nonzero if the file couldn't be read
int cfg_load_file(char const *path);

void cfg_load_txt(char const *txt);

// returns NULL if the key isn't set
char const *cfg_get_node(char const *key);

/*
 * these return 0 on success.  If the key isn't set or its value can't be
 * parsed they return nonzero and don't touch *outp.
 */
int cfg_get_bool(char const *key, bool *outp);
int cfg_get_int(char const *key, int *outp);

#endif

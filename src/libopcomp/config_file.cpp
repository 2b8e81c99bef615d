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


#include <map>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>

#include <boost/tokenizer.hpp>

#include "opcomp/log.h"

#include "opcomp/config_file.hpp"

typedef std::map<std::string, std::string> CfgMap;

static CfgMap cfg_nodes;
static std::string cfg_line;
static unsigned cfg_line_no;

static void cfg_handle_line(std::string const& line) {
    typedef boost::tokenizer<boost::char_separator<char> > FieldTokenizer;

    std::string txt(line.substr(0, line.find_first_of('#')));
    FieldTokenizer tok(txt, boost::char_separator<char>(" \t\r"));
    std::string key, val;
    unsigned n_fields = 0;

    for (FieldTokenizer::iterator it = tok.begin(); it != tok.end(); it++) {
        if (n_fields == 0)
            key = *it;
        else if (n_fields == 1)
            val = *it;
        n_fields++;
    }

    if (n_fields == 0)
        return;

    if (n_fields != 2) {
        LOG_ERROR("config file line %u: expected \"key value\", ignoring "
                  "\"%s\"\n", cfg_line_no, txt.c_str());
        return;
    }

    CfgMap::iterator node = cfg_nodes.find(key);
    if (node != cfg_nodes.end()) {
        LOG_WARN("config file line %u: %s was already set to \"%s\"\n",
                 cfg_line_no, key.c_str(), node->second.c_str());
    }

    LOG_DBG("config: %s = %s\n", key.c_str(), val.c_str());
    cfg_nodes[key] = val;
}

void cfg_init(void) {
    cfg_nodes.clear();
    cfg_line.clear();
    cfg_line_no = 1;
}

void cfg_cleanup(void) {
    // a last line without a newline still counts
    if (cfg_line.size())
        cfg_handle_line(cfg_line);

    cfg_nodes.clear();
    cfg_line.clear();
    cfg_line_no = 1;
}

void cfg_put_char(char ch) {
    if (ch == '\n') {
        cfg_handle_line(cfg_line);
        cfg_line.clear();
        cfg_line_no++;
    } else {
        cfg_line += ch;
    }
}

int cfg_load_file(char const *path) {
    std::ifstream file(path);

    if (!file.is_open()) {
        LOG_ERROR("unable to open config file %s\n", path);
        return -1;
    }

    char ch;
    while (file.get(ch))
        cfg_put_char(ch);
    cfg_put_char('\n');

    if (file.bad()) {
        LOG_ERROR("error while reading config file %s\n", path);
        return -1;
    }

    LOG_INFO("loaded config file %s\n", path);
    return 0;
}

void cfg_load_txt(char const *txt) {
    while (*txt)
        cfg_put_char(*txt++);
    cfg_put_char('\n');
}

char const *cfg_get_node(char const *key) {
    CfgMap::const_iterator node = cfg_nodes.find(key);

    if (node == cfg_nodes.end())
        return NULL;
    return node->second.c_str();
}

int cfg_get_bool(char const *key, bool *outp) {
    char const *val = cfg_get_node(key);

    if (!val)
        return -1;

    if (strcmp(val, "true") == 0 || strcmp(val, "1") == 0) {
        *outp = true;
        return 0;
    } else if (strcmp(val, "false") == 0 || strcmp(val, "0") == 0) {
        *outp = false;
        return 0;
    }

    LOG_ERROR("config: %s must be true or false, not \"%s\"\n", key, val);
    return -1;
}

int cfg_get_int(char const *key, int *outp) {
    char const *val = cfg_get_node(key);
    char *endptr;

    if (!val)
        return -1;

    errno = 0;
    long as_long = strtol(val, &endptr, 0);
    if (errno || *endptr || endptr == val || as_long != int(as_long)) {
        LOG_ERROR("config: %s must be an integer, not \"%s\"\n", key, val);
        return -1;
    }

    *outp = int(as_long);
    return 0;
}

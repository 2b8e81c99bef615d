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


#include <unistd.h>

#include <cstring>
#include <iostream>
#include <fstream>
#include <sstream>

#include "opcomp/BaseException.hpp"
#include "opcomp/log.h"
#include "opcomp/config_file.hpp"
#include "opcomp/CompileOptions.hpp"
#include "opcomp/Compiler.hpp"
#include "opcomp/Emitter.hpp"

struct options {
    char const *filename_in, *filename_out;
    char const *cfg_path;
    char const *style;
    bool suppress_unreachable;
    bool verbose;
};

static void print_usage(char const *cmd) {
    std::cerr << "Usage: " << cmd << " [-i input] [-o output] " <<
        "[-c config] [-e chain|switch|listing] [-u] [-v]" << std::endl <<
        std::endl <<
        "Compiles a rule table into a C++ dispatcher." << std::endl <<
        std::endl <<
        "    -i  rule table to read (default: stdin)" << std::endl <<
        "    -o  header to write (default: stdout)" << std::endl <<
        "    -c  config file" << std::endl <<
        "    -e  emitter style (default: chain)" << std::endl <<
        "    -u  warn about unreachable rules instead of failing" <<
        std::endl <<
        "    -v  print debug logs" << std::endl;
}

static std::string compile_rule_table(std::istream *input,
                                      struct options const *options) {
    CompileOptions compile_opts;
    enum emit_style style = EMIT_STYLE_CHAIN;
    char const *style_name;
    std::stringstream txt, generated;

    compile_options_load_cfg(&compile_opts);
    if (options->suppress_unreachable)
        compile_opts.suppress_unreachable = true;

    if ((style_name = cfg_get_node("opcomp.emit.style")))
        style = emit_style_from_name(style_name);
    if (options->style)
        style = emit_style_from_name(options->style);

    txt << input->rdbuf();
    if (input->bad())
        BOOST_THROW_EXCEPTION(InitError("Unable to read the rule table"));

    TableCompiler compiler(compile_opts);
    DecisionTable tbl = compiler.compile_txt(txt.str());

    make_emitter(style)->emit(tbl, &generated);

    return generated.str();
}

int main(int argc, char **argv) {
    int err_code = 0;
    int opt;
    char const *cmd = argv[0];
    struct options options;
    bool cfg_verbose = false;

    memset(&options, 0, sizeof(options));

    std::ostream *output = &std::cout;
    std::istream *input = &std::cin;
    std::ofstream *file_out = NULL;
    std::ifstream *file_in = NULL;

    while ((opt = getopt(argc, argv, "i:o:c:e:uvh")) != -1) {
        switch (opt) {
        case 'i':
            options.filename_in = optarg;
            break;
        case 'o':
            options.filename_out = optarg;
            break;
        case 'c':
            options.cfg_path = optarg;
            break;
        case 'e':
            options.style = optarg;
            break;
        case 'u':
            options.suppress_unreachable = true;
            break;
        case 'v':
            options.verbose = true;
            break;
        case 'h':
            print_usage(cmd);
            return 0;
        default:
            print_usage(cmd);
            return 1;
        }
    }

    argv += optind;
    argc -= optind;

    if (argc != 0) {
        print_usage(cmd);
        return 1;
    }

    log_init(false, options.verbose);
    cfg_init();

    try {
        if (options.cfg_path) {
            if (cfg_load_file(options.cfg_path) != 0) {
                BOOST_THROW_EXCEPTION(InitError("Unable to load config "
                                                "file") <<
                                      errinfo_path(options.cfg_path));
            }

            char const *verbose_val = cfg_get_node("log.verbose");
            if (verbose_val) {
                if (cfg_get_bool("log.verbose", &cfg_verbose) != 0) {
                    BOOST_THROW_EXCEPTION(InvalidParamError("Config value "
                                                            "must be true or "
                                                            "false") <<
                                          errinfo_param_name("log.verbose") <<
                                          errinfo_token(verbose_val));
                }
                if (cfg_verbose && !options.verbose)
                    log_init(false, true);
            }
        }

        if (options.filename_in) {
            input = file_in = new std::ifstream(options.filename_in);
            if (!file_in->is_open()) {
                BOOST_THROW_EXCEPTION(InitError("Unable to open input file") <<
                                      errinfo_path(options.filename_in));
            }
        }

        std::string generated = compile_rule_table(input, &options);

        // nothing gets written unless the whole table compiled
        if (options.filename_out) {
            output = file_out = new std::ofstream(options.filename_out);
            if (!file_out->is_open()) {
                BOOST_THROW_EXCEPTION(InitError("Unable to open output "
                                                "file") <<
                                      errinfo_path(options.filename_out));
            }
        }

        (*output) << generated;
        output->flush();
        if (output->fail())
            BOOST_THROW_EXCEPTION(InitError("Unable to write the dispatcher"));
    } catch (BaseException& exc) {
        std::cerr << boost::diagnostic_information(exc);
        err_code = 1;
    }

    if (file_in)
        delete file_in;
    if (file_out)
        delete file_out;

    cfg_cleanup();
    log_cleanup();

    return err_code;
}

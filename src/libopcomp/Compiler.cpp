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


#include <vector>

#include "opcomp/BaseException.hpp"
#include "opcomp/log.h"
#include "opcomp/config_file.hpp"
#include "opcomp/BitPattern.hpp"
#include "opcomp/Expansion.hpp"
#include "opcomp/Resolver.hpp"
#include "opcomp/RuleParser.hpp"

#include "opcomp/Compiler.hpp"

// keys that aren't set leave *outp alone, values that don't parse throw
static void cfg_get_flag(char const *key, bool *outp) {
    char const *val = cfg_get_node(key);

    if (val && cfg_get_bool(key, outp) != 0) {
        BOOST_THROW_EXCEPTION(InvalidParamError("Config value must be true "
                                                "or false") <<
                              errinfo_param_name(key) <<
                              errinfo_token(val));
    }
}

static void cfg_get_limit(char const *key, unsigned long *outp) {
    char const *val = cfg_get_node(key);
    int limit;

    if (!val)
        return;

    if (cfg_get_int(key, &limit) != 0) {
        BOOST_THROW_EXCEPTION(InvalidParamError("Config value must be an "
                                                "integer") <<
                              errinfo_param_name(key) <<
                              errinfo_token(val));
    }

    if (limit <= 0) {
        BOOST_THROW_EXCEPTION(InvalidParamError("Limit must be positive") <<
                              errinfo_param_name(key) <<
                              errinfo_token(val));
    }

    *outp = limit;
}

void compile_options_load_cfg(CompileOptions *opts) {
    char const *fallback;

    cfg_get_flag("opcomp.suppress-unreachable", &opts->suppress_unreachable);
    cfg_get_flag("opcomp.ambiguous-fatal", &opts->ambiguous_fatal);
    cfg_get_limit("opcomp.max-entries-per-rule", &opts->max_entries_per_rule);
    cfg_get_limit("opcomp.cover-budget", &opts->cover_budget);

    if ((fallback = cfg_get_node("opcomp.emit.fallback")))
        opts->fallback = fallback;
}

TableCompiler::TableCompiler() {
    register_function(MappingFuncPtr(new NativeMappingFunction("nonzero",
                                                               map_nonzero)));
    register_function(MappingFuncPtr(new NativeMappingFunction("identity",
                                                               map_identity)));
}

TableCompiler::TableCompiler(CompileOptions const& opts) : opts(opts) {
    register_function(MappingFuncPtr(new NativeMappingFunction("nonzero",
                                                               map_nonzero)));
    register_function(MappingFuncPtr(new NativeMappingFunction("identity",
                                                               map_identity)));
}

void TableCompiler::register_function(MappingFuncPtr func) {
    if (!func)
        BOOST_THROW_EXCEPTION(InvalidParamError("NULL mapping function"));

    if (funcs.count(func->name()))
        LOG_WARN("mapping function %s registered twice\n", func->name().c_str());

    funcs[func->name()] = func;
}

bool TableCompiler::has_function(std::string const& name) const {
    return funcs.count(name) != 0;
}

void TableCompiler::prepare_rule(Rule *rule, unsigned width) const {
    if (rule->handler.empty())
        BOOST_THROW_EXCEPTION(InvalidParamError("Rule has no handler"));

    rule->pattern = BitPattern(rule->pattern_txt, width);

    for (VarDeclList::iterator it = rule->decls.begin();
         it != rule->decls.end(); it++) {
        if (it->mapping != VAR_MAPPING_FUNC || it->func)
            continue;

        FuncMap::const_iterator func = funcs.find(it->func_name);
        if (func != funcs.end())
            it->func = func->second;
    }

    rule->groups = resolve_bindings(rule->pattern, rule->decls);
}

DecisionTable TableCompiler::compile(RuleTable const& tbl) const {
    RuleList rules(tbl.rules);
    TableHeader hdr(tbl.hdr);
    std::vector<DecisionTable::EntryList> expanded;
    unsigned long n_entries = 0;

    if (!opcomp_valid_width(hdr.width)) {
        BOOST_THROW_EXCEPTION(InvalidParamError("Unsupported opcode width") <<
                              errinfo_width(hdr.width));
    }

    if (hdr.dispatcher_name.empty()) {
        BOOST_THROW_EXCEPTION(InvalidParamError("No dispatcher name") <<
                              errinfo_param_name("dispatcher"));
    }

    if (hdr.context_type.empty()) {
        BOOST_THROW_EXCEPTION(InvalidParamError("No context type") <<
                              errinfo_param_name("context"));
    }

    if (opts.fallback.size())
        hdr.fallback = opts.fallback;

    for (unsigned rule_idx = 0; rule_idx < rules.size(); rule_idx++) {
        Rule *rule = &rules[rule_idx];

        try {
            prepare_rule(rule, hdr.width);
            expanded.push_back(expand_rule(*rule, rule_idx,
                                           opts.max_entries_per_rule));
        } catch (BaseException& err) {
            err << errinfo_rule_idx(rule_idx) <<
                errinfo_pattern(rule->pattern_txt);
            if (rule->line_no)
                err << errinfo_line_no(rule->line_no);
            throw;
        }

        n_entries += expanded.back().size();
    }

    DecisionTable res(resolve_priority(hdr, rules, expanded, opts));

    LOG_INFO("%s: %u rules compiled into %lu dispatch entries, %u warnings\n",
             hdr.dispatcher_name.c_str(), unsigned(rules.size()), n_entries,
             unsigned(res.diagnostics().size()));

    return res;
}

DecisionTable TableCompiler::compile_txt(std::string const& txt) const {
    return compile(RuleParser::parse(txt));
}

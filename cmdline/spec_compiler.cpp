
#include "spec_compiler.hpp"
#include "switches.hpp"

#include <set>

#include "../logger/logger.hpp"
#include "../debug/assert.hpp"

namespace declopt::cmdline
{
  namespace
  {
    struct partitioned_spec
    {
      std::vector<std::string> switches;
      std::vector<std::string> docs;
      std::vector<const spec_token*> keywords;
    };

    partitioned_spec partition(const spec& raw_spec)
    {
      enum class state { switches, docs, keywords };

      partitioned_spec ret;
      state st = state::switches;
      for (const spec_token& tk : raw_spec)
      {
        if (st == state::switches)
        {
          if (tk.is_literal() && is_option(tk.text))
          {
            ret.switches.push_back(tk.text);
            continue;
          }
          st = state::docs;
        }
        if (st == state::docs)
        {
          if (tk.is_literal())
          {
            ret.docs.push_back(tk.text);
            continue;
          }
          st = state::keywords;
        }

        if (tk.is_literal())
        {
          cr::out().warn("spec: ignoring string `{}`: strings after options are not allowed", tk.text);
          continue;
        }
        ret.keywords.push_back(&tk);
      }
      return ret;
    }
  }

  option compile_spec(const spec& raw_spec)
  {
    partitioned_spec parts = partition(raw_spec);
    if (parts.switches.empty())
      cr::out().warn("spec: no switch declared, the option will never match");

    std::optional<bool> explicit_flag;
    for (const spec_token* tk : parts.keywords)
    {
      if (tk->type == spec_token::kind::flag)
        explicit_flag = tk->val.is<bool>() && tk->val.as<bool>();
    }

    option ret;
    std::vector<std::string> aliases;
    aliases.reserve(parts.switches.size());
    for (const std::string& sw : parts.switches)
      aliases.push_back(name_for(sw));

    const bool computed_flag = (!parts.switches.empty() && is_negatable(parts.switches.back())) || explicit_flag.value_or(false);

    ret.switches = expand_switches(parts.switches, computed_flag);
    ret.aliases = std::set<std::string>(aliases.begin(), aliases.end());
    if (!aliases.empty())
      ret.name = aliases.back();
    if (!parts.docs.empty())
      ret.doc = parts.docs.front();
    ret.is_flag = computed_flag;
    ret.parse = parsers::identity;
    ret.assign = assigners::insert;
    if (computed_flag)
      ret.default_value = value(false);

    // explicit values always win over the computed ones:
    for (const spec_token* tk : parts.keywords)
    {
      switch (tk->type)
      {
        case spec_token::kind::default_value: ret.default_value = tk->val; break;
        case spec_token::kind::flag: ret.is_flag = tk->val.is<bool>() && tk->val.as<bool>(); break;
        case spec_token::kind::parse:
          if (check::debug::d_check(!!tk->parse_fn, "spec {}: empty parse function", ret.name))
            ret.parse = tk->parse_fn;
          break;
        case spec_token::kind::assign:
          if (check::debug::d_check(!!tk->assign_fn, "spec {}: empty assign function", ret.name))
            ret.assign = tk->assign_fn;
          break;
        case spec_token::kind::extra: ret.extra.insert_or_assign(tk->text, tk->val); break;
        case spec_token::kind::literal: break;
      }
    }

    cr::out().debug("spec: compiled option {} (switches: {}, flag: {})", ret.name, ret.switches, ret.is_flag);
    return ret;
  }

  std::vector<option> compile_specs(const std::vector<spec>& raw_specs)
  {
    std::vector<option> ret;
    ret.reserve(raw_specs.size());

    std::set<std::string> declared_switches;
    for (const spec& it : raw_specs)
    {
      option opt = compile_spec(it);
      for (const std::string& sw : opt.switches)
      {
        if (!declared_switches.insert(sw).second)
          cr::out().warn("spec {}: switch {} is already declared by a previous option and will never match this one", opt.name, sw);
      }
      ret.push_back(std::move(opt));
    }
    return ret;
  }
}

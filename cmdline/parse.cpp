//
// created by : Timothée Feuillet
// date: 2026-10-19
//
//
// Copyright (c) 2026 Timothée Feuillet
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//

#include "parse.hpp"
#include "banner.hpp"
#include "spec_compiler.hpp"
#include "switches.hpp"

#include <iterator>

#include <fmt/format.h>

#include "../container_utils.hpp"
#include "../logger/logger.hpp"

namespace declopt::cmdline
{
  namespace
  {
    parse_result& fail(parse_result& res, status code, std::string token, std::string message)
    {
      cr::out().warn("{}", message);
      res.code = code;
      res.token = std::move(token);
      res.message = std::move(message);
      res.options.clear();
      res.leftovers.clear();
      return res;
    }
  }

  option_map default_values_for(const std::vector<option>& options)
  {
    option_map ret;
    for (const option& opt : options)
    {
      if (opt.has_default())
        opt.assign(ret, opt.name, *opt.default_value);
    }
    return ret;
  }

  match_result match_option(std::deque<std::string>& tokens, const std::vector<option>& options)
  {
    if (is_gnu_long_option(tokens.front()))
    {
      auto [name, arg_value] = split_gnu_long_option(tokens.front());
      tokens.front() = std::move(arg_value);
      tokens.push_front(std::move(name));
    }

    match_result ret { tokens.front(), nullptr };
    for (const option& opt : options)
    {
      if (cr::contains(opt.switches, ret.key))
      {
        ret.opt = &opt;
        break;
      }
    }
    return ret;
  }

  parse_result parse::process(const std::vector<option>& options)
  {
    parse_result res;
    res.banner = banner_for(options);
    res.options = default_values_for(options);

    while (!args.empty())
    {
      const match_result match = match_option(args, options);

      if (is_end_of_args(match.key))
      {
        // force everything else to be treated as parameters
        args.pop_front();
        cr::out().debug("cmdline: end of options, {} remaining args are parameters", args.size());
        cr::insert_back(res.leftovers, std::move(args));
        args.clear();
        break;
      }

      if (!is_option(match.key))
      {
        cr::out().debug("cmdline: parameter: {}", match.key);
        res.leftovers.push_back(std::move(args.front()));
        args.pop_front();
        continue;
      }

      if (match.opt == nullptr)
        return fail(res, status::invalid_argument, match.key, fmt::format("'{}' is not a valid argument", match.key));

      const option& opt = *match.opt;
      if (opt.is_flag)
      {
        const bool flag_value = flag_value_for(match.key);
        cr::out().debug("cmdline: flag {}: {} (from {})", opt.name, flag_value, match.key);
        opt.assign(res.options, opt.name, value(flag_value));
        args.pop_front();
        continue;
      }

      if (args.size() < 2)
        return fail(res, status::missing_value, match.key, fmt::format("{} expects a value", match.key));

      bool valid = true;
      value parsed = opt.parse(args[1], valid);
      if (!valid)
        return fail(res, status::value_conversion_failure, args[1], fmt::format("'{}' is not a valid value for {}", args[1], match.key));

      cr::out().debug("cmdline: option {}: {} (from {} {})", opt.name, parsed, match.key, args[1]);
      opt.assign(res.options, opt.name, std::move(parsed));
      args.pop_front();
      args.pop_front();
    }
    return res;
  }

  parse_result parse::process(const std::vector<spec>& specs)
  {
    return process(compile_specs(specs));
  }

  parse_result cli(std::vector<std::string> args, const std::vector<spec>& specs)
  {
    return parse(std::move(args)).process(specs);
  }

  parse_result cli(int argc, char** argv, const std::vector<spec>& specs)
  {
    return parse(argc, argv).process(specs);
  }
}

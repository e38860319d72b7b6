//
// created by : Timothée Feuillet
// date: 2021-12-12
//
//
// Copyright (c) 2021 Timothée Feuillet
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

#pragma once

#include <deque>
#include <iterator>
#include <string>
#include <vector>

#include "option.hpp"
#include "errors.hpp"

namespace declopt::cmdline
{
  /// \brief result of a parse
  /// On failure, options and leftovers are empty (there is no partial result), the banner is still set.
  struct parse_result
  {
    status code = status::success;
    // human readable error, names the offending token
    std::string message;
    std::string token;

    option_map options;
    std::vector<std::string> leftovers;
    std::string banner;

    explicit operator bool() const { return code == status::success; }
  };

  /// \brief build the initial option map: every option with a default, placed using its assign function
  option_map default_values_for(const std::vector<option>& options);

  struct match_result
  {
    // the token to look for (the name part of a --name=value token)
    std::string key;
    // first declared option that recognizes key, nullptr if none
    const option* opt = nullptr;
  };

  /// \brief find the option matching the first token of \e tokens
  /// \note --name=value tokens are split in place: \e tokens becomes [--name, value, ...]
  /// \warning tokens must not be empty
  match_result match_option(std::deque<std::string>& tokens, const std::vector<option>& options);

  /// \brief parse the command line args and fill the option map
  class parse
  {
    public:
      parse(int _argc, char** _argv)
      {
        for (int i = 0; i < _argc; ++i)
          args.emplace_back(_argv[i]);
        skip(1); // skip the program name
      }

      explicit parse(std::vector<std::string> _args) : args(std::make_move_iterator(_args.begin()), std::make_move_iterator(_args.end())) {}

      bool has_remaining_args() const { return !args.empty(); }

      bool skip(unsigned count)
      {
        while (count > 0 && !args.empty())
        {
          args.pop_front();
          --count;
        }
        return !args.empty();
      }

      /// \brief Do the processing
      /// Consumes every remaining arg. Options can be interleaved with parameters,
      /// everything after a `--` is a parameter.
      parse_result process(const std::vector<option>& options);

      /// \brief compile the specs, then do the processing
      parse_result process(const std::vector<spec>& specs);

    private:
      std::deque<std::string> args;
  };

  /// \brief parse \e args using \e specs
  /// \code
  /// auto res = cmdline::cli(args,
  /// {
  ///   {"-p", "--port", "Port to listen on", cmdline::deflt(3000), cmdline::parse_with(cmdline::parsers::integer)},
  ///   {"--[no-]verbose", "Print more things"},
  /// });
  /// \endcode
  parse_result cli(std::vector<std::string> args, const std::vector<spec>& specs);

  /// \brief parse the program args (argv[0] is skipped) using \e specs
  parse_result cli(int argc, char** argv, const std::vector<spec>& specs);
}


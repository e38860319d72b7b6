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

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace declopt::cmdline
{
  /// \brief the marker of a negatable flag (--[no-]name)
  constexpr std::string_view k_negatable_marker = "[no-]";

  /// \brief whether the token looks like a switch (starts with -)
  constexpr bool is_option(std::string_view token) { return token.starts_with("-"); }

  /// \brief whether the switch declares a negatable flag (--[no-]name)
  constexpr bool is_negatable(std::string_view sw) { return sw.starts_with("--[no-]"); }

  /// \brief whether the token is the end-of-options marker (--)
  constexpr bool is_end_of_args(std::string_view token) { return token == "--"; }

  /// \brief the value a flag takes when matched by the literal switch \e literal
  /// (false for --no-name, true for everything else)
  constexpr bool flag_value_for(std::string_view literal) { return !literal.starts_with("--no-"); }

  /// \brief return the canonical name of a switch: strip --no-, --[no-], -- or -, in that order
  std::string name_for(std::string_view sw);

  /// \brief expand the declared switches of an option into every literal switch it recognizes
  /// For flags: --[no-]name gives --no-name and --name, --name gives --no-name and --name.
  /// Other switches are kept as-is.
  std::vector<std::string> expand_switches(const std::vector<std::string>& switches, bool is_flag);

  /// \brief whether the token is a GNU style long option (--name=value)
  bool is_gnu_long_option(std::string_view token);

  /// \brief split a GNU style long option at its first =
  std::pair<std::string, std::string> split_gnu_long_option(std::string_view token);
}


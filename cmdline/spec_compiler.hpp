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

#include <vector>

#include "option.hpp"

namespace declopt::cmdline
{
  /// \brief compile a declarative spec into an option
  ///
  /// The spec is read as: [switches...] [doc...] [keyword tokens...]
  ///  - switches are the leading literals that start with a -
  ///  - docs are the literals that follow (only the first one is kept)
  ///  - keyword tokens (deflt, parse_with, flag, assign_with, extra) override the computed defaults
  ///
  /// Malformed specs are not rejected: the option is built the best it can be and a warning is logged.
  option compile_spec(const spec& raw_spec);

  /// \brief compile every spec, in declaration order
  /// \note logs a warning for switches declared more than once (the first declaration is the one that matches)
  std::vector<option> compile_specs(const std::vector<spec>& raw_specs);
}


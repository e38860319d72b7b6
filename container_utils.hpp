//
// created by : Timothée Feuillet
// date: 2021-11-24
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

#include <algorithm>
#include <string>
#include <string_view>
#include <regex>
#include <vector>

namespace declopt::cr
{
  [[maybe_unused]] static std::vector<std::string> split_string(const std::string& input, const std::string& regex)
  {
    // passing -1 as the submatch index parameter performs splitting
    std::regex re(regex);
    std::sregex_token_iterator
        first{input.begin(), input.end(), re, -1},
        last;
    return {first, last};
  }

  /// \brief replace every occurence of \e what in \e input by \e with
  [[maybe_unused]] static std::string replace_all(std::string_view input, std::string_view what, std::string_view with)
  {
    std::string ret;
    ret.reserve(input.size());
    size_t pos = 0;
    while (true)
    {
      const size_t next = input.find(what, pos);
      if (next == std::string_view::npos || what.empty())
        break;
      ret.append(input.substr(pos, next - pos));
      ret.append(with);
      pos = next + what.size();
    }
    ret.append(input.substr(pos));
    return ret;
  }

  template<typename Cont, typename Type>
  auto find(const Cont& c, Type&& t)
  {
    return std::find(c.begin(), c.end(), std::forward<Type>(t));
  }

  template<typename Cont, typename Type>
  bool contains(const Cont& c, Type&& t)
  {
    return find(c, std::forward<Type>(t)) != c.end();
  }

  template<typename ContA, typename ContB>
  void insert_back(ContA& a, ContB&& b)
  {
    a.insert(a.end(), b.begin(), b.end());
  }
}

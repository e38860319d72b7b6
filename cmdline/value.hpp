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

#include <concepts>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/format.h>

namespace declopt::cmdline
{
  /// \brief A parsed option value: nothing, a boolean, an integer, a floating point number, a string or a list of values
  /// \note integers are always stored as int64_t and floating point numbers as double
  class value
  {
    public:
      using list = std::vector<value>;
      using storage_t = std::variant<std::monostate, bool, int64_t, double, std::string, list>;

    public:
      value() = default;
      value(bool v) : data(v) {}
      template<std::integral Type> requires (!std::same_as<Type, bool>)
      value(Type v) : data((int64_t)v) {}
      template<std::floating_point Type>
      value(Type v) : data((double)v) {}
      value(const char* v) : data(std::string(v)) {}
      value(std::string_view v) : data(std::string(v)) {}
      value(std::string v) : data(std::move(v)) {}
      value(list v) : data(std::move(v)) {}

      bool empty() const { return std::holds_alternative<std::monostate>(data); }

      template<typename Type>
      bool is() const { return std::holds_alternative<Type>(data); }

      /// \brief return the held value
      /// \warning the held type must be Type (throws std::bad_variant_access otherwise)
      template<typename Type>
      const Type& as() const { return std::get<Type>(data); }
      template<typename Type>
      Type& as() { return std::get<Type>(data); }

      template<typename Type>
      const Type* get_if() const { return std::get_if<Type>(&data); }
      template<typename Type>
      Type* get_if() { return std::get_if<Type>(&data); }

      /// \brief return the same representation as the one used in the usage banner
      std::string to_string() const;

      bool operator == (const value& o) const { return data == o.data; }

    private:
      storage_t data;
  };

  /// \brief the parsed options, indexed by option name
  using option_map = std::map<std::string, value>;
}

template<> struct fmt::formatter<declopt::cmdline::value> : fmt::formatter<std::string>
{
  template <typename FormatContext>
  auto format(const declopt::cmdline::value& v, FormatContext& ctx) const
  {
    return fmt::formatter<std::string>::format(v.to_string(), ctx);
  }
};


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

#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "value.hpp"
#include "conversion_helpers.hpp"

namespace declopt::cmdline
{
  /// \brief transform the raw string that follows a value option into its value
  /// \note set valid to false to report a conversion failure
  using parse_fn_t = std::function<value(std::string_view raw, bool& valid)>;

  /// \brief place a value in the option map. The default simply inserts (or overwrites) the value under name.
  using assign_fn_t = std::function<void(option_map& options, const std::string& name, value v)>;

  /// \brief A compiled option. Built once by compile_spec and never modified afterward.
  struct option
  {
    // every literal token recognized for the option, --[no-] markers already expanded
    std::vector<std::string> switches;
    std::set<std::string> aliases;
    // key in the option map
    std::string name;
    std::string doc;

    bool is_flag = false;
    std::optional<value> default_value;

    parse_fn_t parse;
    assign_fn_t assign;

    // custom keys (extra(...)), carried but never interpreted
    std::map<std::string, value> extra;

    bool has_default() const { return default_value.has_value(); }
  };

  /// \brief Built-in parse functions
  namespace parsers
  {
    /// \brief the raw string, as a string value (default)
    inline value identity(std::string_view raw, bool& /*valid*/)
    {
      return value(raw);
    }

    /// \brief parse function using helper::from_string<Type>
    /// \note usage: `cmdline::parse_with(cmdline::parsers::from<uint16_t>)`
    template<typename Type>
    value from(std::string_view raw, bool& valid)
    {
      static_assert(helper::from_string<Type>::is_valid_type, "from<Type>: Type cannot be converted from a string");
      valid = true;
      Type result = helper::from_string<Type>::convert(raw, valid);
      if (!valid)
        return {};
      // integers are stored as int64_t
      if constexpr (std::is_integral_v<Type> && std::is_unsigned_v<Type> && sizeof(Type) >= sizeof(int64_t))
      {
        if (result > (Type)std::numeric_limits<int64_t>::max())
        {
          cr::out().warn("number is out-of-range for an option value: {}", raw);
          valid = false;
          return {};
        }
      }
      return value(std::move(result));
    }

    inline value integer(std::string_view raw, bool& valid) { return from<int64_t>(raw, valid); }
    inline value number(std::string_view raw, bool& valid) { return from<double>(raw, valid); }
    inline value boolean(std::string_view raw, bool& valid) { return from<bool>(raw, valid); }
  }

  /// \brief Built-in assign functions
  namespace assigners
  {
    /// \brief plain insertion (default)
    inline void insert(option_map& options, const std::string& name, value v)
    {
      options.insert_or_assign(name, std::move(v));
    }

    /// \brief accumulate the values in a list. List values are appended element by element.
    /// \note usage: `cmdline::spec{"-I", "--include", cmdline::deflt(cmdline::value::list{}), cmdline::assign_with(cmdline::assigners::append)}`
    inline void append(option_map& options, const std::string& name, value v)
    {
      value& slot = options[name];
      if (slot.empty())
        slot = value::list{};
      else if (!slot.is<value::list>())
        slot = value::list{std::move(slot)};

      value::list& lst = slot.as<value::list>();
      if (value::list* vlst = v.get_if<value::list>(); vlst != nullptr)
        lst.insert(lst.end(), std::make_move_iterator(vlst->begin()), std::make_move_iterator(vlst->end()));
      else
        lst.push_back(std::move(v));
    }

    /// \brief count the occurences (-v -v -v). The value itself is ignored.
    /// \note a boolean `false` (a default or a --no- switch) is not counted
    inline void count(option_map& options, const std::string& name, value v)
    {
      value& slot = options[name];
      if (!slot.is<int64_t>())
        slot = int64_t(0);
      if (const bool* b = v.get_if<bool>(); b != nullptr && !*b)
        return;
      slot.as<int64_t>() += 1;
    }
  }

  /// \brief A single element of a declarative spec: either a literal string (switch or doc) or a keyword/value pair
  struct spec_token
  {
    enum class kind
    {
      literal,
      default_value,
      parse,
      flag,
      assign,
      extra,
    };

    kind type = kind::literal;
    // literal text, or the key of an extra
    std::string text;
    value val;
    parse_fn_t parse_fn;
    assign_fn_t assign_fn;

    explicit spec_token(kind _type) : type(_type) {}
    spec_token(const char* str) : text(str) {}
    spec_token(std::string_view str) : text(str) {}
    spec_token(std::string str) : text(std::move(str)) {}

    bool is_literal() const { return type == kind::literal; }
  };

  /// \brief A declarative spec: switches (strings starting with -), an optional doc string, then keyword tokens
  /// \code cmdline::spec{"-p", "--port", "Port to listen on", cmdline::deflt(3000), cmdline::parse_with(cmdline::parsers::integer)} \endcode
  using spec = std::vector<spec_token>;

  inline spec_token deflt(value v)
  {
    spec_token ret(spec_token::kind::default_value);
    ret.val = std::move(v);
    return ret;
  }

  inline spec_token parse_with(parse_fn_t fnc)
  {
    spec_token ret(spec_token::kind::parse);
    ret.parse_fn = std::move(fnc);
    return ret;
  }

  inline spec_token flag(bool is_flag = true)
  {
    spec_token ret(spec_token::kind::flag);
    ret.val = is_flag;
    return ret;
  }

  inline spec_token assign_with(assign_fn_t fnc)
  {
    spec_token ret(spec_token::kind::assign);
    ret.assign_fn = std::move(fnc);
    return ret;
  }

  inline spec_token extra(std::string key, value v)
  {
    spec_token ret(spec_token::kind::extra);
    ret.text = std::move(key);
    ret.val = std::move(v);
    return ret;
  }
}


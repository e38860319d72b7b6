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

#include <source_location>
#include <fmt/format.h>

#include "../logger/logger.hpp"

#ifndef DECLOPT_ALLOW_DEBUG
  #define DECLOPT_ALLOW_DEBUG false
#endif

#ifndef DECLOPT_DISABLE_CHECKS
  #define DECLOPT_DISABLE_CHECKS 0
#endif


namespace declopt::debug
{
  struct dummy_error
  {
    using error_type = int;

    static bool is_error(int) { return false; }
    static const char* get_code_name(int) { return "[dummy error: no code]"; }
    static const char* get_description(int) { return "[dummy error: no description]"; }
  };

  /// \brief Log-and-continue checks. Failing checks are logged as errors and the result is returned to the caller.
  template<typename ErrorClass = dummy_error>
  class on_error
  {
    public:
      on_error() = delete;

      using error_type = typename ErrorClass::error_type;

#if !DECLOPT_DISABLE_CHECKS
      template<typename... Args>
      static bool _check(std::source_location sloc, const bool test, const char* test_str, fmt::format_string<Args...> message, Args&&... args)
      {
        [[unlikely]] if (DECLOPT_ALLOW_DEBUG && test && cr::get_global_logger().can_log(cr::logger::severity::debug))
        {
          cr::out(sloc).log_fmt(cr::logger::severity::debug, "[CHECK  PASSED: {0}]", test_str);
          return test;
        }
        [[likely]] if (test)
          return test;

        cr::out(sloc).log_fmt(cr::logger::severity::error, "[CHECK  FAILED: {0}]: {1}", test_str, fmt::format(std::move(message), std::forward<Args>(args)...));
        return test;
      }

      template<typename... Args>
      static error_type _check_code(std::source_location sloc, const error_type code, const char* test_str, fmt::format_string<Args...> message, Args&&... args)
      {
        const bool test = !ErrorClass::is_error(code);
        [[unlikely]] if (DECLOPT_ALLOW_DEBUG && test && cr::get_global_logger().can_log(cr::logger::severity::debug))
        {
          cr::out(sloc).log_fmt(cr::logger::severity::debug, "[CHECK  PASSED: {0} returned {1}: {2}]",
                                test_str, ErrorClass::get_code_name(code), ErrorClass::get_description(code));
          return code;
        }
        [[likely]] if (test)
          return code;

        cr::out(sloc).log_fmt(cr::logger::severity::error,
                              "[CHECK  FAILED: {0} returned {1}: {2}]: {3}",
                              test_str, ErrorClass::get_code_name(code), ErrorClass::get_description(code),
                              fmt::format(std::move(message), std::forward<Args>(args)...));
        return code;
      }
#endif

      static bool _dummy(bool r) { return r; }
      static error_type _dummy_code(error_type r) { return r; }
  };
}

#if !DECLOPT_DISABLE_CHECKS

#define d_check(test, ...)        _check(std::source_location::current(), test, #test, __VA_ARGS__)
#define d_check_code(expr, ...)   _check_code(std::source_location::current(), expr, #expr, __VA_ARGS__)

#else // DECLOPT_DISABLE_CHECKS

#define d_check(test, ...)        _dummy(test)

// We keep expr but strip everything else
#define d_check_code(expr, ...)   _dummy_code(expr)

#endif

namespace declopt::check
{
  using debug = declopt::debug::on_error<>;
}

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

#include "../logger/logger.hpp"
#include "../debug/assert.hpp"

// small helper for the cmdline tests:
// every check goes through d_check (so failures are logged with their location) and is counted.
// main() returns the result of test_helper::exit_code().
namespace declopt
{
  class test_helper
  {
    public:
      static test_helper& get()
      {
        static test_helper helper;
        return helper;
      }

      static void setup(cr::logger::severity min_severity = cr::logger::severity::message)
      {
        cr::get_global_logger().min_severity = min_severity;
      }

      void begin(const std::string& name)
      {
        current = name;
        failures_at_begin = failures;
        ++test_count;
      }

      void end()
      {
        if (failures == failures_at_begin)
          cr::out().log("[TEST]: {:.<50} passed", current + " ");
        else
          cr::out().error("[TEST]: {:.<50} FAILED ({} checks)", current + " ", failures - failures_at_begin);
      }

      bool record(bool result)
      {
        if (!result)
          ++failures;
        return result;
      }

      int exit_code() const
      {
        if (failures == 0)
          cr::out().log("{} tests: all passed", test_count);
        else
          cr::out().error("{} tests: {} failed checks", test_count, failures);
        return failures == 0 ? 0 : 1;
      }

    private:
      std::string current;
      unsigned failures = 0;
      unsigned failures_at_begin = 0;
      unsigned test_count = 0;
  };
}

#define T_CHECK(test, ...) declopt::test_helper::get().record(declopt::check::debug::d_check(test, __VA_ARGS__))

#define T_RUN(fnc) do { declopt::test_helper::get().begin(#fnc); fnc(); declopt::test_helper::get().end(); } while (0)

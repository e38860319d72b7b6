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

#include <cstdint>

#include "../debug/assert.hpp"

namespace declopt::cmdline
{
  /// \brief outcome of a parse. Any status other than success aborts the parse.
  enum class status : uint8_t
  {
    success,
    // an option-like token (-x, --x) matches no declared switch
    invalid_argument,
    // the parse function of a value option rejected its value
    value_conversion_failure,
    // a value option is the last token: there is no value to consume
    missing_value,
  };

  /// \brief error class for debug::on_error
  struct status_info
  {
    using error_type = status;

    static bool is_error(status code)
    {
      return code != status::success;
    }

    static const char* get_code_name(status code)
    {
      switch (code)
      {
        case status::success: return "success";
        case status::invalid_argument: return "invalid_argument";
        case status::value_conversion_failure: return "value_conversion_failure";
        case status::missing_value: return "missing_value";
      }
      return "[unknown status]";
    }

    static const char* get_description(status code)
    {
      switch (code)
      {
        case status::success: return "success";
        case status::invalid_argument: return "option-like argument that matches no declared switch";
        case status::value_conversion_failure: return "the value of an option could not be converted";
        case status::missing_value: return "an option that expects a value is the last argument";
      }
      return "[unknown status]";
    }
  };
}

namespace declopt::check
{
  using cmdline = declopt::debug::on_error<declopt::cmdline::status_info>;
}


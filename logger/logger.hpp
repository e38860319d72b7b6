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

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <mutex>
#include <source_location>
#include <string>


#ifndef DECLOPT_LOGGER_STRIP_DEBUG
  #define DECLOPT_LOGGER_STRIP_DEBUG 0
#endif


namespace declopt::cr
{
  /// \brief Logs to stderr (stdout is left to the program: banner, results)
  /// Each line is prefixed with a relative timestamp, the severity and the source location.
  class logger
  {
    public:
      enum class severity
      {
        debug,
        message,
        warning,
        error,
      };

      severity min_severity = severity::message;

      bool can_log(severity s) const
      {
        return (int)s >= (int)min_severity;
      }

      void log_str(severity s, const std::string& str, std::source_location loc = std::source_location::current());

      struct log_location_helper
      {
        logger& output;
        const std::source_location loc;

        template<typename... Args> using format_string = fmt::format_string<Args...>;

        template<typename... Args>
        void log_fmt(severity s, format_string<Args...> str, Args&& ... args)
        {
          if (!output.can_log(s))
            return;
          output.log_str(s, fmt::format(std::move(str), std::forward<Args>(args)...), loc);
        }

        template<typename... Args>
        void debug(format_string<Args...> str, Args&& ... args)
        {
#if !DECLOPT_LOGGER_STRIP_DEBUG
          log_fmt<Args...>(severity::debug, std::move(str), std::forward<Args>(args)...);
#endif
        }
        template<typename... Args>
        void log(format_string<Args...> str, Args&& ... args)
        {
          log_fmt<Args...>(severity::message, std::move(str), std::forward<Args>(args)...);
        }
        template<typename... Args>
        void warn(format_string<Args...> str, Args&& ... args)
        {
          log_fmt<Args...>(severity::warning, std::move(str), std::forward<Args>(args)...);
        }
        template<typename... Args>
        void error(format_string<Args...> str, Args&& ... args)
        {
          log_fmt<Args...>(severity::error, std::move(str), std::forward<Args>(args)...);
        }
      };

      log_location_helper operator()(std::source_location loc = std::source_location::current())
      {
        return { *this, loc };
      }

    private:
      // serializes the writes to stderr
      std::mutex lock;
  };

  logger& get_global_logger();
  logger::log_location_helper out(std::source_location loc = std::source_location::current());
}


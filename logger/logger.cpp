
#include "logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fmt/color.h>

#include "../chrono.hpp"
#include "../container_utils.hpp"

namespace declopt::cr
{
  namespace
  {
    const char* severity_abbr(logger::severity s)
    {
      switch (s)
      {
        case logger::severity::debug: return "DEBG";
        case logger::severity::message: return "MESG";
        case logger::severity::warning: return "WARN";
        case logger::severity::error: return "ERR";
      }
      return "????";
    }

    fmt::text_style severity_style(logger::severity s)
    {
      switch (s)
      {
        case logger::severity::debug: return fmt::fg(fmt::color::gray);
        case logger::severity::message: return {};
        case logger::severity::warning: return fmt::emphasis::bold | fmt::fg(fmt::color::orange);
        case logger::severity::error: return fmt::emphasis::bold | fmt::fg(fmt::color::red);
      }
      return {};
    }
  }

  logger& get_global_logger()
  {
    static logger out;
    return out;
  }
  logger::log_location_helper out(std::source_location loc)
  {
    return get_global_logger()(loc);
  }

  void logger::log_str(severity s, const std::string& str, std::source_location loc)
  {
    if (!can_log(s))
      return;

    const std::string path = std::filesystem::path(loc.file_name()).filename().string() + " ";
    const double timestamp = std::max(0.0, chrono::now_relative());
    const fmt::text_style style = severity_style(s);

    std::lock_guard<std::mutex> _lg(lock);
    for (const std::string& line : split_string(str, "\n"))
    {
      fmt::print(stderr, style, "[{:>12.6f}] [{:>4}] {:.<32}:{:>4}: {}", timestamp, severity_abbr(s), path, loc.line(), line);
      fmt::print(stderr, "\n"); // reset the style before the line break
    }
  }
}

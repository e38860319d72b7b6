
#include "switches.hpp"

#include <regex>

#include "../container_utils.hpp"

namespace declopt::cmdline
{
  std::string name_for(std::string_view sw)
  {
    for (std::string_view prefix : {"--no-", "--[no-]", "--", "-"})
    {
      if (sw.starts_with(prefix))
        return std::string(sw.substr(prefix.size()));
    }
    return std::string(sw);
  }

  std::vector<std::string> expand_switches(const std::vector<std::string>& switches, bool is_flag)
  {
    std::vector<std::string> ret;
    ret.reserve(switches.size() * 2);
    for (const std::string& sw : switches)
    {
      if (is_flag && is_negatable(sw))
      {
        ret.push_back(cr::replace_all(sw, k_negatable_marker, "no-"));
        ret.push_back(cr::replace_all(sw, k_negatable_marker, ""));
      }
      else if (is_flag && sw.starts_with("--"))
      {
        ret.push_back("--no-" + sw.substr(2));
        ret.push_back(sw);
      }
      else
      {
        ret.push_back(sw);
      }
    }
    return ret;
  }

  bool is_gnu_long_option(std::string_view token)
  {
    static const std::regex gnu_long_opt("^--[^ ]+=");
    return std::regex_search(token.begin(), token.end(), gnu_long_opt);
  }

  std::pair<std::string, std::string> split_gnu_long_option(std::string_view token)
  {
    const size_t eq_pos = token.find('=');
    if (eq_pos == std::string_view::npos)
      return { std::string(token), {} };
    return { std::string(token.substr(0, eq_pos)), std::string(token.substr(eq_pos + 1)) };
  }
}

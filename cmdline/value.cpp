
#include "value.hpp"

#include <fmt/ranges.h>

namespace declopt::cmdline
{
  namespace
  {
    struct value_to_string
    {
      std::string operator()(std::monostate) const { return {}; }
      std::string operator()(bool v) const { return v ? "true" : "false"; }
      std::string operator()(int64_t v) const { return fmt::format("{}", v); }
      std::string operator()(double v) const
      {
        // keep 1.0 distinct from the integer 1
        std::string ret = fmt::format("{}", v);
        if (ret.find_first_not_of("-0123456789") == std::string::npos)
          ret += ".0";
        return ret;
      }
      std::string operator()(const std::string& v) const { return v; }
      std::string operator()(const value::list& v) const { return fmt::format("[{}]", fmt::join(v, " ")); }
    };
  }

  std::string value::to_string() const
  {
    return std::visit(value_to_string{}, data);
  }
}

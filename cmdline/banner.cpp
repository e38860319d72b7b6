
#include "banner.hpp"

#include <algorithm>
#include <array>
#include <iterator>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace declopt::cmdline
{
  namespace
  {
    using row_t = std::array<std::string, 3>;

    row_t build_doc(const option& opt)
    {
      return
      {
        fmt::format("{}", fmt::join(opt.switches, ", ")),
        opt.default_value ? opt.default_value->to_string() : std::string(),
        opt.doc,
      };
    }

    // number of characters (utf-8 code points) of a cell
    size_t cell_width(const std::string& cell)
    {
      return (size_t)std::count_if(cell.begin(), cell.end(), [](char c) { return ((unsigned char)c & 0xC0) != 0x80; });
    }

    // pad with spaces to width characters
    std::string pad(const std::string& cell, size_t width)
    {
      return cell + std::string(width - cell_width(cell), ' ');
    }
  }

  std::string banner_for(const std::vector<option>& options)
  {
    std::vector<row_t> rows;
    rows.reserve(options.size() + 2);
    rows.push_back({"Switches", "Default", "Desc"});
    rows.push_back({"--------", "-------", "----"});
    for (const option& opt : options)
      rows.push_back(build_doc(opt));

    std::array<size_t, 3> widths = {0, 0, 0};
    for (const row_t& row : rows)
    {
      for (size_t i = 0; i < row.size(); ++i)
        widths[i] = std::max(widths[i], cell_width(row[i]));
    }

    std::string ret = "Usage:\n\n";
    for (const row_t& row : rows)
    {
      fmt::format_to(std::back_inserter(ret), " {}  {}  {} \n",
                     pad(row[0], widths[0]), pad(row[1], widths[1]), pad(row[2], widths[2]));
    }
    return ret;
  }
}

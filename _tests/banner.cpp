
#include "../cmdline/cmdline.hpp"
#include "../container_utils.hpp"
#include "../logger/logger.hpp"
#include "test_helper.hpp"

using namespace declopt;

void exact_layout()
{
  const std::vector<cmdline::option> opts = cmdline::compile_specs(
  {
    {"-p", "--port", "Port to listen on", cmdline::deflt(3000), cmdline::parse_with(cmdline::parsers::integer)},
    {"--[no-]verbose"},
  });

  const std::string expected =
    "Usage:\n"
    "\n"
    " Switches                 Default  Desc              \n"
    " --------                 -------  ----              \n"
    " -p, --port               3000     Port to listen on \n"
    " --no-verbose, --verbose  false                      \n";

  const std::string banner = cmdline::banner_for(opts);
  T_CHECK(banner == expected, "banner:\n{}", banner);
}

void columns_share_widths()
{
  const cmdline::parse_result res = cmdline::cli({},
  {
    {"-a", "Alpha", cmdline::deflt("a very long default value")},
    {"-b", "--beta-with-a-long-name", "B"},
    {"-c"},
  });

  std::vector<std::string> lines = cr::split_string(res.banner, "\n");
  T_CHECK(lines.size() >= 7, "line count: {}", lines.size());
  if (lines.size() < 7)
    return;

  T_CHECK(lines[0] == "Usage:" && lines[1].empty(), "header: {}", lines[0]);

  // header, separator and the three options:
  const size_t width = lines[2].size();
  for (size_t i = 2; i < 7; ++i)
    T_CHECK(lines[i].size() == width, "line {}: `{}` ({} != {})", i, lines[i], lines[i].size(), width);

  // the default column starts at the same place on every row
  const size_t default_column = lines[2].find("Default");
  T_CHECK(lines[3].substr(default_column, 7) == "-------", "separator: {}", lines[3]);
  T_CHECK(lines[4].substr(default_column).starts_with("a very long default value"), "row: {}", lines[4]);

  // the switches column is as wide as its widest cell
  T_CHECK(default_column == 1 + std::string_view("-b, --beta-with-a-long-name").size() + 2, "default column: {}", default_column);

  // options without a default or a doc have empty cells
  T_CHECK(lines[6].starts_with(" -c "), "row: {}", lines[6]);
  T_CHECK(lines[6].find_first_not_of(' ', 3) == std::string::npos, "empty cells: `{}`", lines[6]);
}

void widths_count_characters()
{
  // "Créer" is 6 bytes but 5 characters, the padding follows the characters
  const std::vector<cmdline::option> opts = cmdline::compile_specs(
  {
    {"-c", "Créer", cmdline::deflt(1.0)},
    {"-x", "Exit"},
  });

  const std::string expected =
    "Usage:\n"
    "\n"
    " Switches  Default  Desc  \n"
    " --------  -------  ----  \n"
    " -c        1.0      Créer \n"
    " -x                 Exit  \n";

  const std::string banner = cmdline::banner_for(opts);
  T_CHECK(banner == expected, "banner:\n{}", banner);
}

void empty_option_list()
{
  const std::string expected =
    "Usage:\n"
    "\n"
    " Switches  Default  Desc \n"
    " --------  -------  ---- \n";
  const std::string banner = cmdline::banner_for({});
  T_CHECK(banner == expected, "banner:\n{}", banner);
}

int main(int, char**)
{
  test_helper::setup();

  T_RUN(exact_layout);
  T_RUN(columns_share_widths);
  T_RUN(widths_count_characters);
  T_RUN(empty_option_list);

  return test_helper::get().exit_code();
}

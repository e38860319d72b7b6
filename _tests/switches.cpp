
#include "../cmdline/switches.hpp"
#include "../logger/logger.hpp"
#include "test_helper.hpp"

using namespace declopt;

using string_list = std::vector<std::string>;

void name_for_strips_prefixes()
{
  T_CHECK(cmdline::name_for("-p") == "p", "short switch");
  T_CHECK(cmdline::name_for("--port") == "port", "long switch");
  T_CHECK(cmdline::name_for("--no-verbose") == "verbose", "negative switch");
  T_CHECK(cmdline::name_for("--[no-]verbose") == "verbose", "negatable switch");
  // only the first matching prefix is removed
  T_CHECK(cmdline::name_for("---x") == "-x", "triple dash: {}", cmdline::name_for("---x"));
  T_CHECK(cmdline::name_for("--no-no-x") == "no-x", "double negation: {}", cmdline::name_for("--no-no-x"));
  T_CHECK(cmdline::name_for("plain") == "plain", "non-switch is kept as is");
}

void expand_negatable_flag()
{
  const string_list expected = {"--no-verbose", "--verbose"};
  const string_list result = cmdline::expand_switches({"--[no-]verbose"}, true);
  T_CHECK(result == expected, "got: {}", result);
}

void expand_long_flag_without_marker()
{
  const string_list expected = {"-d", "--no-debug", "--debug"};
  const string_list result = cmdline::expand_switches({"-d", "--debug"}, true);
  T_CHECK(result == expected, "got: {}", result);
}

void marker_on_short_switch_is_not_expanded()
{
  // only --[no-] switches get a negative form: no generated switch starts with -no-
  const string_list expected = {"-[no-]q", "--no-quiet", "--quiet"};
  const string_list result = cmdline::expand_switches({"-[no-]q", "--[no-]quiet"}, true);
  T_CHECK(result == expected, "got: {}", result);
  for (const std::string& sw : result)
    T_CHECK(!sw.starts_with("-no-"), "generated switch: {}", sw);
}

void value_switches_are_kept()
{
  const string_list expected = {"-p", "--port"};
  const string_list result = cmdline::expand_switches({"-p", "--port"}, false);
  T_CHECK(result == expected, "got: {}", result);

  // a marker on a non-flag option is not expanded
  const string_list marker = {"--[no-]thing"};
  T_CHECK(cmdline::expand_switches(marker, false) == marker, "marker kept for value options");
}

void token_classification()
{
  T_CHECK(cmdline::is_option("-x"), "-x");
  T_CHECK(cmdline::is_option("--"), "--");
  T_CHECK(cmdline::is_option("-"), "-");
  T_CHECK(!cmdline::is_option("x"), "x");
  T_CHECK(!cmdline::is_option(""), "empty");

  T_CHECK(cmdline::is_end_of_args("--"), "--");
  T_CHECK(!cmdline::is_end_of_args("---"), "---");

  T_CHECK(cmdline::is_negatable("--[no-]x"), "--[no-]x");
  T_CHECK(!cmdline::is_negatable("--x"), "--x");

  T_CHECK(cmdline::flag_value_for("--x"), "--x is true");
  T_CHECK(cmdline::flag_value_for("-x"), "-x is true");
  T_CHECK(!cmdline::flag_value_for("--no-x"), "--no-x is false");
}

void gnu_long_options()
{
  T_CHECK(cmdline::is_gnu_long_option("--port=9090"), "--port=9090");
  T_CHECK(cmdline::is_gnu_long_option("--port="), "--port=");
  T_CHECK(cmdline::is_gnu_long_option("--a=b=c"), "--a=b=c");
  T_CHECK(!cmdline::is_gnu_long_option("--port"), "--port");
  T_CHECK(!cmdline::is_gnu_long_option("-p=1"), "-p=1");
  T_CHECK(!cmdline::is_gnu_long_option("--my port=1"), "space before =");
  T_CHECK(!cmdline::is_gnu_long_option("--=1"), "no name");
  T_CHECK(!cmdline::is_gnu_long_option("port=1"), "not an option");

  const auto [name, arg_value] = cmdline::split_gnu_long_option("--a=b=c");
  T_CHECK(name == "--a", "name: {}", name);
  T_CHECK(arg_value == "b=c", "value: {}", arg_value);

  const auto [empty_name, empty_value] = cmdline::split_gnu_long_option("--port=");
  T_CHECK(empty_name == "--port", "name: {}", empty_name);
  T_CHECK(empty_value.empty(), "value: {}", empty_value);
}

int main(int, char**)
{
  test_helper::setup();

  T_RUN(name_for_strips_prefixes);
  T_RUN(expand_negatable_flag);
  T_RUN(expand_long_flag_without_marker);
  T_RUN(marker_on_short_switch_is_not_expanded);
  T_RUN(value_switches_are_kept);
  T_RUN(token_classification);
  T_RUN(gnu_long_options);

  return test_helper::get().exit_code();
}


#include "../cmdline/cmdline.hpp"
#include "../logger/logger.hpp"
#include "test_helper.hpp"

using namespace declopt;

using string_list = std::vector<std::string>;

void value_option()
{
  const cmdline::option opt = cmdline::compile_spec({"-p", "--port", "Port to listen on", cmdline::deflt(3000), cmdline::parse_with(cmdline::parsers::integer)});

  const string_list switches = {"-p", "--port"};
  const std::set<std::string> aliases = {"p", "port"};
  T_CHECK(opt.switches == switches, "switches: {}", opt.switches);
  T_CHECK(opt.aliases == aliases, "aliases: {}", opt.aliases);
  T_CHECK(opt.name == "port", "name: {}", opt.name);
  T_CHECK(opt.doc == "Port to listen on", "doc: {}", opt.doc);
  T_CHECK(!opt.is_flag, "not a flag");
  T_CHECK(opt.has_default() && *opt.default_value == cmdline::value(3000), "default: 3000");

  bool valid = true;
  const cmdline::value parsed = opt.parse("8080", valid);
  T_CHECK(valid && parsed == cmdline::value(8080), "parse: {}", parsed);
}

void identity_and_insertion_by_default()
{
  const cmdline::option opt = cmdline::compile_spec({"-o", "--output"});

  T_CHECK(opt.doc.empty(), "doc: {}", opt.doc);
  T_CHECK(!opt.has_default(), "value options have no default");

  bool valid = true;
  const cmdline::value parsed = opt.parse("file.txt", valid);
  T_CHECK(valid && parsed == cmdline::value("file.txt"), "identity: {}", parsed);

  cmdline::option_map map;
  opt.assign(map, opt.name, cmdline::value("a"));
  opt.assign(map, opt.name, cmdline::value("b"));
  T_CHECK(map.size() == 1 && map.at("output") == cmdline::value("b"), "plain insertion overwrites");
}

void negatable_flag()
{
  const cmdline::option opt = cmdline::compile_spec({"-v", "--[no-]verbose", "Be verbose"});

  const string_list switches = {"-v", "--no-verbose", "--verbose"};
  const std::set<std::string> aliases = {"v", "verbose"};
  T_CHECK(opt.is_flag, "last switch is negatable");
  T_CHECK(opt.switches == switches, "switches: {}", opt.switches);
  T_CHECK(opt.aliases == aliases, "aliases: {}", opt.aliases);
  T_CHECK(opt.name == "verbose", "name: {}", opt.name);
  T_CHECK(opt.has_default() && *opt.default_value == cmdline::value(false), "flags default to false");
}

void negatable_marker_must_be_last()
{
  // only the last switch decides if the option is a flag
  const cmdline::option opt = cmdline::compile_spec({"--[no-]verbose", "-v"});
  T_CHECK(!opt.is_flag, "marker is not on the last switch");
  T_CHECK(opt.name == "v", "name: {}", opt.name);
  T_CHECK(!opt.has_default(), "no default");
}

void explicit_flag()
{
  const cmdline::option opt = cmdline::compile_spec({"-d", "--debug", "Debug mode", cmdline::flag()});

  const string_list switches = {"-d", "--no-debug", "--debug"};
  T_CHECK(opt.is_flag, "explicit flag");
  T_CHECK(opt.switches == switches, "switches: {}", opt.switches);
  T_CHECK(opt.has_default() && *opt.default_value == cmdline::value(false), "flags default to false");
}

void explicit_values_win()
{
  const cmdline::option opt = cmdline::compile_spec({"--[no-]color", cmdline::deflt(true)});
  T_CHECK(opt.is_flag, "flag");
  T_CHECK(opt.has_default() && *opt.default_value == cmdline::value(true), "explicit default wins over the flag default");

  // flag(false) turns the record into a value option, the computed switches and default stay
  const cmdline::option not_flag = cmdline::compile_spec({"--[no-]color", cmdline::flag(false)});
  const string_list switches = {"--no-color", "--color"};
  T_CHECK(!not_flag.is_flag, "explicit flag(false) wins");
  T_CHECK(not_flag.switches == switches, "switches: {}", not_flag.switches);
  T_CHECK(not_flag.has_default() && *not_flag.default_value == cmdline::value(false), "default stays");

  // the last occurence wins
  const cmdline::option twice = cmdline::compile_spec({"-n", cmdline::deflt(1), cmdline::deflt(2)});
  T_CHECK(*twice.default_value == cmdline::value(2), "default: {}", *twice.default_value);
}

void custom_assign_and_extra()
{
  const cmdline::option opt = cmdline::compile_spec({"-I", "Include path", cmdline::assign_with(cmdline::assigners::append), cmdline::extra("required", true)});

  cmdline::option_map map;
  opt.assign(map, opt.name, cmdline::value("a"));
  opt.assign(map, opt.name, cmdline::value("b"));
  const cmdline::value expected = cmdline::value::list{"a", "b"};
  T_CHECK(map.at("I") == expected, "appended: {}", map.at("I"));

  T_CHECK(opt.extra.size() == 1 && opt.extra.at("required") == cmdline::value(true), "extra is carried");
}

void multiple_docs_keep_the_first()
{
  const cmdline::option opt = cmdline::compile_spec({"-x", "first", "second"});
  T_CHECK(opt.doc == "first", "doc: {}", opt.doc);
}

void malformed_specs_are_best_effort()
{
  // no switch: the record never matches, but is still built
  const cmdline::option no_switch = cmdline::compile_spec({"Just a doc", cmdline::deflt(1)});
  T_CHECK(no_switch.switches.empty(), "switches: {}", no_switch.switches);
  T_CHECK(no_switch.name.empty(), "name: {}", no_switch.name);
  T_CHECK(no_switch.doc == "Just a doc", "doc: {}", no_switch.doc);

  // strings after keyword tokens are ignored
  const cmdline::option trailing = cmdline::compile_spec({"-x", "doc", cmdline::deflt(1), "stray"});
  T_CHECK(trailing.doc == "doc", "doc: {}", trailing.doc);
  T_CHECK(*trailing.default_value == cmdline::value(1), "default: {}", *trailing.default_value);
}

void compile_specs_keeps_order()
{
  const std::vector<cmdline::option> opts = cmdline::compile_specs(
  {
    {"-a", "--alpha"},
    {"-b", "--[no-]beta"},
    {"-a", "--again"},
  });

  T_CHECK(opts.size() == 3, "count: {}", opts.size());
  T_CHECK(opts[0].name == "alpha" && opts[1].name == "beta" && opts[2].name == "again", "declaration order is kept");
}

int main(int, char**)
{
  test_helper::setup();

  T_RUN(value_option);
  T_RUN(identity_and_insertion_by_default);
  T_RUN(negatable_flag);
  T_RUN(negatable_marker_must_be_last);
  T_RUN(explicit_flag);
  T_RUN(explicit_values_win);
  T_RUN(custom_assign_and_extra);
  T_RUN(multiple_docs_keep_the_first);
  T_RUN(malformed_specs_are_best_effort);
  T_RUN(compile_specs_keeps_order);

  return test_helper::get().exit_code();
}


#include "../cmdline/cmdline.hpp"
#include "../logger/logger.hpp"
#include "test_helper.hpp"

using namespace declopt;

using string_list = std::vector<std::string>;

static const std::vector<cmdline::spec> server_specs =
{
  {"-p", "--port", "Port to listen on", cmdline::deflt(3000), cmdline::parse_with(cmdline::parsers::integer)},
  {"-h", "--host", "Host to bind to"},
  {"--[no-]verbose", "Print more things"},
};

void value_option_space_separated()
{
  const cmdline::parse_result res = cmdline::cli({"-p", "8080"}, server_specs);
  T_CHECK(!!res, "parse failed: {}", res.message);
  T_CHECK(res.options.at("port") == cmdline::value(8080), "port: {}", res.options.at("port"));
  T_CHECK(res.leftovers.empty(), "leftovers: {}", res.leftovers);
}

void value_option_gnu_style()
{
  const cmdline::parse_result res = cmdline::cli({"--port=9090"}, server_specs);
  T_CHECK(!!res, "parse failed: {}", res.message);
  T_CHECK(res.options.at("port") == cmdline::value(9090), "port: {}", res.options.at("port"));
  T_CHECK(res.leftovers.empty(), "leftovers: {}", res.leftovers);

  const cmdline::parse_result long_form = cmdline::cli({"--port", "9090"}, server_specs);
  T_CHECK(long_form.options == res.options, "--port=9090 is the same as --port 9090");

  const cmdline::parse_result with_equal = cmdline::cli({"--host=a=b"}, server_specs);
  T_CHECK(with_equal.options.at("host") == cmdline::value("a=b"), "split at the first =: {}", with_equal.options.at("host"));
}

void defaults()
{
  const cmdline::parse_result res = cmdline::cli({}, server_specs);
  T_CHECK(!!res, "parse failed: {}", res.message);
  // value option with a default, value option without default, flag
  T_CHECK(res.options.size() == 2, "options: {}", res.options.size());
  T_CHECK(res.options.at("port") == cmdline::value(3000), "port: {}", res.options.at("port"));
  T_CHECK(!res.options.contains("host"), "an option without default that is not given is not set");
  T_CHECK(res.options.at("verbose") == cmdline::value(false), "flags default to false");
}

void negatable_flags()
{
  const cmdline::parse_result off = cmdline::cli({"--no-verbose"}, server_specs);
  T_CHECK(off.options.at("verbose") == cmdline::value(false), "--no-verbose: {}", off.options.at("verbose"));

  const cmdline::parse_result on = cmdline::cli({"--verbose"}, server_specs);
  T_CHECK(on.options.at("verbose") == cmdline::value(true), "--verbose: {}", on.options.at("verbose"));

  const cmdline::parse_result last_wins = cmdline::cli({"--verbose", "--no-verbose"}, server_specs);
  T_CHECK(last_wins.options.at("verbose") == cmdline::value(false), "last one wins: {}", last_wins.options.at("verbose"));

  // a flag never consumes the next token
  const cmdline::parse_result next = cmdline::cli({"--verbose", "file"}, server_specs);
  const string_list expected = {"file"};
  T_CHECK(next.leftovers == expected, "leftovers: {}", next.leftovers);
}

void short_switch_with_marker()
{
  const std::vector<cmdline::spec> specs =
  {
    {"-[no-]q", "--[no-]quiet", "Quiet"},
  };

  const cmdline::parse_result short_negative = cmdline::cli({"-no-q"}, specs);
  T_CHECK(short_negative.code == cmdline::status::invalid_argument, "-no-q is not a switch: {}", short_negative.message);

  const cmdline::parse_result negative = cmdline::cli({"--no-quiet"}, specs);
  T_CHECK(!!negative, "parse failed: {}", negative.message);
  T_CHECK(negative.options.at("quiet") == cmdline::value(false), "--no-quiet: {}", negative.options.at("quiet"));

  const cmdline::parse_result positive = cmdline::cli({"--quiet"}, specs);
  T_CHECK(positive.options.at("quiet") == cmdline::value(true), "--quiet: {}", positive.options.at("quiet"));
}

void flag_with_default_true()
{
  const std::vector<cmdline::spec> specs =
  {
    {"-c", "--[no-]color", "Colored output", cmdline::deflt(true)},
  };
  T_CHECK(cmdline::cli({}, specs).options.at("color") == cmdline::value(true), "explicit default");
  T_CHECK(cmdline::cli({"-c"}, specs).options.at("color") == cmdline::value(true), "-c");
  T_CHECK(cmdline::cli({"--no-color"}, specs).options.at("color") == cmdline::value(false), "--no-color");
}

void explicit_flag_gets_a_negative_form()
{
  const std::vector<cmdline::spec> specs =
  {
    {"-d", "--debug", cmdline::flag()},
  };
  T_CHECK(cmdline::cli({"-d"}, specs).options.at("debug") == cmdline::value(true), "-d");
  T_CHECK(cmdline::cli({"--debug"}, specs).options.at("debug") == cmdline::value(true), "--debug");
  T_CHECK(cmdline::cli({"--no-debug"}, specs).options.at("debug") == cmdline::value(false), "--no-debug");
}

void leftovers_and_end_of_args()
{
  const cmdline::parse_result res = cmdline::cli({"a", "-p", "80", "b", "--", "-x", "c"}, server_specs);
  T_CHECK(!!res, "parse failed: {}", res.message);
  const string_list expected = {"a", "b", "-x", "c"};
  T_CHECK(res.leftovers == expected, "leftovers: {}", res.leftovers);
  T_CHECK(res.options.at("port") == cmdline::value(80), "port: {}", res.options.at("port"));

  // only the first -- is a marker
  const cmdline::parse_result twice = cmdline::cli({"--", "--", "-p"}, server_specs);
  const string_list expected_twice = {"--", "-p"};
  T_CHECK(twice.leftovers == expected_twice, "leftovers: {}", twice.leftovers);

  // the value of an option is never interpreted, even if it looks like an option
  const cmdline::parse_result dash_value = cmdline::cli({"-h", "--", "x"}, server_specs);
  const string_list expected_dash = {"x"};
  T_CHECK(dash_value.options.at("host") == cmdline::value("--"), "host: {}", dash_value.options.at("host"));
  T_CHECK(dash_value.leftovers == expected_dash, "leftovers: {}", dash_value.leftovers);
}

void invalid_argument()
{
  const cmdline::parse_result res = cmdline::cli({"a", "-p", "1", "--bogus"}, server_specs);
  T_CHECK(!res, "--bogus is not declared");
  T_CHECK(res.code == cmdline::status::invalid_argument, "code: {}", cmdline::status_info::get_code_name(res.code));
  T_CHECK(res.token == "--bogus", "token: {}", res.token);
  T_CHECK(res.message.find("--bogus") != std::string::npos, "message: {}", res.message);
  T_CHECK(res.options.empty() && res.leftovers.empty(), "no partial result");
  T_CHECK(!res.banner.empty(), "the banner is still available");

  const cmdline::parse_result single_dash = cmdline::cli({"-"}, server_specs);
  T_CHECK(single_dash.code == cmdline::status::invalid_argument, "- is option-like");

  const cmdline::parse_result gnu = cmdline::cli({"--bogus=1"}, server_specs);
  T_CHECK(gnu.code == cmdline::status::invalid_argument && gnu.token == "--bogus", "token: {}", gnu.token);
}

void value_conversion_failure()
{
  const cmdline::parse_result res = cmdline::cli({"-p", "eighty"}, server_specs);
  T_CHECK(res.code == cmdline::status::value_conversion_failure, "code: {}", cmdline::status_info::get_code_name(res.code));
  T_CHECK(res.token == "eighty", "token: {}", res.token);
  T_CHECK(res.message.find("eighty") != std::string::npos && res.message.find("-p") != std::string::npos, "message: {}", res.message);
  T_CHECK(res.options.empty() && res.leftovers.empty(), "no partial result");
}

void missing_value()
{
  const cmdline::parse_result res = cmdline::cli({"x", "--port"}, server_specs);
  T_CHECK(res.code == cmdline::status::missing_value, "code: {}", cmdline::status_info::get_code_name(res.code));
  T_CHECK(res.token == "--port", "token: {}", res.token);
  T_CHECK(res.options.empty() && res.leftovers.empty(), "no partial result");
}

void accumulating_option()
{
  const std::vector<cmdline::spec> specs =
  {
    {"-I", "--include", "Include paths", cmdline::deflt(cmdline::value::list{"/usr/include"}), cmdline::assign_with(cmdline::assigners::append)},
    {"-v", "Verbosity", cmdline::flag(), cmdline::assign_with(cmdline::assigners::count)},
  };

  const cmdline::parse_result res = cmdline::cli({"-I", "a", "-v", "--include=b", "-v", "-v"}, specs);
  T_CHECK(!!res, "parse failed: {}", res.message);
  const cmdline::value expected = cmdline::value::list{"/usr/include", "a", "b"};
  T_CHECK(res.options.at("include") == expected, "include: {}", res.options.at("include"));
  T_CHECK(res.options.at("v") == cmdline::value(3), "verbosity: {}", res.options.at("v"));

  const cmdline::parse_result none = cmdline::cli({}, specs);
  T_CHECK(none.options.at("v") == cmdline::value(0), "verbosity: {}", none.options.at("v"));
}

void custom_parse_and_assign()
{
  const std::vector<cmdline::spec> specs =
  {
    {
      "-k", "--key", "key=value pairs",
      cmdline::parse_with([](std::string_view raw, bool& valid) -> cmdline::value
      {
        const size_t pos = raw.find('=');
        valid = pos != std::string_view::npos;
        return std::string(raw.substr(0, pos));
      }),
      cmdline::assign_with([](cmdline::option_map& options, const std::string& name, cmdline::value v)
      {
        options[name + "." + v.as<std::string>()] = true;
      }),
    },
  };

  const cmdline::parse_result res = cmdline::cli({"-k", "a=1", "--key", "b=2"}, specs);
  T_CHECK(!!res, "parse failed: {}", res.message);
  T_CHECK(res.options.size() == 2 && res.options.contains("key.a") && res.options.contains("key.b"), "custom assign");

  const cmdline::parse_result bad = cmdline::cli({"-k", "nope"}, specs);
  T_CHECK(bad.code == cmdline::status::value_conversion_failure, "custom parse failure");
}

void first_declared_match_wins()
{
  const std::vector<cmdline::spec> specs =
  {
    {"-o", "--output"},
    {"-o", "--other"},
  };
  const cmdline::parse_result res = cmdline::cli({"-o", "x"}, specs);
  T_CHECK(res.options.contains("output") && !res.options.contains("other"), "first declaration wins");
}

void matcher_splits_gnu_options()
{
  const std::vector<cmdline::option> opts = cmdline::compile_specs(server_specs);

  std::deque<std::string> tokens = {"--port=1", "rest"};
  const cmdline::match_result match = cmdline::match_option(tokens, opts);
  const std::deque<std::string> expected = {"--port", "1", "rest"};
  T_CHECK(match.key == "--port", "key: {}", match.key);
  T_CHECK(match.opt == &opts[0], "matched the port option");
  T_CHECK(tokens == expected, "tokens: {}", tokens);

  std::deque<std::string> positional = {"file"};
  const cmdline::match_result no_match = cmdline::match_option(positional, opts);
  T_CHECK(no_match.key == "file" && no_match.opt == nullptr, "no match");
  T_CHECK(positional.size() == 1, "tokens are kept");
}

void default_extractor()
{
  const std::vector<cmdline::option> opts = cmdline::compile_specs(server_specs);
  const cmdline::option_map defaults = cmdline::default_values_for(opts);
  T_CHECK(defaults.size() == 2 && defaults.at("port") == cmdline::value(3000) && defaults.at("verbose") == cmdline::value(false), "defaults");
}

void parse_from_argv()
{
  char prog[] = "prog";
  char port[] = "--port=42";
  char param[] = "file";
  char* argv[] = { prog, port, param };

  const cmdline::parse_result res = cmdline::cli(3, argv, server_specs);
  const string_list expected = {"file"};
  T_CHECK(!!res, "parse failed: {}", res.message);
  T_CHECK(res.options.at("port") == cmdline::value(42), "port: {}", res.options.at("port"));
  T_CHECK(res.leftovers == expected, "the program name is skipped: {}", res.leftovers);

  cmdline::parse cmd(3, argv);
  T_CHECK(cmd.has_remaining_args(), "remaining args");
  T_CHECK(cmd.skip(1), "skip --port=42");
  const cmdline::parse_result skipped = cmd.process(server_specs);
  T_CHECK(skipped.options.at("port") == cmdline::value(3000), "port: {}", skipped.options.at("port"));
  T_CHECK(!cmd.has_remaining_args(), "every arg is consumed");
}

void status_checks()
{
  const cmdline::parse_result res = cmdline::cli({"--bogus"}, server_specs);
  // d_check_code logs the failure and gives the status back
  T_CHECK(check::cmdline::d_check_code(res.code, "parse") == cmdline::status::invalid_argument, "status is returned as is");
  T_CHECK(cmdline::status_info::is_error(res.code), "is an error");
  T_CHECK(!cmdline::status_info::is_error(cmdline::status::success), "success is not an error");
  T_CHECK(std::string_view(cmdline::status_info::get_code_name(cmdline::status::missing_value)) == "missing_value", "code name");
}

int main(int, char**)
{
  // the parser warns about invalid args, only keep errors
  test_helper::setup(cr::logger::severity::error);

  T_RUN(value_option_space_separated);
  T_RUN(value_option_gnu_style);
  T_RUN(defaults);
  T_RUN(negatable_flags);
  T_RUN(short_switch_with_marker);
  T_RUN(flag_with_default_true);
  T_RUN(explicit_flag_gets_a_negative_form);
  T_RUN(leftovers_and_end_of_args);
  T_RUN(invalid_argument);
  T_RUN(value_conversion_failure);
  T_RUN(missing_value);
  T_RUN(accumulating_option);
  T_RUN(custom_parse_and_assign);
  T_RUN(first_declared_match_wins);
  T_RUN(matcher_splits_gnu_options);
  T_RUN(default_extractor);
  T_RUN(parse_from_argv);
  T_RUN(status_checks);

  return test_helper::get().exit_code();
}

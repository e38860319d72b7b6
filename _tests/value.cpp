
#include "../cmdline/value.hpp"
#include "../cmdline/option.hpp"
#include "../logger/logger.hpp"
#include "test_helper.hpp"

#include <limits>

using namespace declopt;

void value_types()
{
  T_CHECK(cmdline::value().empty(), "default value is empty");
  T_CHECK(cmdline::value(true).is<bool>(), "bool");
  T_CHECK(cmdline::value(42).is<int64_t>(), "int is stored as int64_t");
  T_CHECK(cmdline::value(uint16_t(42)).is<int64_t>(), "uint16_t is stored as int64_t");
  T_CHECK(cmdline::value(1.5f).is<double>(), "float is stored as double");
  T_CHECK(cmdline::value("str").is<std::string>(), "const char* is a string");
  T_CHECK(cmdline::value(std::string_view("str")).is<std::string>(), "string_view is a string");
  T_CHECK(cmdline::value(cmdline::value::list{}).is<cmdline::value::list>(), "list");

  const cmdline::value v = 42;
  T_CHECK(v.as<int64_t>() == 42, "as<int64_t>");
  T_CHECK(v.get_if<std::string>() == nullptr, "get_if with the wrong type");
  T_CHECK(v != cmdline::value("42"), "different types are different");
}

void value_to_string()
{
  T_CHECK(cmdline::value().to_string().empty(), "empty");
  T_CHECK(cmdline::value(false).to_string() == "false", "false");
  T_CHECK(cmdline::value(true).to_string() == "true", "true");
  T_CHECK(cmdline::value(3000).to_string() == "3000", "3000");
  T_CHECK(cmdline::value(-7).to_string() == "-7", "-7");
  T_CHECK(cmdline::value(1.5).to_string() == "1.5", "{}", cmdline::value(1.5));
  // a double stays distinguishable from an integer
  T_CHECK(cmdline::value(1.0).to_string() == "1.0", "{}", cmdline::value(1.0));
  T_CHECK(cmdline::value(-3.0).to_string() == "-3.0", "{}", cmdline::value(-3.0));
  T_CHECK(cmdline::value(0.0).to_string() == "0.0", "{}", cmdline::value(0.0));
  T_CHECK(cmdline::value("localhost").to_string() == "localhost", "string");

  const cmdline::value lst = cmdline::value::list{1, "two", false};
  T_CHECK(lst.to_string() == "[1 two false]", "{}", lst);
  T_CHECK(fmt::format("<{}>", lst) == "<[1 two false]>", "formatter");
}

void builtin_parsers()
{
  bool valid = false;
  T_CHECK(cmdline::parsers::identity("abc", valid) == cmdline::value("abc"), "identity");

  valid = false;
  T_CHECK(cmdline::parsers::integer("8080", valid) == cmdline::value(8080) && valid, "integer");
  T_CHECK(cmdline::parsers::integer("-12", valid) == cmdline::value(-12) && valid, "negative integer");

  cmdline::parsers::integer("80a", valid);
  T_CHECK(!valid, "trailing characters");
  cmdline::parsers::integer("abc", valid);
  T_CHECK(!valid, "not a number");
  cmdline::parsers::integer("", valid);
  T_CHECK(!valid, "empty");
  cmdline::parsers::integer("99999999999999999999999", valid);
  T_CHECK(!valid, "out of range");

  T_CHECK(cmdline::parsers::number("2.5", valid) == cmdline::value(2.5) && valid, "number");
  T_CHECK(cmdline::parsers::boolean("true", valid) == cmdline::value(true) && valid, "boolean: true");
  T_CHECK(cmdline::parsers::boolean("0", valid) == cmdline::value(false) && valid, "boolean: 0");
  cmdline::parsers::boolean("yes", valid);
  T_CHECK(!valid, "boolean: yes");

  T_CHECK(cmdline::parsers::from<uint8_t>("255", valid) == cmdline::value(255) && valid, "uint8: 255");
  cmdline::parsers::from<uint8_t>("256", valid);
  T_CHECK(!valid, "uint8: 256");
  cmdline::parsers::from<uint32_t>("-1", valid);
  T_CHECK(!valid, "uint32: -1");

  // values are stored as int64_t: larger unsigned values are rejected instead of wrapping
  const cmdline::value max_i64 = cmdline::parsers::from<uint64_t>("9223372036854775807", valid);
  T_CHECK(valid && max_i64 == cmdline::value(std::numeric_limits<int64_t>::max()), "uint64: int64 max: {}", max_i64);
  const cmdline::value too_big = cmdline::parsers::from<uint64_t>("9223372036854775808", valid);
  T_CHECK(!valid && too_big.empty(), "uint64: int64 max + 1: {}", too_big);
  cmdline::parsers::from<uint64_t>("18446744073709551615", valid);
  T_CHECK(!valid, "uint64: uint64 max");
}

void builtin_assigners()
{
  cmdline::option_map map;

  cmdline::assigners::insert(map, "x", 1);
  cmdline::assigners::insert(map, "x", 2);
  T_CHECK(map.at("x") == cmdline::value(2), "insert: {}", map.at("x"));

  // append: starts from nothing, a scalar or a list, list values are flattened
  cmdline::assigners::append(map, "a", "first");
  cmdline::assigners::append(map, "a", "second");
  const cmdline::value expected_a = cmdline::value::list{"first", "second"};
  T_CHECK(map.at("a") == expected_a, "append: {}", map.at("a"));

  cmdline::assigners::append(map, "x", 3);
  const cmdline::value expected_x = cmdline::value::list{2, 3};
  T_CHECK(map.at("x") == expected_x, "append to a scalar: {}", map.at("x"));

  cmdline::assigners::append(map, "l", cmdline::value::list{});
  T_CHECK(map.at("l") == cmdline::value(cmdline::value::list{}), "append an empty list: {}", map.at("l"));
  cmdline::assigners::append(map, "l", cmdline::value::list{4, 5});
  const cmdline::value expected_l = cmdline::value::list{4, 5};
  T_CHECK(map.at("l") == expected_l, "append a list: {}", map.at("l"));

  // count: false is not counted
  cmdline::assigners::count(map, "v", false);
  T_CHECK(map.at("v") == cmdline::value(0), "count from false: {}", map.at("v"));
  cmdline::assigners::count(map, "v", true);
  cmdline::assigners::count(map, "v", true);
  T_CHECK(map.at("v") == cmdline::value(2), "count: {}", map.at("v"));
}

int main(int, char**)
{
  // conversion failures are logged as warnings, keep the output for the test results
  test_helper::setup(cr::logger::severity::error);

  T_RUN(value_types);
  T_RUN(value_to_string);
  T_RUN(builtin_parsers);
  T_RUN(builtin_assigners);

  return test_helper::get().exit_code();
}

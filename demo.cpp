
#include <fmt/format.h>

#include "cmdline/cmdline.hpp"
#include "logger/logger.hpp"

using namespace declopt;

int main(int argc, char** argv)
{
  const cmdline::parse_result res = cmdline::cli(argc, argv,
  {
    {"-p", "--port", "Port to listen on", cmdline::deflt(3000), cmdline::parse_with(cmdline::parsers::from<uint16_t>)},
    {"-h", "--host", "Host to bind to", cmdline::deflt("localhost")},
    {"-I", "--include", "Include path (can be repeated)", cmdline::deflt(cmdline::value::list{}), cmdline::assign_with(cmdline::assigners::append)},
    {"-v", "Verbosity (can be repeated)", cmdline::flag(), cmdline::assign_with(cmdline::assigners::count)},
    {"--[no-]color", "Colored output", cmdline::deflt(true)},
    {"--help", "Print this help", cmdline::flag()},
  });

  if (!res)
  {
    // output the different options and exit:
    cr::out().error("{}", res.message);
    fmt::print("{}", res.banner);
    return 1;
  }

  if (res.options.at("help").as<bool>())
  {
    fmt::print("{}", res.banner);
    return 0;
  }

  if (res.options.at("v").as<int64_t>() > 0)
    cr::get_global_logger().min_severity = cr::logger::severity::debug;

  for (const auto& [name, val] : res.options)
    cr::out().log("option {}: {}", name, val);
  cr::out().log("parameters: {}", res.leftovers);
  return 0;
}

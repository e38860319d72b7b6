
#include "../logger/logger.hpp"
#include "test_helper.hpp"

using namespace declopt;

namespace
{
  // a type whose formatting logs: the message is built before the logger writes anything
  struct chatty
  {
    int id;
  };
}

template<> struct fmt::formatter<chatty> : fmt::formatter<int>
{
  template <typename FormatContext>
  auto format(const chatty& c, FormatContext& ctx) const
  {
    cr::out().warn("formatting chatty #{}", c.id);
    return fmt::formatter<int>::format(c.id, ctx);
  }
};

void nested_logging_returns()
{
  cr::out().warn("outer message with {}", chatty{1});
  cr::out().warn("multi-line message\nwith {}\non three lines", chatty{2});
  T_CHECK(true, "logging from inside a log call did not block");
}

void severity_filter()
{
  cr::logger& logger = cr::get_global_logger();
  const cr::logger::severity previous = logger.min_severity;

  logger.min_severity = cr::logger::severity::warning;
  T_CHECK(!logger.can_log(cr::logger::severity::debug), "debug is filtered");
  T_CHECK(!logger.can_log(cr::logger::severity::message), "message is filtered");
  T_CHECK(logger.can_log(cr::logger::severity::warning), "warning passes");
  T_CHECK(logger.can_log(cr::logger::severity::error), "error passes");

  // filtered messages are never formatted
  cr::out().log("filtered {}", chatty{3});

  logger.min_severity = previous;
}

int main(int, char**)
{
  test_helper::setup(cr::logger::severity::warning);

  T_RUN(nested_logging_returns);
  T_RUN(severity_filter);

  return test_helper::get().exit_code();
}

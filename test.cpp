// C++ file that only does include headers and enable the static_assert checks

#include "cmdline/switches.hpp"
#include "cmdline/errors.hpp"

static_assert(declopt::cmdline::is_option("-p"), "is_option: BAD");
static_assert(declopt::cmdline::is_option("--"), "is_option: BAD");
static_assert(!declopt::cmdline::is_option("p"), "is_option: BAD");
static_assert(!declopt::cmdline::is_option(""), "is_option: BAD");

static_assert(declopt::cmdline::is_negatable("--[no-]verbose"), "is_negatable: BAD");
static_assert(!declopt::cmdline::is_negatable("-[no-]v"), "is_negatable: BAD");
static_assert(!declopt::cmdline::is_negatable("--verbose"), "is_negatable: BAD");

static_assert(declopt::cmdline::is_end_of_args("--"), "is_end_of_args: BAD");
static_assert(!declopt::cmdline::is_end_of_args("-"), "is_end_of_args: BAD");

static_assert(declopt::cmdline::flag_value_for("--verbose"), "flag_value_for: BAD");
static_assert(declopt::cmdline::flag_value_for("-n"), "flag_value_for: BAD");
static_assert(!declopt::cmdline::flag_value_for("--no-verbose"), "flag_value_for: BAD");
// the negation is read on the literal switch, not the canonical name
static_assert(declopt::cmdline::flag_value_for("--nothing"), "flag_value_for: BAD");

static_assert((int)declopt::cmdline::status::success == 0, "status: BAD");

//
// created by : Timothée Feuillet
// date: 2021-12-11
//
//
// Copyright (c) 2021 Timothée Feuillet
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//

#pragma once

#include "value.hpp"
#include "option.hpp"
#include "errors.hpp"
#include "switches.hpp"
#include "spec_compiler.hpp"
#include "banner.hpp"
#include "parse.hpp"

// cmdline parsing:
//  options are declared with specs, a list of tokens:
//
//    {"-p", "--port", "Port to listen on", cmdline::deflt(3000), cmdline::parse_with(cmdline::parsers::integer)}
//
//  - the switches come first (strings starting with -)
//  - then an optional doc string
//  - then keyword tokens: deflt, parse_with, flag, assign_with, extra
//
// The supported command line format is the following:
//
// [--opts | params]... [--] [params]
//
// value options are either `-x value`, `--opt value` or `--opt=value`
// flags are declared as --[no-]opt and accept --opt and --no-opt (or are forced with cmdline::flag())
// params (and everything after `--`) are returned in order, as leftovers.
//
// cmdline::cli() returns the option map, the leftovers and the usage banner.
//
namespace declopt::cmdline
{
}

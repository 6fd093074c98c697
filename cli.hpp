/*
  Copyright 2008-2013 Kristopher R Beevers.

  Permission is hereby granted, free of charge, to any person
  obtaining a copy of this software and associated documentation files
  (the "Software"), to deal in the Software without restriction,
  including without limitation the rights to use, copy, modify, merge,
  publish, distribute, sublicense, and/or sell copies of the Software,
  and to permit persons to whom the Software is furnished to do so,
  subject to the following conditions:

  The above copyright notice and this permission notice shall be
  included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
  EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
  MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
  NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS
  BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN
  ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
  CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

/*!
  \file cli.hpp

  \brief Commandline handling: registers slice's options, turns argv
  into an invocation_t and runs it.
 */

#ifndef _SLICE_CLI_HPP
#define _SLICE_CLI_HPP

#include <stdio.h>
#include <stdint.h>
#include <iostream>
#include <string>
#include "range_reader.hpp"

namespace slice
{

  struct invocation_t
  {
    invocation_t() : verbose(false), legacy_escapes(false), help(false) {}

    std::string path;
    byte_range_t range;
    std::string format;
    bool verbose;
    bool legacy_escapes;
    bool help;
  };

  // register (or reset to defaults) all commandline options
  void register_options();

  // throws argument_error or unknown_format_error; when help is set
  // nothing else is validated
  invocation_t parse_command_line(int argc, char **argv);

  // decimal, 0x hex or 0 octal; what names the value in error messages
  int64_t parse_integer(const std::string &text, const char *what);

  void print_usage(const char *prog, std::ostream &out);

  // open the input, encode the range to out and flush
  void run(const invocation_t &inv, FILE *out);

};

#endif // _SLICE_CLI_HPP

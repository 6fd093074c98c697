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

/*

  slice

  Outputs a byte range of a binary file in one of several formats:
  raw bytes, hex, a hex dump, C/C++ literals, base64 or a digest.

    slice -o 0x200 -s 64 -f cstringSafe firmware.bin

 */

#include <stdio.h>
#include <iostream>
#include "cli.hpp"

int main(int argc, char **argv)
{
  try {
    slice::invocation_t inv = slice::parse_command_line(argc, argv);
    if(inv.help) {
      slice::print_usage(argv[0], std::cerr);
      return 1;
    }
    slice::run(inv, stdout);
  } catch(const std::exception &e) {
    fflush(stdout);
    // not through log(): scripts match this line, so it has no timestamp
    fprintf(stderr, "ERROR: %s\n", e.what());
    return 1;
  }
  return 0;
}

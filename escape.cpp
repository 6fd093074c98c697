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

#include "escape.hpp"
#include <stdio.h>

namespace slice
{

  const char *const literal_break = "\" \"";

  struct named_escape_t
  {
    unsigned char byte;
    const char *text;
  };

  static const named_escape_t named_escapes[] = {
    { '\a', "\\a" },
    { '\b', "\\b" },
    { '\f', "\\f" },
    { '\n', "\\n" },
    { '\r', "\\r" },
    { '\t', "\\t" },
    { '\v', "\\v" },
    { '\\', "\\\\" },
    { '"',  "\\\"" },
  };

  escape_t classify(unsigned char b, unsigned char printable_min)
  {
    escape_t e;
    e.is_hex = false;

    for(size_t i = 0; i < sizeof(named_escapes) / sizeof(named_escapes[0]); ++i)
      if(named_escapes[i].byte == b) {
	e.text = named_escapes[i].text;
	return e;
      }

    if(printable_min <= b && b <= printable_max) {
      e.text.assign(1, (char)b);
      return e;
    }

    char hex[5];
    snprintf(hex, sizeof(hex), "\\x%02x", b);
    e.text = hex;
    e.is_hex = true;
    return e;
  }

  cstring_state_t cstring_step(cstring_state_t state, const escape_t &e, std::string &out)
  {
    if(state.last_was_hex && !e.is_hex)
      out.append(literal_break);
    out.append(e.text);
    state.last_was_hex = e.is_hex;
    return state;
  }

};

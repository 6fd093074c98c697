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
  \file escape.hpp

  \brief Rendering single bytes as C string literal fragments, and the
  state carried by the splitting C string encoder.

  Hex escapes in C are variable length: "\xab1" is one escape, not
  "\xab" followed by '1'.  The splitting encoder therefore closes the
  literal and opens a new one (" ") whenever a hex escape is followed
  by anything other than another hex escape.
 */

#ifndef _SLICE_ESCAPE_HPP
#define _SLICE_ESCAPE_HPP

#include <string>

namespace slice
{

  // lowest byte value written literally
  const unsigned char printable_min_conventional = 0x20;
  // the bound older releases used (decimal 20); lets 0x14-0x1f through
  // unescaped
  const unsigned char printable_min_legacy = 20;
  const unsigned char printable_max = 0x7e;

  struct escape_t
  {
    std::string text;
    bool is_hex;
  };

  escape_t classify(unsigned char b, unsigned char printable_min = printable_min_conventional);

  // one bit of state threaded through the splitting encoder
  struct cstring_state_t
  {
    cstring_state_t() : last_was_hex(false) {}
    bool last_was_hex;
  };

  // append e to out, inserting a literal break first if e would
  // otherwise follow a hex escape; returns the new state
  cstring_state_t cstring_step(cstring_state_t state, const escape_t &e, std::string &out);

  // the text inserted between two literal segments
  extern const char *const literal_break;

};

#endif // _SLICE_ESCAPE_HPP

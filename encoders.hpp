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
  \file encoders.hpp

  \brief The output formats.  Each encoder consumes a byte_reader once,
  start to finish, and writes its rendering to out.  Read failures
  propagate as io_error, short writes throw io_error too.  Nothing is
  kept between calls.
 */

#ifndef _SLICE_ENCODERS_HPP
#define _SLICE_ENCODERS_HPP

#include <stdio.h>
#include "escape.hpp"
#include "range_reader.hpp"

namespace slice
{

  struct encoder_config_t
  {
    encoder_config_t() : printable_min(printable_min_conventional) {}

    // lowest byte written literally by encode_cstring_safe
    unsigned char printable_min;
  };

  typedef void (*encoder_fn)(byte_reader &in, FILE *out, const encoder_config_t &cfg);

  // bytes unchanged
  void encode_raw(byte_reader &in, FILE *out, const encoder_config_t &cfg);

  // lowercase hex pairs, then a newline
  void encode_hex(byte_reader &in, FILE *out, const encoder_config_t &cfg);

  // 16 bytes per line: offset, hex columns, |ascii|
  void encode_dump(byte_reader &in, FILE *out, const encoder_config_t &cfg);

  // {0x00, 0x01, ...}
  void encode_array_literal(byte_reader &in, FILE *out, const encoder_config_t &cfg);

  // "..." with named escapes and fixed-width octal escapes
  void encode_string_literal(byte_reader &in, FILE *out, const encoder_config_t &cfg);

  // "\x00\x01..." -- every byte hex escaped
  void encode_cstring(byte_reader &in, FILE *out, const encoder_config_t &cfg);

  // shortest unambiguous C literal; splits into adjacent literals
  // after hex escapes
  void encode_cstring_safe(byte_reader &in, FILE *out, const encoder_config_t &cfg);

  // standard alphabet, padded, one line
  void encode_base64(byte_reader &in, FILE *out, const encoder_config_t &cfg);

  void encode_md5(byte_reader &in, FILE *out, const encoder_config_t &cfg);
  void encode_sha256(byte_reader &in, FILE *out, const encoder_config_t &cfg);

  // write helpers; throw io_error on a short write
  void write_bytes(FILE *out, const void *data, size_t len);
  void write_string(FILE *out, const std::string &s);

};

#endif // _SLICE_ENCODERS_HPP

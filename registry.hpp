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
  \file registry.hpp

  \brief Static table of output formats.  Names are a stable contract
  with users and scripts; older names are kept as aliases.
 */

#ifndef _SLICE_REGISTRY_HPP
#define _SLICE_REGISTRY_HPP

#include <string>
#include <vector>
#include "encoders.hpp"

namespace slice
{

  enum format_id
  {
    FORMAT_RAW,
    FORMAT_HEX,
    FORMAT_DUMP,
    FORMAT_ARRAY_LITERAL,
    FORMAT_STRING_LITERAL,
    FORMAT_CSTRING,
    FORMAT_CSTRING_SAFE,
    FORMAT_BASE64,
    FORMAT_MD5,
    FORMAT_SHA256
  };

  struct format_t
  {
    format_id id;
    const char *name;
    const char *description;
    encoder_fn encode;
  };

  extern const char *const default_format;

  // look up a format by name or alias; throws unknown_format_error
  const format_t & resolve(const std::string &name);

  // all formats, in registration order
  const std::vector<format_t> & formats();

  // "raw, hex, dump, ..."
  std::string format_names();

};

#endif // _SLICE_REGISTRY_HPP

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
  \file errors.hpp

  \brief Exceptions thrown by slice.  Everything derives from
  slice::error so the commandline driver can catch a single type,
  print the message and exit non-zero.
 */

#ifndef _SLICE_ERRORS_HPP
#define _SLICE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace slice
{

  struct error : public std::runtime_error
  {
    explicit error(const std::string &what) : std::runtime_error(what) {}
  };

  // cannot position the input at the requested offset
  struct range_error : public error
  {
    explicit range_error(const std::string &what) : error(what) {}
  };

  // format name is not in the registry
  struct unknown_format_error : public error
  {
    explicit unknown_format_error(const std::string &what) : error(what) {}
  };

  // read/write failure on the input or the output
  struct io_error : public error
  {
    explicit io_error(const std::string &what) : error(what) {}
  };

  // bad commandline or configuration file
  struct argument_error : public error
  {
    explicit argument_error(const std::string &what) : error(what) {}
  };

};

#endif // _SLICE_ERRORS_HPP

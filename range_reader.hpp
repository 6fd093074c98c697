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
  \file range_reader.hpp

  \brief Bounded reading of a byte range out of a seekable file.
  Encoders consume a byte_reader; file_range_reader positions a FILE
  at an offset and stops handing out bytes once the requested length
  has been delivered.
 */

#ifndef _SLICE_RANGE_READER_HPP
#define _SLICE_RANGE_READER_HPP

#include <stdio.h>
#include <stddef.h>
#include <stdint.h>
#include <string>

namespace slice
{

  // length == -1 means "read to the end of the file"
  struct byte_range_t
  {
    byte_range_t() : offset(0), length(-1) {}
    byte_range_t(int64_t o, int64_t l) : offset(o), length(l) {}

    int64_t offset;
    int64_t length;
  };

  class byte_reader
  {
  public:
    virtual ~byte_reader() {}

    // read up to len bytes into buf; returns 0 at end of stream,
    // throws io_error on failure
    virtual size_t read(unsigned char *buf, size_t len) = 0;
  };

  class file_range_reader : public byte_reader
  {
  public:
    // seeks f to range.offset; throws range_error if that's not
    // possible.  f is not owned.
    file_range_reader(FILE *f, const byte_range_t &range);

    virtual size_t read(unsigned char *buf, size_t len);

    // bytes handed out so far
    uint64_t delivered() const { return delivered_; }

  private:
    FILE *f_;
    byte_range_t range_;
    uint64_t delivered_;
  };

  // owns an input file opened for binary reading; closed on
  // destruction
  class input_file
  {
  public:
    explicit input_file(const std::string &path);
    ~input_file();

    FILE * get() const { return f_; }
    const std::string & path() const { return path_; }

  private:
    input_file(const input_file &);
    input_file & operator=(const input_file &);

    std::string path_;
    FILE *f_;
  };

};

#endif // _SLICE_RANGE_READER_HPP

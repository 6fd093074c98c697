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

#include "range_reader.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <errno.h>
#include <string.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <inttypes.h>

namespace slice
{

  static std::string format_offset(int64_t offset)
  {
    char buf[32];
    snprintf(buf, sizeof(buf), "0x%" PRIX64, (uint64_t)offset);
    return buf;
  }

  file_range_reader::file_range_reader(FILE *f, const byte_range_t &range)
    : f_(f), range_(range), delivered_(0)
  {
    if(range_.offset < 0)
      throw range_error("could not seek to negative offset");

    // seeking past the end of a regular file succeeds, so check the
    // size first
    int fd = fileno(f_);
    struct stat st;
    if(fd >= 0 && fstat(fd, &st) == 0 && S_ISREG(st.st_mode) &&
       range_.offset > (int64_t)st.st_size)
      throw range_error("could not seek to offset " + format_offset(range_.offset) +
			", file is only " + format_offset(st.st_size) + " bytes long");

    if(fseeko(f_, (off_t)range_.offset, SEEK_SET) != 0)
      throw range_error("could not seek to offset " + format_offset(range_.offset) +
			", reason: " + strerror(errno));

    debug("positioned input at offset %" PRId64 ", length %" PRId64,
	  range_.offset, range_.length);
  }

  size_t file_range_reader::read(unsigned char *buf, size_t len)
  {
    if(range_.length >= 0) {
      uint64_t left = (uint64_t)range_.length - delivered_;
      if(left == 0)
	return 0; // bound reached, don't touch the file again
      if(len > left)
	len = (size_t)left;
    }
    if(len == 0)
      return 0;

    size_t rv = fread(buf, 1, len, f_);
    if(rv < len && ferror(f_))
      throw io_error(std::string("read failed: ") + strerror(errno));
    delivered_ += rv;
    return rv;
  }


  input_file::input_file(const std::string &path)
    : path_(path), f_(0)
  {
    f_ = fopen(path_.c_str(), "rb");
    if(!f_)
      throw io_error("could not open file " + path_ + ", reason: " + strerror(errno));
  }

  input_file::~input_file()
  {
    if(f_)
      fclose(f_);
  }

};

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

#include "log.hpp"
#include <stdarg.h>
#include <time.h>

namespace slice
{

  static bool verbose_logging = false;
  static FILE *log_output = 0;

  static void vlog(const char *fmt, va_list args)
  {
    FILE *out = log_output ? log_output : stderr;
    char timestamp[100];
    time_t t = time(0);
    struct tm tmp;
    localtime_r(&t, &tmp);
    strftime(timestamp, 100, "%m/%d/%Y %H:%M:%S", &tmp);
    fprintf(out, "[%s] ", timestamp);
    vfprintf(out, fmt, args);
    fprintf(out, "\n");
  }

  void log(const char *fmt, ...)
  {
    va_list args;
    va_start(args, fmt);
    vlog(fmt, args);
    va_end(args);
  }

  void debug(const char *fmt, ...)
  {
    if(!verbose_logging)
      return;
    va_list args;
    va_start(args, fmt);
    vlog(fmt, args);
    va_end(args);
  }

  void set_verbose(bool verbose)
  {
    verbose_logging = verbose;
  }

  void set_log_output(FILE *out)
  {
    if(log_output)
      fflush(log_output);
    log_output = out;
  }

};

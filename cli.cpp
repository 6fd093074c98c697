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

#include "cli.hpp"
#include "encoders.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "options.hpp"
#include "registry.hpp"
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <inttypes.h>
#include <fstream>
#include <sstream>

namespace slice
{

  void register_options()
  {
    options::add<bool>("help", "h", "Print usage information", 0, false, options::nodump);
    options::set_cf_options("config", "c");
    options::add<std::string>("save-config", 0, "Save configuration file", 0, "", options::nodump);

    options::add<std::string>("offset", "o", "Offset of output in bytes", "Input", "0");
    options::add<std::string>("size", "s", "Size of output in bytes, -1 reads to the end",
			      "Input", "-1");
    options::add_alias("size", "length", "l");

    std::string format_desc = "Output format, available: " + format_names();
    options::add<std::string>("format", "f", format_desc.c_str(), "Output", default_format);
    options::add<bool>("legacy-escapes", 0,
		       "cstringSafe: write bytes 0x14-0x1f literally, like older releases",
		       "Output", false);
    options::add<bool>("verbose", "v", "Log debug information to stderr", "Output", false);
  }

  int64_t parse_integer(const std::string &text, const char *what)
  {
    const char *s = text.c_str();
    char *end = 0;
    errno = 0;
    long long v = strtoll(s, &end, 0);
    if(text.empty() || errno != 0 || *end != '\0')
      throw argument_error(std::string("could not parse ") + what + " \"" + text + "\"");
    return (int64_t)v;
  }

  invocation_t parse_command_line(int argc, char **argv)
  {
    register_options();
    int inpidx = options::parse_cmdline(argc, argv);

    invocation_t inv;
    inv.help = options::quickget<bool>("help");
    if(inv.help)
      return inv;

    inv.verbose = options::quickget<bool>("verbose");
    inv.legacy_escapes = options::quickget<bool>("legacy-escapes");
    inv.format = options::quickget<std::string>("format");

    inv.range.offset = parse_integer(options::quickget<std::string>("offset"), "offset");
    inv.range.length = parse_integer(options::quickget<std::string>("size"), "size");
    if(inv.range.offset < 0)
      throw argument_error("offset must not be negative");
    if(inv.range.length < -1)
      throw argument_error("size must be -1 (to end of file) or a byte count");

    resolve(inv.format); // fail early on unknown formats

    int nargs = argc - inpidx;
    if(nargs != 1) {
      std::ostringstream msg;
      msg << "expected exactly one argument, got " << nargs;
      throw argument_error(msg.str());
    }
    inv.path = argv[inpidx];

    // save a config file based on these options?
    std::string cfname = options::quickget<std::string>("save-config");
    if(cfname.length() > 0) {
      std::ofstream conf(cfname.c_str());
      if(!conf)
	log("can't write configuration file %s", cfname.c_str());
      else
	options::dump(conf);
    }

    return inv;
  }

  void print_usage(const char *prog, std::ostream &out)
  {
    out << "Usage: " << prog << " [options] FILE" << std::endl
	<< "Outputs a byte range of FILE in the chosen format." << std::endl << std::endl;
    options::print_options(out);
    out << std::endl << "Formats:" << std::endl;
    const std::vector<format_t> &all = formats();
    for(size_t i = 0; i < all.size(); ++i) {
      std::string name = all[i].name;
      out << "  " << name << std::string(name.length() < 16 ? 16 - name.length() : 1, ' ')
	  << all[i].description << std::endl;
    }
  }

  void run(const invocation_t &inv, FILE *out)
  {
    set_verbose(inv.verbose);

    const format_t &fmt = resolve(inv.format);
    input_file in(inv.path);
    debug("opened %s", in.path().c_str());

    file_range_reader reader(in.get(), inv.range);

    encoder_config_t cfg;
    if(inv.legacy_escapes)
      cfg.printable_min = printable_min_legacy;

    debug("encoding as %s", fmt.name);
    fmt.encode(reader, out, cfg);
    if(fflush(out) != 0)
      throw io_error(std::string("write failed: ") + strerror(errno));
    debug("done, %" PRIu64 " bytes read", reader.delivered());
  }

};

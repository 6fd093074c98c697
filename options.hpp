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
  \file options.hpp

  \brief Commandline and configuration file options.  Options are
  registered with a type and a default, can be set from the commandline
  (getopt_long) or from a "name = value" configuration file, and can be
  dumped back out to such a file.  Errors are reported by throwing
  slice::argument_error.
 */


#ifndef _SLICE_OPTIONS_HPP
#define _SLICE_OPTIONS_HPP

#include <vector>
#include <string>
#include <iostream>
#include <typeinfo>
#include "errors.hpp"

namespace slice
{
namespace options
{

  // options have:
  //  - long option name (e.g. "option_name"), plus optional long aliases
  //  - short option name (e.g. "o"), plus optional short aliases
  //  - description
  //  - group (for sorting when printing usage information)
  //  - flag indicating whether the option is a boolean one
  //  - flag indicating if the option should be written to conf files
  //  - default value

  struct option; // declared later

  // register an option; if bool, requires no argument, otherwise,
  // requires an argument.  Registering an existing option resets its
  // description and default; a different type throws std::bad_cast.
  template <class T>
  void add(const char *long_option, const char *short_option = 0,
	   const char *desc = 0, const char *group = 0,
	   T def = T(), bool dump = true);

  // make long_alias (and optionally short_alias) refer to an existing
  // option; throws argument_error if the option doesn't exist
  void add_alias(const char *long_option, const char *long_alias,
		 const char *short_alias = 0);

  // get the value of an option; false if not found or of another type
  template <class T>
  bool get(T &out, const char *long_option, const char *short_option = 0);

  // return the value of an option, or T() (typically need to call this
  // like quickget<type>("option"))
  template <class T>
  T quickget(const char *long_option, const char *short_option = 0);

  // find an option by name or alias
  option * find(const char *long_option, const char *short_option = 0);

  // remove all registered options
  void clear();

  // dump all options to a configuration file
  void dump(std::ostream &out);

  extern const bool nodump;
  extern const bool dodump;

  // print options and descriptions (in a format suitable for "usage"
  // information)
  void print_options(std::ostream &out);

  // set the commandline flags for specifying a configuration file to
  // be read; if encountered while parsing the commandline, the
  // specified config file will be read
  void set_cf_options(const char *long_option, const char *short_option);

  // read a configuration file; unknown options are logged and skipped,
  // syntax errors throw argument_error
  void read_file(std::istream &in);

  // parse the commandline; if one of the options specifies a
  // configuration file, read the file (options already set will be
  // replaced, and commandline options specified after the config file
  // will replace config file options); returns index in argv of the
  // first non-option element (e.g. input file).  Throws argument_error.
  int parse_cmdline(int argc, char **argv);



  //////////////////////////////////////////////////////////////////////

  // implementation details

  struct option
  {
    std::string longopt;
    std::string shortopt;              // empty, or a single character
    std::vector<std::string> long_aliases;
    std::string short_aliases;         // one character per alias
    std::string desc;
    std::string group;
    bool is_boolean;
    bool dump;

    virtual ~option() {}
    virtual std::istream & read(std::istream &in) = 0;
    virtual std::ostream & write(std::ostream &out) const = 0;
    virtual const std::type_info & type() const = 0;
  };

  template <class T>
  struct option_t : public option
  {
    T value;

    option_t(const char *lo, const char *so, const char *d, const char *g,
	     const T &v, bool dmp = true)
      : value(v)
    {
      longopt = lo ? lo : "";
      if(so && *so)
	shortopt.assign(1, so[0]); // shortopt can only be a single character
      desc = d ? d : "";
      group = g ? g : "";
      is_boolean = (typeid(T) == typeid(bool));
      dump = dmp;
    }

    virtual std::istream & read(std::istream &in)
    {
      return in >> value;
    }

    virtual std::ostream & write(std::ostream &out) const
    {
      return out << value;
    }

    virtual const std::type_info & type() const
    {
      return typeid(T);
    }

  };

  // strings take the whole remaining value, spaces included
  template <>
  inline std::istream & option_t<std::string>::read(std::istream &in)
  {
    std::string s;
    std::getline(in >> std::ws, s);
    size_t end = s.find_last_not_of(" \t\r");
    value = end == std::string::npos ? std::string() : s.substr(0, end + 1);
    in.clear(in.rdstate() & ~std::ios::failbit); // empty is fine
    return in;
  }

  // in options.cpp
  extern std::vector<option *> registered;

  template <class T>
  void add(const char *long_option, const char *short_option,
	   const char *desc, const char *group,
	   T def, bool dump)
  {
    option *o = find(long_option, short_option);
    if(o) { // option is already there
      option_t<T> *ot = dynamic_cast<option_t<T> *>(o);
      if(!ot)
	throw std::bad_cast(); // it is a different type!
      ot->desc = desc ? desc : "";
      ot->value = def;
      ot->dump = dump;
      return;
    }
    registered.push_back
      (new option_t<T>(long_option, short_option, desc, group, def, dump));
  }


  template <class T>
  bool get(T &out, const char *long_option, const char *short_option)
  {
    option_t<T> *opt = dynamic_cast<option_t<T> *>(find(long_option, short_option));
    if(opt) {
      out = opt->value;
      return true;
    }
    return false; // not found or wrong type
  }


  template <class T>
  T quickget(const char *long_option, const char *short_option)
  {
    T out = T();
    get(out, long_option, short_option);
    return out; // returns default T() if not found
  }

};
};

#endif // _SLICE_OPTIONS_HPP

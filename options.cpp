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
  \file options.cpp

  \brief Commandline and configuration file options: implementation
  details.
 */

#include "options.hpp"
#include "log.hpp"
#include <getopt.h>
#include <ctype.h>
#include <string.h>
#include <string>
#include <vector>
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>

using namespace std;

namespace slice
{
namespace options
{

  const bool nodump = false;
  const bool dodump = true;

  // global options list
  vector<option *> registered;

  // config file commandline options
  string long_cf, short_cf;


  struct ltgroup
  {
    bool operator()(const option *o1, const option *o2) const
    {
      return o1->group < o2->group;
    }
  };
  void sort_by_group()
  {
    // stable, so options keep registration order within a group
    stable_sort(registered.begin(), registered.end(), ltgroup());
  }


  static bool matches_long(const option *o, const char *name)
  {
    if(o->longopt == name)
      return true;
    return std::find(o->long_aliases.begin(), o->long_aliases.end(), string(name))
      != o->long_aliases.end();
  }

  static bool matches_short(const option *o, char c)
  {
    return (!o->shortopt.empty() && o->shortopt[0] == c) ||
      o->short_aliases.find(c) != string::npos;
  }

  option * find(const char *long_option, const char *short_option)
  {
    for(size_t i = 0; i < registered.size(); ++i)
      if((long_option && matches_long(registered[i], long_option)) ||
	 (short_option && *short_option && matches_short(registered[i], short_option[0])))
	return registered[i];
    return 0;
  }


  void add_alias(const char *long_option, const char *long_alias,
		 const char *short_alias)
  {
    option *o = find(long_option);
    if(!o)
      throw argument_error(string("no option ") + long_option + " to alias");
    if(long_alias && !matches_long(o, long_alias))
      o->long_aliases.push_back(long_alias);
    if(short_alias && *short_alias && !matches_short(o, short_alias[0]))
      o->short_aliases.push_back(short_alias[0]);
  }


  void clear()
  {
    for(size_t i = 0; i < registered.size(); ++i)
      delete registered[i];
    registered.clear();
    long_cf.clear();
    short_cf.clear();
  }


  void dump(ostream &out)
  {
    out << "##" << endl << "## Automatically generated configuration file"
	<< endl << "##" << endl << endl;

    sort_by_group();

    string pgrp;
    for(size_t i = 0; i < registered.size(); ++i) {
      if(!registered[i]->dump)
	continue;

      if(registered[i]->group != pgrp) { // new option group
	out << "##" << endl << "# " << registered[i]->group << endl << "##" << endl << endl;
	pgrp = registered[i]->group;
      }

      out << "# " << registered[i]->longopt << endl;
      if(!registered[i]->desc.empty())
	out << "# " << registered[i]->desc << endl;
      out << endl << registered[i]->longopt << " = ";
      registered[i]->write(out);
      out << endl << endl;
    }
  }


  // "--size,--length,-s,-l"
  static string flag_list(const option *o)
  {
    string flags = "--" + o->longopt;
    for(size_t j = 0; j < o->long_aliases.size(); ++j)
      flags += ",--" + o->long_aliases[j];
    if(!o->shortopt.empty())
      flags += ",-" + o->shortopt;
    for(size_t j = 0; j < o->short_aliases.size(); ++j)
      flags += string(",-") + o->short_aliases[j];
    return flags;
  }

  void print_options(ostream &out)
  {
    sort_by_group();

    out << "Options:" << endl;

    string pgrp;
    size_t i, maxlen = 0;

    // find longest flag list
    for(i = 0; i < registered.size(); ++i)
      maxlen = std::max(maxlen, flag_list(registered[i]).length());

    for(i = 0; i < registered.size(); ++i) {
      if(registered[i]->group != pgrp) { // new option group
	out << endl << registered[i]->group << ":" << endl;
	pgrp = registered[i]->group;
      }

      string flags = flag_list(registered[i]);
      out << "  " << flags;
      if(!registered[i]->desc.empty()) {
	// space so descriptions are aligned
	out << string(maxlen + 2 - flags.length(), ' ') << registered[i]->desc;
      }
      out << endl;
    }
  }


  void set_cf_options(const char *long_option, const char *short_option)
  {
    long_cf = long_option ? long_option : "";
    short_cf = short_option ? short_option : "";
    if(!long_cf.empty())
      add(long_cf.c_str(), short_cf.c_str(), "Read options from a configuration file",
	  0, string(""), nodump);
  }


  static string trim(const string &s)
  {
    size_t b = s.find_first_not_of(" \t\r");
    if(b == string::npos)
      return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
  }

  void read_file(istream &in)
  {
    string line;
    unsigned int lineno = 0;
    while(getline(in, line)) {
      ++lineno;
      size_t hash = line.find('#');
      if(hash != string::npos)
	line.erase(hash); // comment
      line = trim(line);
      if(line.empty())
	continue;

      size_t eq = line.find('=');
      if(eq == string::npos) {
	ostringstream msg;
	msg << "syntax error in configuration file (no '=') on line " << lineno;
	throw argument_error(msg.str());
      }

      string optname = trim(line.substr(0, eq));
      option *opt = find(optname.c_str());
      if(!opt) {
	log("warning: ignoring unknown option %s", optname.c_str());
	continue;
      }

      stringstream ss(trim(line.substr(eq + 1)), stringstream::in);
      opt->read(ss);
      if(ss.fail())
	throw argument_error("error reading value for option " + optname);
    }
    if(in.bad())
      throw argument_error("error reading configuration file");
  }


  int parse_cmdline(int argc, char **argv)
  {
    // first set up options list for getopt_long; every long name and
    // alias maps to 256 + the option's index
    vector<struct ::option> long_opts;
    string short_opts = ":"; // report missing arguments as ':'

    size_t i;
    for(i = 0; i < registered.size(); ++i) {
      const option *o = registered[i];
      struct ::option lo;
      lo.has_arg = o->is_boolean ? no_argument : required_argument;
      lo.flag = 0;
      lo.val = 256 + (int)i; // ensure no overlap with short options

      lo.name = o->longopt.c_str();
      long_opts.push_back(lo);
      for(size_t j = 0; j < o->long_aliases.size(); ++j) {
	lo.name = o->long_aliases[j].c_str();
	long_opts.push_back(lo);
      }

      string shorts = o->shortopt + o->short_aliases;
      for(size_t j = 0; j < shorts.size(); ++j) {
	short_opts += shorts[j];
	if(!o->is_boolean)
	  short_opts += ':';
      }
    }
    struct ::option end = { 0, 0, 0, 0 };
    long_opts.push_back(end);

    // now process the commandline; optind = 0 makes getopt start over
    // if called more than once
    opterr = 0;
    optind = 0;
    int c, option_idx;
    while(1) {
      c = getopt_long(argc, argv, short_opts.c_str(), &long_opts[0], &option_idx);
      if(c < 0)
	break; // done

      if(c == '?' || c == ':') {
	string which = (optind > 0 && optind <= argc) ? argv[optind - 1] : "";
	if(optopt > 0 && optopt < 256)
	  which = string("-") + (char)optopt;
	throw argument_error(c == '?' ? "unknown option " + which :
			     "option " + which + " requires a value");
      }

      // find the option and handle it
      option *opt = 0;
      if(c >= 256)
	opt = registered[c - 256];
      else
	for(i = 0; i < registered.size() && !opt; ++i)
	  if(matches_short(registered[i], (char)c))
	    opt = registered[i];
      if(!opt)
	throw argument_error("unhandled option");

      if(opt->is_boolean) {
	dynamic_cast<option_t<bool> &>(*opt).value = true; // set flag
	continue;
      }

      // read in option
      stringstream ss(optarg, stringstream::in);
      opt->read(ss);
      if(ss.fail()) {
	string msg = "error reading value for option --" + opt->longopt;
	if(!opt->shortopt.empty())
	  msg += " (-" + opt->shortopt + ")";
	throw argument_error(msg);
      }

      // if the config file option is given, read the file now
      if(!long_cf.empty() && opt->longopt == long_cf) {
	const string &filename = dynamic_cast<option_t<string> &>(*opt).value;
	ifstream conf(filename.c_str());
	if(!conf)
	  throw argument_error("can't read configuration file " + filename);
	read_file(conf);
      }
    }

    return optind;
  }

};
};

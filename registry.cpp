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

#include "registry.hpp"
#include "errors.hpp"
#include <map>

namespace slice
{

  const char *const default_format = "raw";

  static const format_t format_table[] = {
    { FORMAT_RAW, "raw", "bytes unchanged", encode_raw },
    { FORMAT_HEX, "hex", "lowercase hex digits", encode_hex },
    { FORMAT_DUMP, "dump", "hex dump with offsets and ascii column", encode_dump },
    { FORMAT_ARRAY_LITERAL, "arrayLiteral", "byte array initializer {0x.., ...}", encode_array_literal },
    { FORMAT_STRING_LITERAL, "stringLiteral", "quoted string with octal escapes", encode_string_literal },
    { FORMAT_CSTRING, "cstring", "C string, every byte hex escaped", encode_cstring },
    { FORMAT_CSTRING_SAFE, "cstringSafe", "shortest unambiguous C string", encode_cstring_safe },
    { FORMAT_BASE64, "base64", "standard base64, one line", encode_base64 },
    { FORMAT_MD5, "md5", "MD5 digest", encode_md5 },
    { FORMAT_SHA256, "sha256", "SHA-256 digest", encode_sha256 },
  };

  struct alias_t
  {
    const char *alias;
    format_id id;
  };

  // names used by older releases
  static const alias_t alias_table[] = {
    { "gobytes", FORMAT_ARRAY_LITERAL },
    { "gostring", FORMAT_STRING_LITERAL },
    { "cstring_unsafe", FORMAT_CSTRING_SAFE },
  };

  static const size_t num_formats = sizeof(format_table) / sizeof(format_table[0]);
  static const size_t num_aliases = sizeof(alias_table) / sizeof(alias_table[0]);

  static std::map<std::string, const format_t *> build_lookup()
  {
    std::map<std::string, const format_t *> lookup;
    for(size_t i = 0; i < num_formats; ++i)
      lookup[format_table[i].name] = &format_table[i];
    for(size_t i = 0; i < num_aliases; ++i)
      for(size_t j = 0; j < num_formats; ++j)
	if(format_table[j].id == alias_table[i].id)
	  lookup[alias_table[i].alias] = &format_table[j];
    return lookup;
  }

  const format_t & resolve(const std::string &name)
  {
    static const std::map<std::string, const format_t *> lookup = build_lookup();
    std::map<std::string, const format_t *>::const_iterator it = lookup.find(name);
    if(it == lookup.end())
      throw unknown_format_error("unsupported format \"" + name + "\"");
    return *it->second;
  }

  const std::vector<format_t> & formats()
  {
    static const std::vector<format_t> all(format_table, format_table + num_formats);
    return all;
  }

  std::string format_names()
  {
    std::string names;
    for(size_t i = 0; i < num_formats; ++i) {
      if(i)
	names.append(", ");
      names.append(format_table[i].name);
    }
    return names;
  }

};

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

#include <iostream>
#include <string>
#include "test_util.hpp"
#include "../errors.hpp"
#include "../registry.hpp"

using namespace slice;

static int test_all_names()
{
  struct { const char *name; format_id id; encoder_fn fn; } expected[] = {
    { "raw", FORMAT_RAW, encode_raw },
    { "hex", FORMAT_HEX, encode_hex },
    { "dump", FORMAT_DUMP, encode_dump },
    { "arrayLiteral", FORMAT_ARRAY_LITERAL, encode_array_literal },
    { "stringLiteral", FORMAT_STRING_LITERAL, encode_string_literal },
    { "cstring", FORMAT_CSTRING, encode_cstring },
    { "cstringSafe", FORMAT_CSTRING_SAFE, encode_cstring_safe },
    { "base64", FORMAT_BASE64, encode_base64 },
    { "md5", FORMAT_MD5, encode_md5 },
    { "sha256", FORMAT_SHA256, encode_sha256 },
  };
  const size_t n = sizeof(expected) / sizeof(expected[0]);
  ASSERT_TRUE(formats().size() == n);
  for(size_t i = 0; i < n; ++i) {
    const format_t &f = resolve(expected[i].name);
    ASSERT_TRUE(f.id == expected[i].id);
    ASSERT_TRUE(f.encode == expected[i].fn);
    ASSERT_TRUE(std::string(f.name) == expected[i].name);
    ASSERT_TRUE(std::string(formats()[i].name) == expected[i].name);
  }
  ASSERT_TRUE(resolve(default_format).id == FORMAT_RAW);
  return 0;
}

static int test_aliases()
{
  ASSERT_TRUE(resolve("gobytes").id == FORMAT_ARRAY_LITERAL);
  ASSERT_TRUE(resolve("gostring").id == FORMAT_STRING_LITERAL);
  ASSERT_TRUE(resolve("cstring_unsafe").id == FORMAT_CSTRING_SAFE);
  // aliases don't show up as formats of their own
  ASSERT_TRUE(format_names().find("gobytes") == std::string::npos);
  return 0;
}

static int test_unknown()
{
  const char *bad[] = { "nope", "", "HEX", "hex ", "cstringsafe" };
  for(size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); ++i) {
    bool thrown = false;
    try {
      resolve(bad[i]);
    } catch(const unknown_format_error &e) {
      thrown = std::string(e.what()).find("unsupported format") != std::string::npos;
    }
    ASSERT_TRUE(thrown);
  }
  return 0;
}

static int test_names()
{
  ASSERT_TRUE(format_names() ==
	      "raw, hex, dump, arrayLiteral, stringLiteral, cstring, cstringSafe, base64, md5, sha256");
  return 0;
}

static int test_dispatch()
{
  ASSERT_TRUE(encode_with(resolve("hex").encode, "ab") == "6162\n");
  ASSERT_TRUE(encode_with(resolve("cstringSafe").encode, std::string("\xab\x61", 2)) ==
	      "\"\\xab\" \"a\"\n");
  return 0;
}

int main()
{
  try {
    if(test_all_names() || test_aliases() || test_unknown() || test_names() || test_dispatch())
      return 1;
  } catch(const std::exception &e) {
    std::cerr << "Exception: " << e.what() << std::endl;
    return 1;
  }
  std::cout << "All registry tests passed" << std::endl;
  return 0;
}

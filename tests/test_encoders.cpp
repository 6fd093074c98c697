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
#include <algorithm>
#include "test_util.hpp"
#include "../encoders.hpp"
#include "../escape.hpp"

using namespace slice;

static size_t count_lines(const std::string &s)
{
  return (size_t)std::count(s.begin(), s.end(), '\n');
}

// true if some hex escape in a literal is directly followed by a hex
// digit inside the same segment
static bool hex_escape_runs_on(const std::string &text)
{
  for(size_t i = 0; i < text.size(); ++i) {
    if(text[i] != '\\')
      continue;
    if(i + 1 < text.size() && text[i + 1] == 'x') {
      size_t after = i + 4;
      if(after < text.size() && hex_value(text[after]) >= 0)
	return true;
      i = after - 1;
    } else
      ++i; // skip the escaped character
  }
  return false;
}

static int test_raw()
{
  std::string data = all_bytes() + noise(200000);
  ASSERT_TRUE(encode_with(encode_raw, data) == data);
  ASSERT_TRUE(encode_with(encode_raw, "").empty());
  return 0;
}

static int test_hex()
{
  ASSERT_TRUE(encode_with(encode_hex, "") == "\n");
  ASSERT_TRUE(encode_with(encode_hex, std::string("\x00\xab\x61\xff", 4)) == "00ab61ff\n");

  std::string data = all_bytes() + noise(150000);
  std::string out = encode_with(encode_hex, data);
  ASSERT_TRUE(out.size() == 2 * data.size() + 1);
  ASSERT_TRUE(out[out.size() - 1] == '\n');
  std::string decoded;
  ASSERT_TRUE(hex_decode(out.substr(0, out.size() - 1), decoded));
  ASSERT_TRUE(decoded == data);
  return 0;
}

static int test_dump_full_line()
{
  std::string data("hello world\n\x00\x01\x02\x03", 16);
  std::string out = encode_with(encode_dump, data);
  ASSERT_TRUE(out == "00000000  68 65 6c 6c 6f 20 77 6f  72 6c 64 0a 00 01 02 03  |hello world.....|\n");
  return 0;
}

static int test_dump_short_line()
{
  std::string data = std::string("hello world\n\x00\x01\x02\x03", 16) + "Z";
  std::string out = encode_with(encode_dump, data);
  ASSERT_TRUE(count_lines(out) == 2);

  std::string second = out.substr(out.find('\n') + 1);
  ASSERT_TRUE(second == "00000010  5a " + std::string(47, ' ') + "|Z|\n");

  // both lines put the ascii column in the same place
  ASSERT_TRUE(out.find('|') == second.find('|'));
  return 0;
}

static int test_dump_gap_padding()
{
  // nine bytes: the padding has to include the gap after the 8th column
  std::string out = encode_with(encode_dump, "ABCDEFGHI");
  ASSERT_TRUE(out == "00000000  41 42 43 44 45 46 47 48  49" + std::string(23, ' ') + "|ABCDEFGHI|\n");
  return 0;
}

static int test_dump_offsets()
{
  ASSERT_TRUE(encode_with(encode_dump, "").empty());

  std::string out = encode_with(encode_dump, noise(16 * 300));
  ASSERT_TRUE(count_lines(out) == 300);
  ASSERT_TRUE(out.find("\n000012b0  ") != std::string::npos); // line 299
  return 0;
}

static int test_array_literal()
{
  ASSERT_TRUE(encode_with(encode_array_literal, "") == "{}\n");
  ASSERT_TRUE(encode_with(encode_array_literal, std::string("\x00\xab\x61", 3)) ==
	      "{0x00, 0xab, 0x61}\n");
  std::string out = encode_with(encode_array_literal, all_bytes());
  ASSERT_TRUE(out.find("0x7f, 0x80") != std::string::npos);
  ASSERT_TRUE(out.size() == 1 + 256 * 4 + 255 * 2 + 2);
  return 0;
}

static int test_string_literal()
{
  ASSERT_TRUE(encode_with(encode_string_literal, "") == "\"\"\n");
  ASSERT_TRUE(encode_with(encode_string_literal, std::string("a\"\\\n\x00\xff", 6)) ==
	      "\"a\\\"\\\\\\n\\000\\377\"\n");

  // octal escapes never absorb the digits that follow
  ASSERT_TRUE(encode_with(encode_string_literal, std::string("\x01" "7", 2)) == "\"\\0017\"\n");

  std::string data = all_bytes() + all_bytes();
  std::string out = encode_with(encode_string_literal, data);
  std::string decoded;
  ASSERT_TRUE(c_literal_decode(out, decoded));
  ASSERT_TRUE(decoded == data);
  return 0;
}

static int test_cstring_example()
{
  std::string data("\xab\x61", 2);
  ASSERT_TRUE(encode_with(encode_cstring, data) == "\"\\xab\\x61\"\n");
  ASSERT_TRUE(encode_with(encode_cstring_safe, data) == "\"\\xab\" \"a\"\n");

  ASSERT_TRUE(encode_with(encode_cstring, "") == "\"\"\n");
  ASSERT_TRUE(encode_with(encode_cstring_safe, "") == "\"\"\n");
  ASSERT_TRUE(encode_with(encode_cstring_safe, "hi \"x\"\n") == "\"hi \\\"x\\\"\\n\"\n");
  ASSERT_TRUE(encode_with(encode_cstring_safe, std::string("\x00\x01z", 3)) == "\"\\x00\\x01\" \"z\"\n");
  return 0;
}

// each hex escape followed by a named escape costs one character more
// than the all-hex rendering ("\xab" "\n" against "\xab\x0a")
static size_t hex_to_named_transitions(const std::string &data)
{
  size_t n = 0;
  for(size_t i = 1; i < data.size(); ++i) {
    escape_t prev = classify((unsigned char)data[i - 1]);
    escape_t cur = classify((unsigned char)data[i]);
    if(prev.is_hex && !cur.is_hex && cur.text.size() == 2)
      ++n;
  }
  return n;
}

static int test_cstring_named_after_hex()
{
  std::string data("\xab\x0a", 2);
  std::string naive = encode_with(encode_cstring, data);
  std::string safe = encode_with(encode_cstring_safe, data);
  ASSERT_TRUE(naive == "\"\\xab\\x0a\"\n");
  ASSERT_TRUE(safe == "\"\\xab\" \"\\n\"\n");
  ASSERT_TRUE(safe.size() == naive.size() + 1);
  ASSERT_TRUE(hex_to_named_transitions(data) == 1);

  std::string decoded;
  ASSERT_TRUE(c_literal_decode(safe, decoded));
  ASSERT_TRUE(decoded == data);
  return 0;
}

static int test_cstring_round_trip()
{
  std::string inputs[] = { all_bytes(), noise(5000), noise(130000, 7),
			   std::string("\xff" "fab\x00" "0", 6),
			   std::string("\x01\n\x02\t\x03\\\x04\"", 8) };
  for(size_t i = 0; i < sizeof(inputs) / sizeof(inputs[0]); ++i) {
    std::string naive = encode_with(encode_cstring, inputs[i]);
    std::string safe = encode_with(encode_cstring_safe, inputs[i]);
    std::string decoded;
    ASSERT_TRUE(c_literal_decode(naive, decoded));
    ASSERT_TRUE(decoded == inputs[i]);
    ASSERT_TRUE(c_literal_decode(safe, decoded));
    ASSERT_TRUE(decoded == inputs[i]);
    ASSERT_TRUE(safe.size() <= naive.size() + hex_to_named_transitions(inputs[i]));
    ASSERT_TRUE(naive.size() == 4 * inputs[i].size() + 3);
    ASSERT_TRUE(!hex_escape_runs_on(safe));
  }
  return 0;
}

static int test_cstring_legacy_boundary()
{
  std::string data("\x1f" "a", 2);
  ASSERT_TRUE(encode_with(encode_cstring_safe, data) == "\"\\x1f\" \"a\"\n");

  encoder_config_t legacy;
  legacy.printable_min = printable_min_legacy;
  ASSERT_TRUE(encode_with(encode_cstring_safe, data, legacy) == "\"\x1f" "a\"\n");

  // 0x13 is below both bounds
  ASSERT_TRUE(encode_with(encode_cstring_safe, std::string("\x13", 1), legacy) == "\"\\x13\"\n");

  std::string decoded;
  ASSERT_TRUE(c_literal_decode(encode_with(encode_cstring_safe, all_bytes(), legacy), decoded));
  ASSERT_TRUE(decoded == all_bytes());
  return 0;
}

static int test_base64()
{
  ASSERT_TRUE(encode_with(encode_base64, "") == "\n");
  ASSERT_TRUE(encode_with(encode_base64, "f") == "Zg==\n");
  ASSERT_TRUE(encode_with(encode_base64, "fo") == "Zm8=\n");
  ASSERT_TRUE(encode_with(encode_base64, "foo") == "Zm9v\n");
  ASSERT_TRUE(encode_with(encode_base64, "foobar") == "Zm9vYmFy\n");

  // longer than the read buffer, not a multiple of 3
  std::string data = noise(250001);
  std::string out = encode_with(encode_base64, data);
  ASSERT_TRUE(count_lines(out) == 1);
  ASSERT_TRUE(out[out.size() - 1] == '\n');
  std::string decoded;
  ASSERT_TRUE(base64_decode(out.substr(0, out.size() - 1), decoded));
  ASSERT_TRUE(decoded == data);
  return 0;
}

static int test_digests()
{
  ASSERT_TRUE(encode_with(encode_md5, "") == "d41d8cd98f00b204e9800998ecf8427e\n");
  ASSERT_TRUE(encode_with(encode_sha256, "") ==
	      "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855\n");
  ASSERT_TRUE(encode_with(encode_md5, "abc") == "900150983cd24fb0d6963f7d28e17f72\n");
  ASSERT_TRUE(encode_with(encode_sha256, "abc") ==
	      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad\n");
  ASSERT_TRUE(encode_with(encode_md5, "The quick brown fox jumps over the lazy dog") ==
	      "9e107d9d372bb6826bd81d3542a419d6\n");

  std::string data = noise(300000);
  ASSERT_TRUE(encode_with(encode_md5, data) == encode_with(encode_md5, data));
  ASSERT_TRUE(encode_with(encode_sha256, data) == encode_with(encode_sha256, data));
  ASSERT_TRUE(encode_with(encode_sha256, data).size() == 65);
  return 0;
}

static int test_digest_of_range()
{
  FILE *in = make_input("xxabcxx");
  file_range_reader reader(in, byte_range_t(2, 3));
  char *buf = 0;
  size_t len = 0;
  FILE *out = open_memstream(&buf, &len);
  encode_md5(reader, out, encoder_config_t());
  fclose(out);
  std::string s(buf, len);
  free(buf);
  fclose(in);
  ASSERT_TRUE(s == "900150983cd24fb0d6963f7d28e17f72\n");
  return 0;
}

int main()
{
  try {
    if(test_raw() || test_hex() || test_dump_full_line() || test_dump_short_line() ||
       test_dump_gap_padding() || test_dump_offsets() || test_array_literal() ||
       test_string_literal() || test_cstring_example() || test_cstring_named_after_hex() ||
       test_cstring_round_trip() ||
       test_cstring_legacy_boundary() || test_base64() || test_digests() ||
       test_digest_of_range())
      return 1;
  } catch(const std::exception &e) {
    std::cerr << "Exception: " << e.what() << std::endl;
    return 1;
  }
  std::cout << "All encoder tests passed" << std::endl;
  return 0;
}

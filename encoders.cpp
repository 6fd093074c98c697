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

#include "encoders.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <errno.h>
#include <string.h>
#include <inttypes.h>
#include <string>
#include <vector>
#include <openssl/evp.h>

namespace slice
{

  // 100K, a multiple of 3 so base64 blocks never need padding mid-stream
  static const size_t buffer_size = 102399;

  static const char hex_digits[] = "0123456789abcdef";

  void write_bytes(FILE *out, const void *data, size_t len)
  {
    if(len == 0)
      return;
    if(fwrite(data, 1, len, out) != len)
      throw io_error(std::string("write failed: ") + strerror(errno));
  }

  void write_string(FILE *out, const std::string &s)
  {
    write_bytes(out, s.data(), s.size());
  }

  static void append_hex(std::string &out, const unsigned char *data, size_t len)
  {
    for(size_t i = 0; i < len; ++i) {
      out.push_back(hex_digits[data[i] >> 4]);
      out.push_back(hex_digits[data[i] & 0x0f]);
    }
  }

  static inline bool printable(unsigned char b)
  {
    return b >= 0x20 && b <= 0x7e;
  }

  // the literal encoders need to see everything before writing
  static void read_all(byte_reader &in, std::vector<unsigned char> &data)
  {
    std::vector<unsigned char> buf(buffer_size);
    size_t n;
    while((n = in.read(&buf[0], buf.size())) > 0)
      data.insert(data.end(), buf.begin(), buf.begin() + n);
  }


  void encode_raw(byte_reader &in, FILE *out, const encoder_config_t &)
  {
    std::vector<unsigned char> buf(buffer_size);
    size_t n;
    while((n = in.read(&buf[0], buf.size())) > 0)
      write_bytes(out, &buf[0], n);
  }

  void encode_hex(byte_reader &in, FILE *out, const encoder_config_t &)
  {
    std::vector<unsigned char> buf(buffer_size);
    std::string line;
    size_t n;
    while((n = in.read(&buf[0], buf.size())) > 0) {
      line.clear();
      append_hex(line, &buf[0], n);
      write_string(out, line);
    }
    write_bytes(out, "\n", 1);
  }


  // canonical hex+ascii dump, written incrementally so input of any
  // size streams through
  class dumper
  {
  public:
    explicit dumper(FILE *out) : out_(out), offset_(0), used_(0) {}

    void write(const unsigned char *data, size_t len);

    // pad and flush a partial last line
    void close();

  private:
    FILE *out_;
    uint64_t offset_;
    unsigned int used_;   // bytes on the current line
    char right_[16];      // ascii column of the current line
  };

  void dumper::write(const unsigned char *data, size_t len)
  {
    std::string text;
    char buf[32];
    for(size_t i = 0; i < len; ++i) {
      if(used_ == 0) {
	snprintf(buf, sizeof(buf), "%08" PRIx64 "  ", offset_);
	text.append(buf);
      }

      text.push_back(hex_digits[data[i] >> 4]);
      text.push_back(hex_digits[data[i] & 0x0f]);
      text.push_back(' ');
      if(used_ == 7)
	text.push_back(' '); // gap between the two halves
      else if(used_ == 15)
	text.append(" |");

      right_[used_] = printable(data[i]) ? (char)data[i] : '.';
      ++used_;
      ++offset_;

      if(used_ == 16) {
	text.append(right_, 16);
	text.append("|\n");
	used_ = 0;
      }
    }
    write_string(out_, text);
  }

  void dumper::close()
  {
    if(used_ == 0)
      return;

    std::string text;
    unsigned int n = used_;
    for(unsigned int u = used_; u < 16; ++u) {
      if(u == 7)
	text.append("    ");
      else if(u == 15)
	text.append("    |");
      else
	text.append("   ");
    }
    text.append(right_, n);
    text.append("|\n");
    write_string(out_, text);
    used_ = 0;
  }

  void encode_dump(byte_reader &in, FILE *out, const encoder_config_t &)
  {
    std::vector<unsigned char> buf(buffer_size);
    dumper d(out);
    size_t n;
    while((n = in.read(&buf[0], buf.size())) > 0)
      d.write(&buf[0], n);
    d.close();
  }


  void encode_array_literal(byte_reader &in, FILE *out, const encoder_config_t &)
  {
    std::vector<unsigned char> data;
    read_all(in, data);

    std::string text;
    text.reserve(6 * data.size() + 3);
    text.push_back('{');
    for(size_t i = 0; i < data.size(); ++i) {
      if(i)
	text.append(", ");
      text.append("0x");
      append_hex(text, &data[i], 1);
    }
    text.append("}\n");
    write_string(out, text);
  }

  void encode_string_literal(byte_reader &in, FILE *out, const encoder_config_t &)
  {
    std::vector<unsigned char> data;
    read_all(in, data);

    std::string text;
    text.reserve(data.size() + 3);
    text.push_back('"');
    char oct[5];
    for(size_t i = 0; i < data.size(); ++i) {
      escape_t e = classify(data[i]);
      if(e.is_hex) {
	// octal escapes stop after three digits, so they never swallow
	// what follows
	snprintf(oct, sizeof(oct), "\\%03o", data[i]);
	text.append(oct);
      } else
	text.append(e.text);
    }
    text.append("\"\n");
    write_string(out, text);
  }


  void encode_cstring(byte_reader &in, FILE *out, const encoder_config_t &)
  {
    std::vector<unsigned char> buf(buffer_size);
    std::string text;
    size_t n;
    write_bytes(out, "\"", 1);
    while((n = in.read(&buf[0], buf.size())) > 0) {
      text.clear();
      for(size_t i = 0; i < n; ++i) {
	text.append("\\x");
	append_hex(text, &buf[i], 1);
      }
      write_string(out, text);
    }
    write_bytes(out, "\"\n", 2);
  }

  void encode_cstring_safe(byte_reader &in, FILE *out, const encoder_config_t &cfg)
  {
    std::vector<unsigned char> buf(buffer_size);
    std::string text;
    cstring_state_t state;
    size_t n;
    write_bytes(out, "\"", 1);
    while((n = in.read(&buf[0], buf.size())) > 0) {
      text.clear();
      for(size_t i = 0; i < n; ++i)
	state = cstring_step(state, classify(buf[i], cfg.printable_min), text);
      write_string(out, text);
    }
    write_bytes(out, "\"\n", 2);
  }


  static void write_base64_block(FILE *out, const unsigned char *data, size_t len)
  {
    std::vector<unsigned char> text(4 * ((len + 2) / 3) + 1);
    int n = EVP_EncodeBlock(&text[0], data, (int)len);
    if(n < 0)
      throw error("base64 encoding failed");
    write_bytes(out, &text[0], (size_t)n);
  }

  void encode_base64(byte_reader &in, FILE *out, const encoder_config_t &)
  {
    std::vector<unsigned char> buf(buffer_size);
    size_t have = 0, n;
    while((n = in.read(&buf[have], buf.size() - have)) > 0) {
      have += n;
      // only encode whole 3-byte groups until the end of the stream
      size_t whole = have - have % 3;
      if(whole) {
	write_base64_block(out, &buf[0], whole);
	memmove(&buf[0], &buf[whole], have - whole);
	have -= whole;
      }
    }
    if(have)
      write_base64_block(out, &buf[0], have);
    write_bytes(out, "\n", 1);
  }


  // owns an EVP_MD_CTX
  class digest_context
  {
  public:
    digest_context() : ctx_(EVP_MD_CTX_new()) {}
    ~digest_context() { if(ctx_) EVP_MD_CTX_free(ctx_); }

    EVP_MD_CTX * get() const { return ctx_; }

  private:
    digest_context(const digest_context &);
    digest_context & operator=(const digest_context &);

    EVP_MD_CTX *ctx_;
  };

  static void encode_digest(byte_reader &in, FILE *out, const EVP_MD *md)
  {
    digest_context mdctx;
    if(!mdctx.get() || EVP_DigestInit_ex(mdctx.get(), md, NULL) != 1)
      throw error("could not initialize digest");

    // read data in chunks and update the digest
    std::vector<unsigned char> buf(buffer_size);
    uint64_t total = 0;
    size_t n;
    while((n = in.read(&buf[0], buf.size())) > 0) {
      if(EVP_DigestUpdate(mdctx.get(), &buf[0], n) != 1)
	throw error("digest update failed");
      total += n;
    }

    // finalize the digest; nothing is written before this point
    unsigned char md_val[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if(EVP_DigestFinal_ex(mdctx.get(), md_val, &md_len) != 1)
      throw error("could not finalize digest");
    debug("digested %" PRIu64 " bytes", total);

    std::string text;
    text.reserve(2 * md_len + 1);
    append_hex(text, md_val, md_len);
    text.push_back('\n');
    write_string(out, text);
  }

  void encode_md5(byte_reader &in, FILE *out, const encoder_config_t &)
  {
    encode_digest(in, out, EVP_md5());
  }

  void encode_sha256(byte_reader &in, FILE *out, const encoder_config_t &)
  {
    encode_digest(in, out, EVP_sha256());
  }

};

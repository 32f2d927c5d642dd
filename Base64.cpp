#include "Base64.hpp"

#include <cstdint>
#include <stdexcept>

#include <glog/logging.h>

namespace Base64 {

constexpr char const CHARSET[]{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

namespace {
constexpr int8_t bad = -1;

// 6-bit value for each octet, or bad
struct decode_table {
  int8_t v[256];

  constexpr decode_table()
    : v{}
  {
    for (auto& e : v)
      e = bad;
    for (int i = 0; i < 64; ++i)
      v[static_cast<unsigned char>(CHARSET[i])] = static_cast<int8_t>(i);
  }
};

constexpr decode_table table;

constexpr bool is_fws(char ch)
{
  return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
}
} // namespace

std::string enc(std::string_view text)
{
  auto const groups = (text.length() + 2) / 3;

  std::string enc_text;
  enc_text.reserve(groups * 4);

  std::string::size_type i = 0;
  for (; i + 3 <= text.length(); i += 3) {
    uint32_t const n = (static_cast<unsigned char>(text[i]) << 16) |
                       (static_cast<unsigned char>(text[i + 1]) << 8) |
                       static_cast<unsigned char>(text[i + 2]);
    enc_text.push_back(CHARSET[(n >> 18) & 0x3f]);
    enc_text.push_back(CHARSET[(n >> 12) & 0x3f]);
    enc_text.push_back(CHARSET[(n >> 6) & 0x3f]);
    enc_text.push_back(CHARSET[n & 0x3f]);
  }

  switch (text.length() - i) {
  case 1: {
    uint32_t const n = static_cast<unsigned char>(text[i]) << 16;
    enc_text.push_back(CHARSET[(n >> 18) & 0x3f]);
    enc_text.push_back(CHARSET[(n >> 12) & 0x3f]);
    enc_text.push_back('=');
    enc_text.push_back('=');
    break;
  }
  case 2: {
    uint32_t const n = (static_cast<unsigned char>(text[i]) << 16) |
                       (static_cast<unsigned char>(text[i + 1]) << 8);
    enc_text.push_back(CHARSET[(n >> 18) & 0x3f]);
    enc_text.push_back(CHARSET[(n >> 12) & 0x3f]);
    enc_text.push_back(CHARSET[(n >> 6) & 0x3f]);
    enc_text.push_back('=');
    break;
  }
  default:
    CHECK_EQ(text.length(), i);
    break;
  }

  return enc_text;
}

std::string dec(std::string_view text)
{
  std::string dec_text;
  dec_text.reserve((text.length() / 4) * 3);

  uint32_t accum = 0;
  int      count = 0; // 6-bit groups in accum
  int      pads = 0;

  for (auto ch : text) {
    if (is_fws(ch))
      continue;

    if (ch == '=') {
      if (++pads > 2)
        throw std::invalid_argument("too much padding in base64");
      continue;
    }
    if (pads)
      throw std::invalid_argument("data after padding in base64");

    auto const v = table.v[static_cast<unsigned char>(ch)];
    if (v == bad)
      throw std::invalid_argument("bad character in base64");

    accum = (accum << 6) | static_cast<uint32_t>(v);
    if (++count == 4) {
      dec_text += static_cast<char>((accum >> 16) & 0xff);
      dec_text += static_cast<char>((accum >> 8) & 0xff);
      dec_text += static_cast<char>(accum & 0xff);
      accum = 0;
      count = 0;
    }
  }

  switch (count) {
  case 0:
    if (pads)
      throw std::invalid_argument("unexpected padding in base64");
    break;
  case 1:
    throw std::invalid_argument("truncated base64");
  case 2:
    if (pads && pads != 2)
      throw std::invalid_argument("wrong padding in base64");
    dec_text += static_cast<char>((accum >> 4) & 0xff);
    break;
  case 3:
    if (pads && pads != 1)
      throw std::invalid_argument("wrong padding in base64");
    dec_text += static_cast<char>((accum >> 10) & 0xff);
    dec_text += static_cast<char>((accum >> 2) & 0xff);
    break;
  }

  return dec_text;
}

bool is_valid(std::string_view in)
{
  try {
    dec(in);
  }
  catch (std::invalid_argument const&) {
    return false;
  }
  return true;
}

} // namespace Base64

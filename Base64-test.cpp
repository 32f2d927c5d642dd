#include "Base64.hpp"

#include <stdexcept>
#include <string>

#include <glog/logging.h>

namespace {
bool throws(std::string_view in)
{
  try {
    Base64::dec(in);
  }
  catch (std::invalid_argument const& e) {
    return true;
  }
  return false;
}
} // namespace

int main(int argc, char* argv[])
{
  // RFC 4648 section 10
  struct {
    char const* plain;
    char const* encoded;
  } const vectors[]{
      {"", ""},
      {"f", "Zg=="},
      {"fo", "Zm8="},
      {"foo", "Zm9v"},
      {"foob", "Zm9vYg=="},
      {"fooba", "Zm9vYmE="},
      {"foobar", "Zm9vYmFy"},
  };

  for (auto const& v : vectors) {
    CHECK_EQ(Base64::enc(v.plain), v.encoded);
    CHECK_EQ(Base64::dec(v.encoded), v.plain);
  }

  // Binary data survives, including NUL and high octets.
  std::string bin;
  for (int i = 0; i < 256; ++i)
    bin += static_cast<char>(i);
  CHECK_EQ(Base64::dec(Base64::enc(bin)), bin);

  // One unbroken line, however long.
  auto const encoded = Base64::enc(bin);
  CHECK_EQ(encoded.size(), 344u);
  CHECK_EQ(encoded.find_first_of("\r\n\t "), std::string::npos);

  // Folding white space as found in a DKIM b= tag.
  CHECK_EQ(Base64::dec("Zm9v\r\n YmFy"), "foobar");
  CHECK_EQ(Base64::dec(" Zm 9v Yg = = "), "foob");

  // Missing padding is tolerated.
  CHECK_EQ(Base64::dec("Zm9vYg"), "foob");

  CHECK(throws("Zm9v!"));
  CHECK(throws("Zg==Zg=="));
  CHECK(throws("Zg==="));
  CHECK(throws("Z"));
  CHECK(throws("Zm9v="));
  CHECK(throws("Zm8=="));

  CHECK(Base64::is_valid("Zm9vYmFy"));
  CHECK(!Base64::is_valid("Zm9vYmFy;"));
}

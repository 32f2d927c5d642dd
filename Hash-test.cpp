#include "Hash.hpp"

#include <string>

#include <glog/logging.h>

namespace {
std::string hex(std::string_view bin)
{
  auto constexpr hex_digits = "0123456789abcdef";
  std::string ret;
  for (unsigned char ch : bin) {
    ret += hex_digits[(ch >> 4) & 0xF];
    ret += hex_digits[ch & 0xF];
  }
  return ret;
}
} // namespace

int main(int argc, char* argv[])
{
  CHECK_EQ(hex(Hash::digest(DKIM::hash_alg::sha256, "abc")),
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  CHECK_EQ(hex(Hash::digest(DKIM::hash_alg::sha1, "abc")),
           "a9993e364706816aba3e25717850c26c9cd0d89d");

  // Incremental updates give the same answer as one big update.
  Hash h(DKIM::hash_alg::sha256);
  h.update("a");
  h.update("");
  h.update("bc");
  CHECK_EQ(h.final(), Hash::digest(DKIM::hash_alg::sha256, "abc"));

  CHECK_EQ(Hash::digest(DKIM::hash_alg::sha1, "").size(), 20u);
  CHECK_EQ(Hash::digest(DKIM::hash_alg::sha256, "").size(), 32u);
}

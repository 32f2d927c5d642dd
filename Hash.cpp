#include "Hash.hpp"

#include <openssl/evp.h>

#include <glog/logging.h>

Hash::Hash(DKIM::hash_alg alg)
  : ctx_(CHECK_NOTNULL(EVP_MD_CTX_new()))
  , alg_(alg)
{
  auto const md = (alg == DKIM::hash_alg::sha1) ? EVP_sha1() : EVP_sha256();
  CHECK_EQ(EVP_DigestInit_ex(ctx_, md, nullptr), 1);
}

Hash::~Hash() { EVP_MD_CTX_free(ctx_); }

void Hash::update(std::string_view s)
{
  CHECK_EQ(EVP_DigestUpdate(ctx_, s.data(), s.length()), 1);
}

std::string Hash::final()
{
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int  md_len = 0;
  CHECK_EQ(EVP_DigestFinal_ex(ctx_, md, &md_len), 1);
  return std::string(reinterpret_cast<char const*>(md), md_len);
}

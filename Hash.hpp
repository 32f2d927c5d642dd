#ifndef HASH_DOT_HPP
#define HASH_DOT_HPP

#include <string>
#include <string_view>

#include "DKIM-types.hpp"

typedef struct evp_md_ctx_st EVP_MD_CTX;

// Incremental message digest, SHA-1 or SHA-256, via OpenSSL EVP.
class Hash {
public:
  Hash(Hash const&) = delete;
  Hash& operator=(Hash const&) = delete;

  explicit Hash(DKIM::hash_alg alg);
  ~Hash();

  void update(std::string_view s);

  // Raw digest octets; the object can't be updated after this.
  std::string final();

  DKIM::hash_alg alg() const { return alg_; }

  static std::string digest(DKIM::hash_alg alg, std::string_view s)
  {
    Hash h(alg);
    h.update(s);
    return h.final();
  }

private:
  EVP_MD_CTX*    ctx_;
  DKIM::hash_alg alg_;
};

#endif // HASH_DOT_HPP

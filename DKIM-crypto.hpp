#ifndef DKIM_CRYPTO_DOT_HPP
#define DKIM_CRYPTO_DOT_HPP

#include <string>
#include <string_view>

#include "DKIM-types.hpp"

// forward decl
typedef struct evp_pkey_st EVP_PKEY;

namespace DKIM {

class public_key {
public:
  public_key(public_key const&) = delete;
  public_key& operator=(public_key const&) = delete;

  public_key(public_key&& other) noexcept;
  public_key& operator=(public_key&& other) noexcept;

  // From the decoded p= octets: SubjectPublicKeyInfo or bare RSAPublicKey
  // DER for RSA; the raw 32 octets (or SubjectPublicKeyInfo) for Ed25519.
  // Throws DKIM::error with status::key_malformed.
  public_key(key_type type, std::string_view octets);
  ~public_key();

  key_type type() const { return type_; }
  int      bits() const;

  EVP_PKEY* get() const { return pkey_; }

private:
  EVP_PKEY* pkey_;
  key_type  type_;
};

class private_key {
public:
  private_key(private_key const&) = delete;
  private_key& operator=(private_key const&) = delete;

  private_key(private_key&& other) noexcept;
  private_key& operator=(private_key&& other) noexcept;

  // Takes ownership; must be an RSA or Ed25519 key.
  explicit private_key(EVP_PKEY* pkey);
  ~private_key();

  // These throw DKIM::error with status::key_material.
  static private_key from_pem(std::string_view pem);
  static private_key from_ed25519_seed(std::string_view seed);

  key_type type() const { return type_; }

  // The octets to publish, base64 encoded, as p= of the key record.
  std::string public_octets() const;

  EVP_PKEY* get() const { return pkey_; }

private:
  EVP_PKEY* pkey_;
  key_type  type_;
};

// The single place where an algorithm turns into OpenSSL calls.  The
// digest is the SHA-1 or SHA-256 of the header hash input: RSA signs it
// with PKCS#1 v1.5, Ed25519 signs the digest octets themselves.

// Throws DKIM::error with status::key_material.
std::string
sign(algorithm alg, private_key const& key, std::string_view digest);

bool verify(algorithm          alg,
            public_key const&  key,
            std::string_view   digest,
            std::string_view   sig);

} // namespace DKIM

#endif // DKIM_CRYPTO_DOT_HPP

#ifndef DKIM_TYPES_DOT_HPP
#define DKIM_TYPES_DOT_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace DKIM {

// RFC 6376 section 3.4
enum class canon_alg : bool {
  simple,
  relaxed,
};

// A bare LF inside a message is either a line ending (most MTAs hand
// us LF terminated text) or just another octet.  Signer and verifier
// must agree, so this is always passed explicitly.
enum class line_ending : bool {
  crlf,
  lf_or_crlf,
};

enum class hash_alg : bool {
  sha1,
  sha256,
};

enum class key_type : bool {
  rsa,
  ed25519,
};

// The closed set of signing algorithms, RFC 6376 section 3.3 and RFC 8463.
enum class algorithm : uint8_t {
  rsa_sha1,
  rsa_sha256,
  ed25519_sha256,
};

struct algorithm_info {
  algorithm   alg;
  char const* name;
  key_type    key;
  hash_alg    hash;
};

// clang-format off
constexpr algorithm_info algorithms[]{
  {algorithm::rsa_sha1,       "rsa-sha1",       key_type::rsa,     hash_alg::sha1},
  {algorithm::rsa_sha256,     "rsa-sha256",     key_type::rsa,     hash_alg::sha256},
  {algorithm::ed25519_sha256, "ed25519-sha256", key_type::ed25519, hash_alg::sha256},
};
// clang-format on

constexpr algorithm_info const& info(algorithm alg)
{
  return algorithms[static_cast<uint8_t>(alg)];
}

constexpr char const* c_str(algorithm alg) { return info(alg).name; }
constexpr key_type    key_type_of(algorithm alg) { return info(alg).key; }
constexpr hash_alg    hash_of(algorithm alg) { return info(alg).hash; }

std::optional<algorithm> algorithm_from(std::string_view name);
std::optional<algorithm> algorithm_for(key_type key, hash_alg hash);

constexpr char const* c_str(canon_alg alg)
{
  return alg == canon_alg::simple ? "simple" : "relaxed";
}

std::optional<canon_alg> canon_from(std::string_view name);

constexpr char const* c_str(hash_alg alg)
{
  return alg == hash_alg::sha1 ? "sha1" : "sha256";
}

std::optional<hash_alg> hash_from(std::string_view name);

constexpr char const* c_str(key_type key)
{
  return key == key_type::rsa ? "rsa" : "ed25519";
}

std::optional<key_type> key_type_from(std::string_view name);

enum class status : uint8_t {
  pass,
  header_parse_error, // malformed DKIM-Signature
  no_key,             // NXDOMAIN or no TXT record
  dns_failure,        // timeout, SERVFAIL &c.; the only retryable kind
  key_malformed,
  key_revoked,        // p= present but empty
  algorithm_mismatch, // k= or h= of the key does not fit a=
  expired,
  body_hash_mismatch,
  signature_invalid,
  unsupported_algorithm, // signing side, e.g. rsa-sha1
  key_material,          // signing side, unusable private key
};

constexpr char const* c_str(status st)
{
  switch (st) { // clang-format off
  case status::pass:                  return "pass";
  case status::header_parse_error:    return "header parse error";
  case status::no_key:                return "no key";
  case status::dns_failure:           return "DNS failure";
  case status::key_malformed:         return "key malformed";
  case status::key_revoked:           return "key revoked";
  case status::algorithm_mismatch:    return "algorithm mismatch";
  case status::expired:               return "signature expired";
  case status::body_hash_mismatch:    return "body hash mismatch";
  case status::signature_invalid:     return "signature invalid";
  case status::unsupported_algorithm: return "unsupported algorithm";
  case status::key_material:          return "key material error";
  } // clang-format on
  return "*** unknown status ***";
}

constexpr bool retryable(status st) { return st == status::dns_failure; }

class error : public std::runtime_error {
public:
  error(status code, std::string const& what)
    : std::runtime_error(what)
    , code_(code)
  {
  }

  status code() const { return code_; }

private:
  status code_;
};

} // namespace DKIM

#endif // DKIM_TYPES_DOT_HPP

#ifndef DKIM_KEY_DOT_HPP
#define DKIM_KEY_DOT_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "DKIM-types.hpp"

// A public key record as published in DNS, RFC 6376 section 3.6.1.
// The input is one TXT record, its character-strings concatenated.

namespace DKIM {

class key_record {
public:
  key_record() = default;

  // Throws DKIM::error with status::key_malformed.  A revoked key is
  // not an error here, check revoked().
  explicit key_record(std::string_view txt);

  static bool
  validate(std::string_view txt, std::string& msg, key_record& key);

  // p= present but empty.
  bool revoked() const { return revoked_; }

  // k=, nothing when it names a type we don't know.
  std::optional<key_type> key() const { return key_; }
  std::string const&      key_type_name() const { return key_name_; }

  // h= of the key, if present, restricts the hash algorithms.
  bool hash_allowed(hash_alg hash) const;

  // Both the key type and the hash algorithm fit alg.
  bool allows(algorithm alg) const;

  // s= includes "*" or "email".
  bool email_allowed() const;

  // t= flags
  bool testing() const { return testing_; }
  bool strict() const { return strict_; }

  std::string const& notes() const { return notes_; }

  // Decoded p=, the DER (or raw Ed25519) public key octets.
  std::string const& public_key() const { return public_key_; }

private:
  bool set_(std::string_view txt, std::string& msg);

  std::optional<key_type>  key_{key_type::rsa};
  std::string              key_name_{"rsa"};
  std::vector<hash_alg>    hashes_;
  std::vector<std::string> services_{"*"}; // s=
  std::string              notes_;
  std::string              public_key_;

  bool hash_restricted_{false}; // h= present
  bool revoked_{false};
  bool testing_{false};
  bool strict_{false};
};

} // namespace DKIM

#endif // DKIM_KEY_DOT_HPP

#ifndef DKIM_SIG_DOT_HPP
#define DKIM_SIG_DOT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "DKIM-types.hpp"

// The value of a DKIM-Signature header field, RFC 6376 section 3.5.

namespace DKIM {

class signature {
public:
  struct fields {
    algorithm                alg{algorithm::rsa_sha256};
    canon_alg                header_canon{canon_alg::simple};
    canon_alg                body_canon{canon_alg::simple};
    std::string              domain;   // d=
    std::string              selector; // s=
    std::vector<std::string> headers;  // h=, in order, may repeat
    std::string              body_hash; // bh=, base64 without FWS
    std::string              sig;       // b=, base64 without FWS, may be empty

    std::optional<std::string> identity;       // i=
    std::optional<uint64_t>    length;         // l=
    std::optional<std::string> query;          // q=
    std::optional<uint64_t>    timestamp;      // t=
    std::optional<uint64_t>    expiration;     // x=
    std::optional<std::string> copied_headers; // z=
  };

  signature() = default;

  // Throws DKIM::error with status::header_parse_error.
  explicit signature(std::string_view value);

  explicit signature(fields f)
    : f_(std::move(f))
  {
  }

  static bool
  validate(std::string_view value, std::string& msg, signature& sig);

  algorithm                       alg() const { return f_.alg; }
  canon_alg                       header_canon() const { return f_.header_canon; }
  canon_alg                       body_canon() const { return f_.body_canon; }
  std::string const&              domain() const { return f_.domain; }
  std::string const&              selector() const { return f_.selector; }
  std::vector<std::string> const& headers() const { return f_.headers; }

  std::string const& body_hash_b64() const { return f_.body_hash; }
  std::string const& sig_b64() const { return f_.sig; }

  // Decoded octets.
  std::string body_hash() const;
  std::string sig() const;

  std::optional<std::string> const& identity() const { return f_.identity; }
  std::optional<uint64_t> const&    length() const { return f_.length; }
  std::optional<uint64_t> const&    timestamp() const { return f_.timestamp; }
  std::optional<uint64_t> const&    expiration() const { return f_.expiration; }
  std::optional<std::string> const& query() const { return f_.query; }
  std::optional<std::string> const& copied_headers() const
  {
    return f_.copied_headers;
  }

  // The i= value, or "@" d= when there is none.
  std::string effective_identity() const;

  // Tags this code does not know, name and raw value.
  std::vector<std::pair<std::string, std::string>> const& unknown_tags() const
  {
    return unknown_;
  }

  fields const& get_fields() const { return f_; }

  // The complete "DKIM-Signature: ..." header field, folded with
  // CRLF TAB, b= last.  No line ending at the end.  Everything up to
  // and including "b=" does not depend on the b= value, so the text
  // produced with an empty b= is exactly what a verifier hashes.
  std::string as_field() const;

private:
  bool set_(std::string_view value, std::string& msg);

  fields f_;

  std::vector<std::pair<std::string, std::string>> unknown_;
};

// Is dom equal to, or a subdomain of, parent?  Case-insensitive.
bool is_same_or_subdomain(std::string_view dom, std::string_view parent);

} // namespace DKIM

#endif // DKIM_SIG_DOT_HPP

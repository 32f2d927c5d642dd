#ifndef DKIM_DOT_HPP
#define DKIM_DOT_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "DKIM-crypto.hpp"
#include "DKIM-resolver.hpp"
#include "DKIM-types.hpp"
#include "message.hpp"

namespace DKIM {

// The outcome for one DKIM-Signature header field.
struct result {
  status st{status::header_parse_error};

  std::string domain;   // d=
  std::string selector; // s=
  std::string identity; // i=, or @d=
  std::string b_prefix; // first characters of b=, to tell signatures apart

  std::optional<algorithm> alg;

  bool testing{false}; // key has t=y

  std::string detail;

  bool passed() const { return st == status::pass; }

  // RFC 8601 result: pass, fail, temperror or permerror.
  char const* summary() const;

  // dkim=pass header.d=example.com header.s=sel header.b=AbCdEfGh
  std::string as_ar() const;
};

class Verify {
public:
  struct options {
    // Seconds since the epoch to check x= against; the clock if not set.
    std::optional<uint64_t> now;

    std::chrono::milliseconds dns_timeout{std::chrono::seconds(5)};

    line_ending eol{line_ending::lf_or_crlf};

    // DKIM-Signature fields past this many, counting from the top, are
    // not checked.
    std::size_t max_signatures{10};
  };

  // The key_resolver must outlive this object.
  explicit Verify(key_resolver const& keys);
  Verify(key_resolver const& keys, options const& opts);

  Verify(key_resolver&&) = delete;
  Verify(key_resolver&&, options const&) = delete;

  // One result per DKIM-Signature field, top of the message first, for
  // at most options::max_signatures of them.  Each signature is checked
  // in its own task, or inline if no thread can be had.  Never throws for
  // anything found in the message.
  std::vector<result> check(message::parsed const& msg) const;

  void foreach_sig(message::parsed const&                   msg,
                   std::function<void(result const& res)> func) const;

  // Check the DKIM-Signature at msg.headers[idx].
  result check_sig(message::parsed const& msg, std::size_t idx) const;

private:
  void check_sig_(message::parsed const& msg,
                  std::size_t            idx,
                  result&                res) const;

  key_resolver const& keys_;
  options             opts_;
};

class Sign {
public:
  struct options {
    hash_alg hash{hash_alg::sha256};

    canon_alg header_canon{canon_alg::simple};
    canon_alg body_canon{canon_alg::simple};

    // h=, must include From.
    std::vector<std::string> headers{
        "From",        "To",          "Cc",         "Subject",
        "Date",        "Message-ID",  "Reply-To",   "In-Reply-To",
        "References",  "MIME-Version", "Content-Type",
        "Content-Transfer-Encoding",
    };

    // t=, the clock if not set.
    std::optional<uint64_t> timestamp;

    // x= is t= plus this.
    std::optional<std::chrono::seconds> expire;

    std::optional<std::string> identity; // i=
    std::optional<uint64_t>    length;   // l=

    line_ending eol{line_ending::lf_or_crlf};
  };

  // Throw DKIM::error: status::unsupported_algorithm for SHA-1,
  // status::header_parse_error when the options can't make a valid
  // signature.  The key must outlive this object.
  Sign(private_key const& key, std::string selector, std::string domain);
  Sign(private_key const& key,
       std::string        selector,
       std::string        domain,
       options const&     opts);

  Sign(private_key&&, std::string, std::string) = delete;
  Sign(private_key&&, std::string, std::string, options const&) = delete;

  // The complete DKIM-Signature header field, without a line ending, to
  // be put on top of the message.  Throws DKIM::error with
  // status::key_material if the key won't sign.
  std::string sign(message::parsed const& msg) const;

  algorithm alg() const { return alg_; }

private:
  private_key const& key_;
  std::string        selector_;
  std::string        domain_;
  options            opts_;
  algorithm          alg_;
};

} // namespace DKIM

#endif // DKIM_DOT_HPP

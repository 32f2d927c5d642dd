#include "DKIM.hpp"

#include "Base64.hpp"
#include "DKIM-hash.hpp"
#include "DKIM-key.hpp"
#include "DKIM-sig.hpp"
#include "DKIM-tags.hpp"
#include "iequal.hpp"

#include <algorithm>
#include <future>
#include <iterator>
#include <system_error>

#include <fmt/format.h>

#include <glog/logging.h>

namespace {
auto constexpr b_prefix_len = 8;

// RSA keys smaller than this are still accepted, but noted.
auto constexpr min_rsa_bits = 1024;

uint64_t seconds_since_epoch()
{
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

// The domain part of an i= value.
std::string_view identity_domain(std::string_view identity)
{
  auto const at = identity.rfind('@');
  if (at == std::string_view::npos)
    return identity;
  return identity.substr(at + 1);
}
} // namespace

namespace DKIM {

char const* result::summary() const
{
  switch (st) {
  case status::pass: return "pass";

  case status::dns_failure: return "temperror";

  case status::header_parse_error:
  case status::no_key:
  case status::key_malformed:
  case status::key_revoked:
  case status::algorithm_mismatch:
  case status::unsupported_algorithm:
  case status::key_material: return "permerror";

  case status::expired:
  case status::body_hash_mismatch:
  case status::signature_invalid: return "fail";
  }
  return "permerror";
}

std::string result::as_ar() const
{
  fmt::memory_buffer bfr;
  fmt::format_to(std::back_inserter(bfr), "dkim={}", summary());
  if (!passed())
    fmt::format_to(std::back_inserter(bfr), " ({})", c_str(st));
  if (!domain.empty())
    fmt::format_to(std::back_inserter(bfr), " header.d={}", domain);
  if (!selector.empty())
    fmt::format_to(std::back_inserter(bfr), " header.s={}", selector);
  if (!b_prefix.empty())
    fmt::format_to(std::back_inserter(bfr), " header.b={}", b_prefix);
  return fmt::to_string(bfr);
}

Verify::Verify(key_resolver const& keys)
  : keys_(keys)
{
}

Verify::Verify(key_resolver const& keys, options const& opts)
  : keys_(keys)
  , opts_(opts)
{
}

std::vector<result> Verify::check(message::parsed const& msg) const
{
  auto sigs = msg.find_all(message::DKIM_Signature);
  if (sigs.size() > opts_.max_signatures) {
    LOG(WARNING) << sigs.size() << " DKIM-Signature fields, checking the top "
                 << opts_.max_signatures;
    sigs.resize(opts_.max_signatures);
  }

  std::vector<std::future<result>> tasks;
  tasks.reserve(sigs.size());
  for (auto const idx : sigs) {
    auto const task = [this, &msg, idx] { return check_sig(msg, idx); };
    try {
      tasks.push_back(std::async(std::launch::async, task));
    }
    catch (std::system_error const& e) {
      LOG(WARNING) << "no thread for DKIM-Signature at header " << idx << ": "
                   << e.what();
      tasks.push_back(std::async(std::launch::deferred, task));
    }
  }

  std::vector<result> results;
  results.reserve(tasks.size());
  for (auto& task : tasks)
    results.push_back(task.get());

  LOG_IF(INFO, results.empty()) << "no DKIM-Signature";
  return results;
}

void Verify::foreach_sig(message::parsed const&                 msg,
                         std::function<void(result const& res)> func) const
{
  for (auto const& res : check(msg))
    func(res);
}

result Verify::check_sig(message::parsed const& msg, std::size_t idx) const
{
  result res;
  try {
    check_sig_(msg, idx, res);
  }
  catch (error const& e) {
    res.st     = e.code();
    res.detail = e.what();
  }
  catch (std::invalid_argument const& e) {
    // Base64 decoding of something that passed validation.
    res.st     = status::header_parse_error;
    res.detail = e.what();
  }

  if (res.passed()) {
    LOG(INFO) << "DKIM pass for " << res.domain << " selector "
              << res.selector;
  }
  else {
    LOG(INFO) << "DKIM " << c_str(res.st) << " for "
              << (res.domain.empty() ? "(unknown)" : res.domain) << ": "
              << res.detail;
  }
  return res;
}

void Verify::check_sig_(message::parsed const& msg,
                        std::size_t            idx,
                        result&                res) const
{
  CHECK_LT(idx, msg.headers.size());

  // Our own copy of the field.
  std::string const field(msg.headers[idx].as_view());
  std::string const value(msg.headers[idx].value);

  signature   sig;
  std::string msg_str;
  if (!signature::validate(value, msg_str, sig)) {
    // Report whatever we can find.
    tag_list tags;
    if (tags.parse(value)) {
      if (auto const d = tags.find("d"))
        res.domain = strip_fws(*d);
      if (auto const s = tags.find("s"))
        res.selector = strip_fws(*s);
    }
    res.st     = status::header_parse_error;
    res.detail = msg_str;
    return;
  }

  res.domain   = sig.domain();
  res.selector = sig.selector();
  res.identity = sig.effective_identity();
  res.b_prefix = sig.sig_b64().substr(0, b_prefix_len);
  res.alg      = sig.alg();

  auto const now = opts_.now ? *opts_.now : seconds_since_epoch();
  if (sig.expiration() && *sig.expiration() < now) {
    res.st     = status::expired;
    res.detail = fmt::format("expired at {}, now {}", *sig.expiration(), now);
    return;
  }

  auto const hash = hash_of(sig.alg());

  auto const bh =
      body_hash(hash, sig.body_canon(), msg.body, sig.length(), opts_.eol);
  if (bh != sig.body_hash()) {
    res.st     = status::body_hash_mismatch;
    res.detail = fmt::format("computed bh={}", Base64::enc(bh));
    return;
  }

  auto const lookup =
      keys_.resolve(sig.selector(), sig.domain(), opts_.dns_timeout);
  if (lookup.st != status::pass) {
    res.st     = lookup.st;
    res.detail = lookup.detail;
    return;
  }

  auto const& key = lookup.key;
  res.testing     = key.testing();

  if (!key.allows(sig.alg())) {
    res.st     = status::algorithm_mismatch;
    res.detail = fmt::format("key k={} does not allow a={}",
                             key.key_type_name(), c_str(sig.alg()));
    return;
  }
  if (!key.email_allowed()) {
    res.st     = status::key_malformed;
    res.detail = "key s= does not include email";
    return;
  }
  if (key.strict() &&
      !iequal(identity_domain(res.identity), sig.domain())) {
    res.st     = status::signature_invalid;
    res.detail = fmt::format("key t=s, but i={} is a subdomain of d={}",
                             res.identity, sig.domain());
    return;
  }

  public_key const pub(key_type_of(sig.alg()), key.public_key());
  if (pub.type() == key_type::rsa && pub.bits() < min_rsa_bits) {
    LOG(WARNING) << "keysize " << pub.bits() << " too small for domain "
                 << sig.domain();
  }

  auto const stripped = remove_b_value(field);
  CHECK(stripped) << "signature parsed, but b= not found";

  auto const digest = header_hash(hash, msg, sig.headers(), sig.header_canon(),
                                  *stripped, opts_.eol, idx);

  if (!verify(sig.alg(), pub, digest, sig.sig())) {
    res.st     = status::signature_invalid;
    res.detail = "signature does not verify";
    return;
  }

  res.st = status::pass;
}

Sign::Sign(private_key const& key, std::string selector, std::string domain)
  : Sign(key, std::move(selector), std::move(domain), options{})
{
}

Sign::Sign(private_key const& key,
           std::string        selector,
           std::string        domain,
           options const&     opts)
  : key_(key)
  , selector_(std::move(selector))
  , domain_(std::move(domain))
  , opts_(opts)
{
  if (opts_.hash == hash_alg::sha1) {
    throw error(status::unsupported_algorithm,
                "signing with SHA-1 is not supported");
  }
  auto const alg = algorithm_for(key_.type(), opts_.hash);
  CHECK(alg) << "no algorithm for " << c_str(key_.type()) << " with "
             << c_str(opts_.hash);
  alg_ = *alg;

  if (selector_.empty())
    throw error(status::header_parse_error, "empty selector");
  if (domain_.empty())
    throw error(status::header_parse_error, "empty signing domain");
  if (std::none_of(begin(opts_.headers), end(opts_.headers),
                   [](auto const& h) { return iequal(h, message::From); })) {
    throw error(status::header_parse_error, "signed headers must include From");
  }
  if (opts_.expire && opts_.expire->count() <= 0)
    throw error(status::header_parse_error, "expiry must be in the future");
  if (opts_.identity) {
    auto const at = opts_.identity->rfind('@');
    if (at == std::string::npos ||
        !is_same_or_subdomain(identity_domain(*opts_.identity), domain_)) {
      throw error(status::header_parse_error,
                  fmt::format("identity {} not within {}", *opts_.identity,
                              domain_));
    }
  }
}

std::string Sign::sign(message::parsed const& msg) const
{
  auto const hash = hash_of(alg_);

  signature::fields f;
  f.alg          = alg_;
  f.header_canon = opts_.header_canon;
  f.body_canon   = opts_.body_canon;
  f.domain       = domain_;
  f.selector     = selector_;
  f.headers      = opts_.headers;
  f.identity     = opts_.identity;
  f.length       = opts_.length;
  f.timestamp    = opts_.timestamp ? *opts_.timestamp : seconds_since_epoch();
  if (opts_.expire)
    f.expiration = *f.timestamp + opts_.expire->count();

  f.body_hash = Base64::enc(
      body_hash(hash, opts_.body_canon, msg.body, opts_.length, opts_.eol));

  // b= empty, exactly what a verifier will hash after deleting b=.
  auto const unsigned_field = signature(f).as_field();

  auto const digest = header_hash(hash, msg, f.headers, opts_.header_canon,
                                  unsigned_field, opts_.eol);

  f.sig = Base64::enc(DKIM::sign(alg_, key_, digest));

  auto const field = signature(f).as_field();
  CHECK(field.starts_with(unsigned_field));

  LOG(INFO) << "signed for " << domain_ << " selector " << selector_ << " with "
            << c_str(alg_);
  return field;
}

} // namespace DKIM

#include "DKIM.hpp"

#include "Base64.hpp"
#include "DKIM-memory-resolver.hpp"

#include <string>
#include <type_traits>
#include <vector>

#include <openssl/evp.h>

#include <fmt/format.h>

#include <glog/logging.h>

using namespace std::chrono_literals;

using DKIM::canon_alg;
using DKIM::private_key;
using DKIM::status;

// Sign and Verify hold references; a temporary would dangle.
static_assert(std::is_constructible_v<DKIM::Sign,
                                      private_key const&,
                                      char const*,
                                      char const*>);
static_assert(!std::is_constructible_v<DKIM::Sign,
                                       private_key,
                                       char const*,
                                       char const*>);
static_assert(!std::is_constructible_v<DKIM::Sign,
                                       private_key,
                                       char const*,
                                       char const*,
                                       DKIM::Sign::options const&>);
static_assert(std::is_constructible_v<DKIM::Verify, DKIM::key_resolver const&>);
static_assert(!std::is_constructible_v<DKIM::Verify, DKIM::key_resolver>);
static_assert(!std::is_constructible_v<DKIM::Verify,
                                       DKIM::key_resolver,
                                       DKIM::Verify::options const&>);

namespace {
auto constexpr text = "From: Joe SixPack <joe@football.example.com>\r\n"
                      "To: Suzie Q <suzie@shopping.example.net>\r\n"
                      "Subject: Is dinner ready?\r\n"
                      "Date: Fri, 11 Jul 2003 21:00:37 -0700 (PDT)\r\n"
                      "Message-ID: <20030712040037.46341.5F8J@football.example.com>\r\n"
                      "\r\n"
                      "Hi.\r\n"
                      "\r\n"
                      "We lost the game.  Are you hungry yet?\r\n"
                      "\r\n"
                      "Joe.\r\n";

std::string key_txt(char const* k, private_key const& key)
{
  return fmt::format("v=DKIM1; k={}; p={}", k,
                     Base64::enc(key.public_octets()));
}

// Sign text, and return it with the new field on top.
std::string sign(DKIM::Sign const& signer, std::string const& input)
{
  message::parsed msg;
  CHECK(msg.parse(input));
  return fmt::format("{}\r\n{}", signer.sign(msg), input);
}

std::vector<DKIM::result> verify(DKIM::Verify const& verifier,
                                 std::string const&  input)
{
  message::parsed msg;
  CHECK(msg.parse(input));
  return verifier.check(msg);
}

status verify_one(DKIM::Verify const& verifier, std::string const& input)
{
  auto const results = verify(verifier, input);
  CHECK_EQ(results.size(), 1);
  return results[0].st;
}

void replace(std::string& str, std::string_view from, std::string_view to)
{
  auto const pos = str.find(from);
  CHECK_NE(pos, std::string::npos) << from;
  str.replace(pos, from.size(), to);
}

// For text in the body, that could also turn up in b= or bh=.
void replace_last(std::string& str, std::string_view from, std::string_view to)
{
  auto const pos = str.rfind(from);
  CHECK_NE(pos, std::string::npos) << from;
  str.replace(pos, from.size(), to);
}
} // namespace

int main(int argc, char* argv[])
{
  private_key const rsa(
      CHECK_NOTNULL(EVP_PKEY_Q_keygen(nullptr, nullptr, "RSA", size_t{2048})));
  private_key const ed(
      CHECK_NOTNULL(EVP_PKEY_Q_keygen(nullptr, nullptr, "ED25519")));

  DKIM::memory_resolver dns;
  dns.add("rsa._domainkey.example.com", key_txt("rsa", rsa));
  dns.add("ed._domainkey.example.com", key_txt("ed25519", ed));
  dns.add("revoked._domainkey.example.com", "v=DKIM1; k=rsa; p=");
  dns.add("garbage._domainkey.example.com", "this is no key record");
  dns.add("wrong._domainkey.example.com", key_txt("rsa", rsa));
  dns.add("testing._domainkey.example.com",
          fmt::format("{}; t=y", key_txt("rsa", rsa)));
  dns.add("strict._domainkey.example.com",
          fmt::format("{}; t=s", key_txt("rsa", rsa)));
  dns.add("sha1only._domainkey.example.com",
          fmt::format("{}; h=sha1", key_txt("rsa", rsa)));
  dns.add("web._domainkey.example.com",
          fmt::format("{}; s=web", key_txt("rsa", rsa)));
  dns.fail("broken._domainkey.example.com", "timed out");
  dns.add("slow._domainkey.example.com", key_txt("rsa", rsa));
  dns.delay("slow._domainkey.example.com", 60s);

  DKIM::key_resolver const keys(dns);
  DKIM::Verify const       verifier(keys);

  // Every algorithm with every canonicalization.
  struct {
    char const*        selector;
    private_key const& key;
  } const signers[]{
      {"rsa", rsa},
      {"ed", ed},
  };
  for (auto const& s : signers) {
    for (auto hdr : {canon_alg::simple, canon_alg::relaxed}) {
      for (auto body : {canon_alg::simple, canon_alg::relaxed}) {
        DKIM::Sign::options opts;
        opts.header_canon = hdr;
        opts.body_canon   = body;
        DKIM::Sign const signer(s.key, s.selector, "example.com", opts);

        auto const signed_text = sign(signer, text);
        auto const results     = verify(verifier, signed_text);
        CHECK_EQ(results.size(), 1);
        auto const& res = results[0];
        CHECK(res.passed()) << s.selector << " " << c_str(hdr) << "/"
                            << c_str(body) << ": " << res.detail;
        CHECK_EQ(res.domain, "example.com");
        CHECK_EQ(res.selector, s.selector);
        CHECK_EQ(res.identity, "@example.com");
        CHECK_STREQ(res.summary(), "pass");
        CHECK(res.as_ar().starts_with(fmt::format(
            "dkim=pass header.d=example.com header.s={} header.b=",
            s.selector)));
        CHECK(!res.testing);

        // A changed body octet.
        auto body_changed = signed_text;
        replace(body_changed, "hungry", "Hungry");
        CHECK(verify_one(verifier, body_changed) ==
              status::body_hash_mismatch);

        // A changed signed header.
        auto header_changed = signed_text;
        replace(header_changed, "Subject: Is dinner ready?",
                "Subject: Is lunch ready?");
        CHECK(verify_one(verifier, header_changed) ==
              status::signature_invalid);

        // An added header that was not signed.
        auto header_added = signed_text;
        replace(header_added, "Date: ", "X-Mailer: mutt\r\nDate: ");
        CHECK(verify_one(verifier, header_added) == status::pass);

        // But adding a second Subject, which h= covers, breaks it.
        auto subject_added = signed_text;
        replace(subject_added, "Date: ", "Subject: Free food\r\nDate: ");
        CHECK(verify_one(verifier, subject_added) ==
              status::signature_invalid);
      }
    }
  }

  // Relaxed survives re-folding and white space changes.
  {
    DKIM::Sign::options opts;
    opts.header_canon = canon_alg::relaxed;
    opts.body_canon   = canon_alg::relaxed;
    DKIM::Sign const signer(rsa, "rsa", "example.com", opts);
    auto signed_text = sign(signer, text);
    replace(signed_text, "Subject: Is dinner ready?",
            "subject:   Is dinner\r\n\t ready?");
    replace(signed_text, "We lost the game.", "We lost   the game.  ");
    CHECK(verify_one(verifier, signed_text) == status::pass);
  }

  // Expiry.
  {
    DKIM::Sign::options opts;
    opts.timestamp = 1000;
    opts.expire    = 60s;
    DKIM::Sign const signer(rsa, "rsa", "example.com", opts);
    auto const       signed_text = sign(signer, text);
    CHECK_NE(signed_text.find("x=1060"), std::string::npos);

    CHECK(verify_one(verifier, signed_text) == status::expired);

    DKIM::Verify::options vopts;
    vopts.now = 1030;
    DKIM::Verify const before(keys, vopts);
    CHECK(verify_one(before, signed_text) == status::pass);
  }

  // Key problems.
  struct {
    char const* selector;
    status      st;
    char const* summary;
  } const key_cases[]{
      {"revoked", status::key_revoked, "permerror"},
      {"garbage", status::key_malformed, "permerror"},
      {"missing", status::no_key, "permerror"},
      {"broken", status::dns_failure, "temperror"},
      {"sha1only", status::algorithm_mismatch, "permerror"},
      {"web", status::key_malformed, "permerror"},
  };
  for (auto const& kc : key_cases) {
    DKIM::Sign const signer(rsa, kc.selector, "example.com");
    auto const       results = verify(verifier, sign(signer, text));
    CHECK_EQ(results.size(), 1);
    CHECK(results[0].st == kc.st) << kc.selector << " " << c_str(results[0].st);
    CHECK_STREQ(results[0].summary(), kc.summary);
  }

  // Testing flag is reported, the signature still passes.
  {
    DKIM::Sign const signer(rsa, "testing", "example.com");
    auto const       results = verify(verifier, sign(signer, text));
    CHECK(results[0].passed());
    CHECK(results[0].testing);
  }

  // t=s forbids an i= in a subdomain of d=.
  {
    DKIM::Sign::options opts;
    opts.identity = "joe@football.example.com";
    DKIM::Sign const signer(rsa, "strict", "example.com", opts);
    CHECK(verify_one(verifier, sign(signer, text)) ==
          status::signature_invalid);

    opts.identity = "joe@example.com";
    DKIM::Sign const same(rsa, "strict", "example.com", opts);
    CHECK(verify_one(verifier, sign(same, text)) == status::pass);
  }

  // Two signatures, one good, one bad, each with its own result.
  {
    DKIM::Sign const good(rsa, "rsa", "example.com");
    DKIM::Sign const bad(ed, "wrong", "example.com");

    message::parsed msg;
    CHECK(msg.parse(text));
    auto const both =
        fmt::format("{}\r\n{}\r\n{}", bad.sign(msg), good.sign(msg), text);

    auto const results = verify(verifier, both);
    CHECK_EQ(results.size(), 2);
    CHECK(results[0].st == status::algorithm_mismatch);
    CHECK_EQ(results[0].selector, "wrong");
    CHECK(results[1].passed());
    CHECK_EQ(results[1].selector, "rsa");

    // The same, one at a time through a callback.
    message::parsed both_msg;
    CHECK(both_msg.parse(both));
    std::vector<std::string> seen;
    verifier.foreach_sig(both_msg, [&seen](DKIM::result const& res) {
      seen.push_back(fmt::format("{}={}", res.selector, res.summary()));
    });
    CHECK_EQ(seen.size(), 2);
    CHECK_EQ(seen[0], "wrong=permerror");
    CHECK_EQ(seen[1], "rsa=pass");
  }

  // A key lookup that runs out of time fails its own signature only.
  {
    DKIM::Verify::options vopts;
    vopts.dns_timeout = 50ms;
    DKIM::Verify const hurried(keys, vopts);

    DKIM::Sign const slow(rsa, "slow", "example.com");
    DKIM::Sign const good(ed, "ed", "example.com");

    message::parsed msg;
    CHECK(msg.parse(text));
    auto const both =
        fmt::format("{}\r\n{}\r\n{}", slow.sign(msg), good.sign(msg), text);

    auto const results = verify(hurried, both);
    CHECK_EQ(results.size(), 2);
    CHECK(results[0].st == status::dns_failure) << c_str(results[0].st);
    CHECK_STREQ(results[0].summary(), "temperror");
    CHECK(DKIM::retryable(results[0].st));
    CHECK_EQ(results[0].selector, "slow");
    CHECK(results[1].passed()) << results[1].detail;
  }

  // Hundreds of signatures: only the top ones are checked.
  {
    DKIM::Sign const signer(ed, "ed", "example.com");
    message::parsed  msg;
    CHECK(msg.parse(text));
    auto const field = signer.sign(msg);

    std::string many;
    for (auto i = 0; i < 500; ++i) {
      many += field;
      many += "\r\n";
    }
    many += text;

    auto const results = verify(verifier, many);
    CHECK_EQ(results.size(), DKIM::Verify::options{}.max_signatures);
    for (auto const& res : results)
      CHECK(res.passed()) << res.detail;

    DKIM::Verify::options vopts;
    vopts.max_signatures = 3;
    DKIM::Verify const few(keys, vopts);
    CHECK_EQ(verify(few, many).size(), 3);
  }

  // l= limits the body hash to that many canonical octets.
  {
    DKIM::Sign::options opts;
    opts.length = 1;
    DKIM::Sign const signer(rsa, "rsa", "example.com", opts);
    auto signed_text = sign(signer, "From: joe@example.com\r\n\r\nAB\r\n");
    CHECK_NE(signed_text.find("l=1;"), std::string::npos);
    CHECK(verify_one(verifier, signed_text) == status::pass);
    replace_last(signed_text, "AB\r\n", "AXYZ\r\nmore\r\n");
    CHECK(verify_one(verifier, signed_text) == status::pass);
    replace_last(signed_text, "AXYZ", "BXYZ");
    CHECK(verify_one(verifier, signed_text) == status::body_hash_mismatch);
  }

  // Bare LF line endings are line endings, on both sides.
  {
    auto const lf_text = "From: joe@example.com\n"
                         "Subject: lf\n"
                         "\n"
                         "line one\n"
                         "line two\n";
    DKIM::Sign const signer(ed, "ed", "example.com");
    message::parsed  msg;
    CHECK(msg.parse(lf_text));
    auto const signed_text = fmt::format("{}\n{}", signer.sign(msg), lf_text);
    CHECK(verify_one(verifier, signed_text) == status::pass);

    // The CRLF version of the same message verifies too.
    std::string crlf_text;
    for (auto ch : signed_text) {
      if (ch == '\n' && (crlf_text.empty() || crlf_text.back() != '\r'))
        crlf_text += '\r';
      crlf_text += ch;
    }
    CHECK(verify_one(verifier, crlf_text) == status::pass);
  }

  // Signatures that don't parse.
  {
    auto const broken =
        fmt::format("DKIM-Signature: v=1; a=rsa-sha256; d=example.com; "
                    "s=rsa; h=to; bh=MTIz; b=YWJj\r\n{}",
                    text);
    auto const results = verify(verifier, broken);
    CHECK_EQ(results.size(), 1);
    CHECK(results[0].st == status::header_parse_error);
    CHECK_EQ(results[0].domain, "example.com");
    CHECK_STREQ(results[0].summary(), "permerror");
    CHECK(results[0].as_ar().starts_with("dkim=permerror"));

    auto const garbage =
        fmt::format("DKIM-Signature: this is not a tag list\r\n{}", text);
    CHECK(verify_one(verifier, garbage) == status::header_parse_error);
  }

  // No signature, no results.
  CHECK(verify(verifier, text).empty());

  // Signer refusals.
  try {
    DKIM::Sign::options opts;
    opts.hash = DKIM::hash_alg::sha1;
    DKIM::Sign const signer(rsa, "rsa", "example.com", opts);
    LOG(FATAL) << "should have thrown";
  }
  catch (DKIM::error const& e) {
    CHECK(e.code() == status::unsupported_algorithm);
  }
  try {
    DKIM::Sign::options opts;
    opts.headers = {"To", "Subject"};
    DKIM::Sign const signer(rsa, "rsa", "example.com", opts);
    LOG(FATAL) << "should have thrown";
  }
  catch (DKIM::error const& e) {
    CHECK(e.code() == status::header_parse_error);
  }
  try {
    DKIM::Sign::options opts;
    opts.identity = "joe@example.org";
    DKIM::Sign const signer(rsa, "rsa", "example.com", opts);
    LOG(FATAL) << "should have thrown";
  }
  catch (DKIM::error const& e) {
    CHECK(e.code() == status::header_parse_error);
  }

  // The results of a verify, in the Authentication-Results style.
  DKIM::result res;
  res.st       = status::body_hash_mismatch;
  res.domain   = "example.com";
  res.selector = "sel";
  res.b_prefix = "AbCdEfGh";
  CHECK_EQ(res.as_ar(), "dkim=fail (body hash mismatch) header.d=example.com "
                        "header.s=sel header.b=AbCdEfGh");
}

#include "DKIM-sig.hpp"

#include "DKIM-tags.hpp"

#include <glog/logging.h>

using DKIM::signature;

int main(int argc, char* argv[])
{
  auto const value = "v=1; a=rsa-sha256; c=relaxed/simple; d=example.com;\r\n"
                     "\ts=brisbane; i=joe@football.example.com;\r\n"
                     "\th=From : To :\r\n\tSubject:from; t=1117574938; "
                     "x=1118006938;\r\n"
                     "\tbh=2jUSOH9NhtVGCQWNr9BrIAPreKQjO6Sn7XIkfJVOzv8=;\r\n"
                     "\tb=dzdVyOfAKCdLXdJOc9G2q8LoXSlEniSbav+yuU4zGeeruD00lszZ\r\n"
                     "\t VoG4ZHRNiYzR; foo=bar baz";

  // i= is not within d= above.
  std::string msg;
  signature   sig;
  CHECK(!signature::validate(value, msg, sig));
  CHECK_EQ(msg, "i=joe@football.example.com not within d=example.com");

  signature parsed{std::string("v=1; a=rsa-sha256; c=relaxed/simple; "
                               "d=football.example.com;\r\n"
                               "\ts=brisbane; i=joe@football.example.com;\r\n"
                               "\th=From : To :\r\n\tSubject:from; "
                               "t=1117574938; x=1118006938;\r\n"
                               "\tbh=2jUSOH9NhtVGCQWNr9BrIAPreKQjO6Sn7XIkfJVO"
                               "zv8=;\r\n"
                               "\tb=dzdVyOfAKCdLXdJOc9G2q8LoXSlEniSbav+yuU4zGee"
                               "ruD00lszZ\r\n"
                               "\t VoG4ZHRNiYzR; foo=bar baz")};

  CHECK(parsed.alg() == DKIM::algorithm::rsa_sha256);
  CHECK(parsed.header_canon() == DKIM::canon_alg::relaxed);
  CHECK(parsed.body_canon() == DKIM::canon_alg::simple);
  CHECK_EQ(parsed.domain(), "football.example.com");
  CHECK_EQ(parsed.selector(), "brisbane");
  CHECK_EQ(parsed.headers().size(), 4);
  CHECK_EQ(parsed.headers()[0], "From");
  CHECK_EQ(parsed.headers()[2], "Subject");
  CHECK_EQ(parsed.headers()[3], "from");
  CHECK_EQ(*parsed.identity(), "joe@football.example.com");
  CHECK_EQ(*parsed.timestamp(), 1117574938);
  CHECK_EQ(*parsed.expiration(), 1118006938);
  CHECK(!parsed.length());
  CHECK_EQ(parsed.body_hash_b64(),
           "2jUSOH9NhtVGCQWNr9BrIAPreKQjO6Sn7XIkfJVOzv8=");
  CHECK_EQ(parsed.body_hash().size(), 32);
  CHECK_EQ(parsed.sig_b64(),
           "dzdVyOfAKCdLXdJOc9G2q8LoXSlEniSbav+yuU4zGeeruD00lszZVoG4ZHRNiYzR");
  CHECK_EQ(parsed.unknown_tags().size(), 1);
  CHECK_EQ(parsed.unknown_tags()[0].first, "foo");
  CHECK_EQ(parsed.unknown_tags()[0].second, "bar baz");

  // Subdomain identity.
  CHECK(DKIM::is_same_or_subdomain("football.example.com", "example.com"));
  CHECK(DKIM::is_same_or_subdomain("Example.COM", "example.com"));
  CHECK(!DKIM::is_same_or_subdomain("badexample.com", "example.com"));
  CHECK(!DKIM::is_same_or_subdomain("example.com", "football.example.com"));

  auto const minimal = "v=1; a=ed25519-sha256; d=example.com; s=sel; "
                       "h=from; bh=MTIz; b=YWJj";
  signature min{minimal};
  CHECK(min.alg() == DKIM::algorithm::ed25519_sha256);
  CHECK(min.header_canon() == DKIM::canon_alg::simple);
  CHECK(min.body_canon() == DKIM::canon_alg::simple);
  CHECK_EQ(min.effective_identity(), "@example.com");
  CHECK_EQ(min.sig(), "abc");

  // A lone c= names the header algorithm, the body one stays simple.
  signature lone{"v=1; a=rsa-sha1; c=relaxed; d=example.com; s=sel; "
                 "h=from; bh=MTIz; b=YWJj"};
  CHECK(lone.header_canon() == DKIM::canon_alg::relaxed);
  CHECK(lone.body_canon() == DKIM::canon_alg::simple);
  CHECK(lone.alg() == DKIM::algorithm::rsa_sha1);

  // Duplicate tags: the first one wins.
  signature dup{"v=1; a=rsa-sha256; d=first.example; s=sel; h=from; "
                "bh=MTIz; b=YWJj; d=second.example"};
  CHECK_EQ(dup.domain(), "first.example");

  struct {
    char const* value;
    char const* msg;
  } const bad[]{
      {"v=1; a=rsa-sha256; d=example.com; s=sel; h=from; bh=MTIz",
       "missing required tag b="},
      {"v=2; a=rsa-sha256; d=example.com; s=sel; h=from; bh=MTIz; b=YWJj",
       "unknown version v=2"},
      {"v=1; a=dsa-sha256; d=example.com; s=sel; h=from; bh=MTIz; b=YWJj",
       "unknown signing algorithm a=dsa-sha256"},
      {"v=1; a=rsa-sha256; c=relaxed/fancy; d=example.com; s=sel; h=from; "
       "bh=MTIz; b=YWJj",
       "unknown canonicalization c=relaxed/fancy"},
      {"v=1; a=rsa-sha256; d=example.com; s=sel; h=to:subject; bh=MTIz; "
       "b=YWJj",
       "h= does not include From"},
      {"v=1; a=rsa-sha256; d=example.com; s=sel; h=from; bh=MTIz; b=Y!Jj",
       "b= is not valid base64"},
      {"v=1; a=rsa-sha256; d=example.com; s=sel; h=from; bh=MTIz; b=",
       "empty b="},
      {"v=1; a=rsa-sha256; d=example.com; s=sel; h=from; bh=MTIz; b=YWJj; "
       "l=-1",
       "bad number l=-1"},
      {"v=1; a=rsa-sha256; d=example.com; s=sel; h=from; bh=MTIz; b=YWJj; "
       "t=100; x=100",
       "x=100 not after t=100"},
      {"v=1; a=rsa-sha256; d=example.com; s=sel; h=from; bh=MTIz; b=YWJj; "
       "q=http/well-known",
       "unknown query method q=http/well-known"},
      {"v=1; a=rsa-sha256; d=example.com; s=sel; h=from; bh=MTIz; b=YWJj; "
       "i=example.com",
       "i=example.com has no @"},
      {"v=1; a=rsa-sha256; d=example.com; s=sel; h=from; bh=MTIz; b=YWJj; =x",
       "DKIM-Signature tag-list syntax error"},
  };
  for (auto const& b : bad) {
    signature s;
    std::string m;
    CHECK(!signature::validate(b.value, m, s)) << b.value;
    CHECK_EQ(m, b.msg);
  }

  try {
    signature s{"v=1"};
    LOG(FATAL) << "should have thrown";
  }
  catch (DKIM::error const& e) {
    CHECK(e.code() == DKIM::status::header_parse_error);
  }

  // Serialize, fold, and parse again.
  signature::fields f;
  f.alg          = DKIM::algorithm::ed25519_sha256;
  f.header_canon = DKIM::canon_alg::relaxed;
  f.body_canon   = DKIM::canon_alg::relaxed;
  f.domain       = "example.com";
  f.selector     = "brisbane";
  f.headers      = {"from",       "to",      "subject", "date",
                    "message-id", "from",    "reply-to", "cc",
                    "mime-version", "content-type"};
  f.body_hash    = "2jUSOH9NhtVGCQWNr9BrIAPreKQjO6Sn7XIkfJVOzv8=";
  f.identity     = "@example.com";
  f.timestamp    = 1528637909;
  f.expiration   = 1528637909 + 3600;
  f.length       = 1234;

  signature const unsigned_sig{f};
  auto const      unsigned_field = unsigned_sig.as_field();
  CHECK(unsigned_field.starts_with("DKIM-Signature: v=1; a=ed25519-sha256; "));
  CHECK(unsigned_field.ends_with("b="));

  f.sig = "/gCrinpcQOoIfuHNQIbq4pgh9kyIK3AQUdt9OdqQehSwhEIug4D11Bus"
          "Fa3bT3FY5OsU7ZbnKELq+eXdp1Q1Dw==";
  signature const signed_sig{f};
  auto const      field = signed_sig.as_field();

  // Hashing the unsigned form is the same as deleting b= from the signed.
  CHECK(field.starts_with(unsigned_field));
  CHECK_EQ(*DKIM::remove_b_value(field), unsigned_field);

  // No line longer than 76 octets.
  std::string_view rest(field);
  for (auto eol = rest.find("\r\n"); eol != std::string_view::npos;
       eol      = rest.find("\r\n")) {
    CHECK_LE(eol, 76);
    CHECK_EQ(rest[eol + 2], '\t');
    rest.remove_prefix(eol + 2);
  }
  CHECK_LE(rest.size(), 76);

  signature const reparsed{std::string_view(field).substr(field.find(':') + 1)};
  CHECK(reparsed.alg() == f.alg);
  CHECK(reparsed.header_canon() == f.header_canon);
  CHECK(reparsed.body_canon() == f.body_canon);
  CHECK_EQ(reparsed.domain(), f.domain);
  CHECK_EQ(reparsed.selector(), f.selector);
  CHECK(reparsed.headers() == f.headers);
  CHECK_EQ(reparsed.body_hash_b64(), f.body_hash);
  CHECK_EQ(reparsed.sig_b64(), f.sig);
  CHECK_EQ(*reparsed.identity(), *f.identity);
  CHECK_EQ(*reparsed.timestamp(), *f.timestamp);
  CHECK_EQ(*reparsed.expiration(), *f.expiration);
  CHECK_EQ(*reparsed.length(), *f.length);
}

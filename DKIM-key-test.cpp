#include "DKIM-key.hpp"

#include <glog/logging.h>

using DKIM::algorithm;
using DKIM::key_record;

int main(int argc, char* argv[])
{
  // RFC 8463 section A.2 style record
  key_record ed{"v=DKIM1; k=ed25519; "
                "p=11qYAYKxCrfVS/7TyWQHOg7hcvPapiMlrwIaaPcHURo="};
  CHECK(!ed.revoked());
  CHECK(ed.key() == DKIM::key_type::ed25519);
  CHECK_EQ(ed.public_key().size(), 32);
  CHECK(ed.allows(algorithm::ed25519_sha256));
  CHECK(!ed.allows(algorithm::rsa_sha256));
  CHECK(ed.email_allowed());
  CHECK(!ed.testing());
  CHECK(!ed.strict());

  // Defaults: k=rsa, any hash, any service.
  key_record rsa{"p=MTIzNDU2"};
  CHECK(rsa.key() == DKIM::key_type::rsa);
  CHECK_EQ(rsa.key_type_name(), "rsa");
  CHECK(rsa.allows(algorithm::rsa_sha1));
  CHECK(rsa.allows(algorithm::rsa_sha256));
  CHECK(!rsa.allows(algorithm::ed25519_sha256));
  CHECK_EQ(rsa.public_key(), "123456");

  // Folded p= value, as a long key often arrives.
  key_record folded{"k=rsa; p=MTIz\r\n\tNDU2"};
  CHECK_EQ(folded.public_key(), "123456");

  // h= restricts hashes, unknown names are ignored.
  key_record sha256_only{"h=md5:sha256; p=MTIz"};
  CHECK(sha256_only.allows(algorithm::rsa_sha256));
  CHECK(!sha256_only.allows(algorithm::rsa_sha1));

  key_record no_hash{"h=md5; p=MTIz"};
  CHECK(!no_hash.allows(algorithm::rsa_sha256));

  // Unknown key type is parsed, it just never matches.
  key_record dsa{"k=dsa; p=MTIz"};
  CHECK(!dsa.key());
  CHECK_EQ(dsa.key_type_name(), "dsa");
  CHECK(!dsa.allows(algorithm::rsa_sha256));

  // Service types.
  key_record web{"s=web; p=MTIz"};
  CHECK(!web.email_allowed());
  key_record mail{"s=web:email; p=MTIz"};
  CHECK(mail.email_allowed());

  // Flags and notes.
  key_record flags{"t=y:s:x; n=call me; p=MTIz"};
  CHECK(flags.testing());
  CHECK(flags.strict());
  CHECK_EQ(flags.notes(), "call me");

  // Revoked is valid, but distinct.
  key_record revoked{"v=DKIM1; p="};
  CHECK(revoked.revoked());
  CHECK(revoked.public_key().empty());

  key_record first{"p=; p=MTIz"};
  CHECK(first.revoked());

  // Malformed records.
  struct {
    char const* txt;
    char const* msg;
  } const bad[]{
      {"v=DKIM2; p=MTIz", "unknown key record version v=DKIM2"},
      {"v=DKIM1; k=rsa", "key record has no p= tag"},
      {"p=!!!!", "p= bad character in base64"},
  };
  for (auto const& b : bad) {
    key_record  key;
    std::string msg;
    CHECK(!key_record::validate(b.txt, msg, key)) << b.txt;
    CHECK_EQ(msg, b.msg);
  }

  key_record  key;
  std::string msg;
  CHECK(!key_record::validate("this is not a key record", msg, key));

  try {
    key_record k{"garbage"};
    LOG(FATAL) << "should have thrown";
  }
  catch (DKIM::error const& e) {
    CHECK(e.code() == DKIM::status::key_malformed);
  }
}

#include "DKIM-crypto.hpp"

#include "Hash.hpp"

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <glog/logging.h>

using DKIM::algorithm;
using DKIM::key_type;
using DKIM::private_key;
using DKIM::public_key;

namespace {
std::string pem_of(private_key const& key)
{
  auto const bio = CHECK_NOTNULL(BIO_new(BIO_s_mem()));
  CHECK_EQ(PEM_write_bio_PrivateKey(bio, key.get(), nullptr, nullptr, 0,
                                    nullptr, nullptr),
           1);
  char*       data = nullptr;
  auto const  len  = BIO_get_mem_data(bio, &data);
  std::string pem(data, len);
  BIO_free(bio);
  return pem;
}

void check_round_trip(algorithm alg, private_key const& key)
{
  auto const digest = Hash::digest(DKIM::hash_of(alg), "some header octets");
  auto const sig    = DKIM::sign(alg, key, digest);

  public_key const pub(key.type(), key.public_octets());
  CHECK(DKIM::verify(alg, pub, digest, sig)) << c_str(alg);

  auto bad_digest = digest;
  bad_digest[0] ^= 1;
  CHECK(!DKIM::verify(alg, pub, bad_digest, sig));

  auto bad_sig = sig;
  bad_sig[bad_sig.size() / 2] ^= 1;
  CHECK(!DKIM::verify(alg, pub, digest, bad_sig));

  CHECK(!DKIM::verify(alg, pub, digest, ""));
}
} // namespace

int main(int argc, char* argv[])
{
  private_key const rsa(
      CHECK_NOTNULL(EVP_PKEY_Q_keygen(nullptr, nullptr, "RSA", size_t{2048})));
  CHECK(rsa.type() == key_type::rsa);

  private_key const ed(
      CHECK_NOTNULL(EVP_PKEY_Q_keygen(nullptr, nullptr, "ED25519")));
  CHECK(ed.type() == key_type::ed25519);
  CHECK_EQ(ed.public_octets().size(), 32);

  check_round_trip(algorithm::rsa_sha256, rsa);
  check_round_trip(algorithm::rsa_sha1, rsa);
  check_round_trip(algorithm::ed25519_sha256, ed);

  // Ed25519 signatures are deterministic, and 64 octets.
  auto const digest = Hash::digest(DKIM::hash_alg::sha256, "abc");
  auto const ed_sig = DKIM::sign(algorithm::ed25519_sha256, ed, digest);
  CHECK_EQ(ed_sig.size(), 64);
  CHECK_EQ(ed_sig, DKIM::sign(algorithm::ed25519_sha256, ed, digest));

  public_key const rsa_pub(key_type::rsa, rsa.public_octets());
  CHECK_EQ(rsa_pub.bits(), 2048);

  // A signature from one hash doesn't verify as the other.
  auto const sha1_digest = Hash::digest(DKIM::hash_alg::sha1, "abc");
  auto const sha1_sig    = DKIM::sign(algorithm::rsa_sha1, rsa, sha1_digest);
  CHECK(!DKIM::verify(algorithm::rsa_sha256, rsa_pub, sha1_digest, sha1_sig));

  // Wrong key family.
  public_key const ed_pub(key_type::ed25519, ed.public_octets());
  CHECK(!DKIM::verify(algorithm::rsa_sha256, ed_pub, digest, ed_sig));
  try {
    DKIM::sign(algorithm::rsa_sha256, ed, digest);
    LOG(FATAL) << "should have thrown";
  }
  catch (DKIM::error const& e) {
    CHECK(e.code() == DKIM::status::key_material);
  }

  // PEM loading.
  auto const rsa_again = private_key::from_pem(pem_of(rsa));
  CHECK(rsa_again.type() == key_type::rsa);
  CHECK_EQ(rsa_again.public_octets(), rsa.public_octets());

  auto const ed_again = private_key::from_pem(pem_of(ed));
  CHECK(ed_again.type() == key_type::ed25519);
  CHECK_EQ(ed_again.public_octets(), ed.public_octets());

  // Raw seed.
  std::string const seed(32, '\x42');
  auto const        seeded  = private_key::from_ed25519_seed(seed);
  auto const        seeded2 = private_key::from_ed25519_seed(seed);
  CHECK_EQ(seeded.public_octets(), seeded2.public_octets());
  check_round_trip(algorithm::ed25519_sha256, seeded);

  for (auto const& bad : {std::string("not a key"), std::string(31, 'x')}) {
    try {
      if (bad.size() == 31)
        private_key::from_ed25519_seed(bad);
      else
        private_key::from_pem(bad);
      LOG(FATAL) << "should have thrown";
    }
    catch (DKIM::error const& e) {
      CHECK(e.code() == DKIM::status::key_material);
    }
  }

  // Public keys that don't decode.
  for (auto const& octets :
       {std::string("garbage"), std::string(), std::string(32, '\x42')}) {
    try {
      public_key const pub(key_type::rsa, octets);
      LOG(FATAL) << "should have thrown";
    }
    catch (DKIM::error const& e) {
      CHECK(e.code() == DKIM::status::key_malformed);
    }
  }

  // An RSA SubjectPublicKeyInfo published under k=ed25519.
  try {
    public_key const pub(key_type::ed25519, rsa.public_octets());
    LOG(FATAL) << "should have thrown";
  }
  catch (DKIM::error const& e) {
    CHECK(e.code() == DKIM::status::key_malformed);
  }

  // Moves.
  public_key moved(key_type::ed25519, ed.public_octets());
  public_key other(std::move(moved));
  CHECK(DKIM::verify(algorithm::ed25519_sha256, other, digest, ed_sig));
}

#include "DKIM-crypto.hpp"

#include <optional>
#include <utility>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <fmt/format.h>

#include <glog/logging.h>

namespace {
auto constexpr ed25519_key_size = 32;

// The last OpenSSL error, and an empty queue.
std::string ssl_error()
{
  auto const err = ERR_get_error();
  ERR_clear_error();
  if (err == 0)
    return "unknown error";
  char buf[256];
  ERR_error_string_n(err, buf, sizeof(buf));
  return buf;
}

class pkey_ctx {
public:
  pkey_ctx(pkey_ctx const&) = delete;
  pkey_ctx& operator=(pkey_ctx const&) = delete;

  explicit pkey_ctx(EVP_PKEY* pkey)
    : ctx_(CHECK_NOTNULL(EVP_PKEY_CTX_new(pkey, nullptr)))
  {
  }
  ~pkey_ctx() { EVP_PKEY_CTX_free(ctx_); }

  EVP_PKEY_CTX* get() const { return ctx_; }

private:
  EVP_PKEY_CTX* ctx_;
};

class md_ctx {
public:
  md_ctx(md_ctx const&) = delete;
  md_ctx& operator=(md_ctx const&) = delete;

  md_ctx()
    : ctx_(CHECK_NOTNULL(EVP_MD_CTX_new()))
  {
  }
  ~md_ctx() { EVP_MD_CTX_free(ctx_); }

  EVP_MD_CTX* get() const { return ctx_; }

private:
  EVP_MD_CTX* ctx_;
};

class mem_bio {
public:
  mem_bio(mem_bio const&) = delete;
  mem_bio& operator=(mem_bio const&) = delete;

  explicit mem_bio(std::string_view data)
    : bio_(CHECK_NOTNULL(
          BIO_new_mem_buf(data.data(), static_cast<int>(data.size()))))
  {
  }
  ~mem_bio() { BIO_free(bio_); }

  BIO* get() const { return bio_; }

private:
  BIO* bio_;
};

EVP_MD const* md_of(DKIM::hash_alg hash)
{
  return hash == DKIM::hash_alg::sha1 ? EVP_sha1() : EVP_sha256();
}

std::optional<DKIM::key_type> type_of(EVP_PKEY* pkey)
{
  switch (EVP_PKEY_base_id(pkey)) {
  case EVP_PKEY_RSA: return DKIM::key_type::rsa;
  case EVP_PKEY_ED25519: return DKIM::key_type::ed25519;
  }
  return {};
}

EVP_PKEY* parse_public(DKIM::key_type type, std::string_view octets)
{
  auto const data = reinterpret_cast<unsigned char const*>(octets.data());
  auto const len  = static_cast<long>(octets.size());

  if (type == DKIM::key_type::ed25519 && octets.size() == ed25519_key_size) {
    return EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, data,
                                       octets.size());
  }

  auto p = data;
  if (auto const pkey = d2i_PUBKEY(nullptr, &p, len); pkey)
    return pkey;
  ERR_clear_error();

  // Some publish the bare PKCS#1 RSAPublicKey.
  if (type == DKIM::key_type::rsa) {
    p = data;
    return d2i_PublicKey(EVP_PKEY_RSA, nullptr, &p, len);
  }

  return nullptr;
}
} // namespace

namespace DKIM {

public_key::public_key(key_type type, std::string_view octets)
  : pkey_(parse_public(type, octets))
  , type_(type)
{
  if (!pkey_) {
    throw error(status::key_malformed,
                fmt::format("can't decode {} public key: {}", c_str(type),
                            ssl_error()));
  }
  if (type_of(pkey_) != type) {
    EVP_PKEY_free(pkey_);
    throw error(status::key_malformed,
                fmt::format("public key is not {}", c_str(type)));
  }
}

public_key::public_key(public_key&& other) noexcept
  : pkey_(std::exchange(other.pkey_, nullptr))
  , type_(other.type_)
{
}

public_key& public_key::operator=(public_key&& other) noexcept
{
  std::swap(pkey_, other.pkey_);
  type_ = other.type_;
  return *this;
}

public_key::~public_key()
{
  if (pkey_)
    EVP_PKEY_free(pkey_);
}

int public_key::bits() const { return EVP_PKEY_bits(pkey_); }

private_key::private_key(EVP_PKEY* pkey)
  : pkey_(CHECK_NOTNULL(pkey))
{
  auto const type = type_of(pkey_);
  if (!type) {
    EVP_PKEY_free(pkey_);
    throw error(status::key_material, "private key is neither RSA nor Ed25519");
  }
  type_ = *type;
}

private_key::private_key(private_key&& other) noexcept
  : pkey_(std::exchange(other.pkey_, nullptr))
  , type_(other.type_)
{
}

private_key& private_key::operator=(private_key&& other) noexcept
{
  std::swap(pkey_, other.pkey_);
  type_ = other.type_;
  return *this;
}

private_key::~private_key()
{
  if (pkey_)
    EVP_PKEY_free(pkey_);
}

private_key private_key::from_pem(std::string_view pem)
{
  mem_bio    bio(pem);
  auto const pkey =
      PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
  if (!pkey) {
    throw error(status::key_material,
                fmt::format("can't read PEM private key: {}", ssl_error()));
  }
  return private_key(pkey);
}

private_key private_key::from_ed25519_seed(std::string_view seed)
{
  if (seed.size() != ed25519_key_size) {
    throw error(status::key_material,
                fmt::format("Ed25519 seed is {} octets, not {}", seed.size(),
                            ed25519_key_size));
  }
  auto const pkey = EVP_PKEY_new_raw_private_key(
      EVP_PKEY_ED25519, nullptr,
      reinterpret_cast<unsigned char const*>(seed.data()), seed.size());
  if (!pkey) {
    throw error(status::key_material,
                fmt::format("can't load Ed25519 seed: {}", ssl_error()));
  }
  return private_key(pkey);
}

std::string private_key::public_octets() const
{
  if (type_ == key_type::ed25519) {
    unsigned char buf[ed25519_key_size];
    size_t        len = sizeof(buf);
    CHECK_EQ(EVP_PKEY_get_raw_public_key(pkey_, buf, &len), 1);
    return std::string(reinterpret_cast<char const*>(buf), len);
  }

  unsigned char* der = nullptr;
  auto const     len = i2d_PUBKEY(pkey_, &der);
  CHECK_GT(len, 0) << ssl_error();
  std::string ret(reinterpret_cast<char const*>(der), len);
  OPENSSL_free(der);
  return ret;
}

std::string
sign(algorithm alg, private_key const& key, std::string_view digest)
{
  if (key.type() != key_type_of(alg)) {
    throw error(status::key_material,
                fmt::format("{} key can't make {} signatures",
                            c_str(key.type()), c_str(alg)));
  }

  auto const dgst = reinterpret_cast<unsigned char const*>(digest.data());

  std::string sig;
  size_t      sig_len = 0;

  switch (key_type_of(alg)) {
  case key_type::rsa: {
    pkey_ctx ctx(key.get());
    if (EVP_PKEY_sign_init(ctx.get()) != 1 ||
        EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) != 1 ||
        EVP_PKEY_CTX_set_signature_md(ctx.get(), md_of(hash_of(alg))) != 1 ||
        EVP_PKEY_sign(ctx.get(), nullptr, &sig_len, dgst, digest.size()) != 1) {
      throw error(status::key_material,
                  fmt::format("RSA sign setup failed: {}", ssl_error()));
    }
    sig.resize(sig_len);
    if (EVP_PKEY_sign(ctx.get(), reinterpret_cast<unsigned char*>(sig.data()),
                      &sig_len, dgst, digest.size()) != 1) {
      throw error(status::key_material,
                  fmt::format("RSA sign failed: {}", ssl_error()));
    }
    break;
  }

  case key_type::ed25519: {
    md_ctx ctx;
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) !=
            1 ||
        EVP_DigestSign(ctx.get(), nullptr, &sig_len, dgst, digest.size()) !=
            1) {
      throw error(status::key_material,
                  fmt::format("Ed25519 sign setup failed: {}", ssl_error()));
    }
    sig.resize(sig_len);
    if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char*>(sig.data()),
                       &sig_len, dgst, digest.size()) != 1) {
      throw error(status::key_material,
                  fmt::format("Ed25519 sign failed: {}", ssl_error()));
    }
    break;
  }
  }

  sig.resize(sig_len);
  return sig;
}

bool verify(algorithm         alg,
            public_key const& key,
            std::string_view  digest,
            std::string_view  sig)
{
  if (key.type() != key_type_of(alg)) {
    LOG(WARNING) << c_str(key.type()) << " key can't check " << c_str(alg)
                 << " signatures";
    return false;
  }

  auto const dgst = reinterpret_cast<unsigned char const*>(digest.data());
  auto const s    = reinterpret_cast<unsigned char const*>(sig.data());

  int rc = 0;

  switch (key_type_of(alg)) {
  case key_type::rsa: {
    pkey_ctx ctx(key.get());
    CHECK_EQ(EVP_PKEY_verify_init(ctx.get()), 1);
    CHECK_EQ(EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING), 1);
    CHECK_EQ(EVP_PKEY_CTX_set_signature_md(ctx.get(), md_of(hash_of(alg))),
             1);
    rc = EVP_PKEY_verify(ctx.get(), s, sig.size(), dgst, digest.size());
    break;
  }

  case key_type::ed25519: {
    md_ctx ctx;
    CHECK_EQ(
        EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()),
        1);
    rc = EVP_DigestVerify(ctx.get(), s, sig.size(), dgst, digest.size());
    break;
  }
  }

  if (rc != 1) {
    LOG(INFO) << c_str(alg) << " signature does not verify: " << ssl_error();
    return false;
  }
  return true;
}

} // namespace DKIM

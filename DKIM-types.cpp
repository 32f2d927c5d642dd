#include "DKIM-types.hpp"

#include "iequal.hpp"

namespace DKIM {

std::optional<algorithm> algorithm_from(std::string_view name)
{
  for (auto const& alg : algorithms) {
    if (iequal(name, alg.name))
      return alg.alg;
  }
  return {};
}

std::optional<algorithm> algorithm_for(key_type key, hash_alg hash)
{
  for (auto const& alg : algorithms) {
    if (alg.key == key && alg.hash == hash)
      return alg.alg;
  }
  return {};
}

std::optional<canon_alg> canon_from(std::string_view name)
{
  if (iequal(name, c_str(canon_alg::simple)))
    return canon_alg::simple;
  if (iequal(name, c_str(canon_alg::relaxed)))
    return canon_alg::relaxed;
  return {};
}

std::optional<hash_alg> hash_from(std::string_view name)
{
  if (iequal(name, c_str(hash_alg::sha1)))
    return hash_alg::sha1;
  if (iequal(name, c_str(hash_alg::sha256)))
    return hash_alg::sha256;
  return {};
}

std::optional<key_type> key_type_from(std::string_view name)
{
  if (iequal(name, c_str(key_type::rsa)))
    return key_type::rsa;
  if (iequal(name, c_str(key_type::ed25519)))
    return key_type::ed25519;
  return {};
}

} // namespace DKIM

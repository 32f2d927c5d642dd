#include "DKIM-key.hpp"

#include "Base64.hpp"
#include "DKIM-tags.hpp"
#include "esc.hpp"
#include "iequal.hpp"

#include <algorithm>

#include <fmt/format.h>

#include <glog/logging.h>

namespace DKIM {

key_record::key_record(std::string_view txt)
{
  std::string msg;
  if (!set_(txt, msg))
    throw error(status::key_malformed, msg);
}

bool key_record::validate(std::string_view txt,
                          std::string&     msg,
                          key_record&      key)
{
  return key.set_(txt, msg);
}

bool key_record::set_(std::string_view txt, std::string& msg)
{
  tag_list tags;
  if (!tags.parse(txt)) {
    msg = fmt::format("key record syntax error «{}»", esc(txt));
    return false;
  }

  key_record rec;

  if (auto const v = tags.find("v")) {
    if (auto const ver = strip_fws(*v); ver != "DKIM1") {
      msg = fmt::format("unknown key record version v={}", ver);
      return false;
    }
  }

  if (auto const k = tags.find("k")) {
    rec.key_name_ = strip_fws(*k);
    rec.key_      = key_type_from(rec.key_name_);
    if (!rec.key_)
      LOG(WARNING) << "unknown key type k=" << rec.key_name_;
  }

  if (auto const h = tags.find("h")) {
    rec.hash_restricted_ = true;
    for (auto const& name : split_colon_list(*h)) {
      if (auto const hash = hash_from(name))
        rec.hashes_.push_back(*hash);
    }
    if (rec.hashes_.empty())
      LOG(WARNING) << "no known hash algorithm in h=" << strip_fws(*h);
  }

  if (auto const s = tags.find("s"))
    rec.services_ = split_colon_list(*s);

  if (auto const t = tags.find("t")) {
    for (auto const& flag : split_colon_list(*t)) {
      if (flag == "y")
        rec.testing_ = true;
      else if (flag == "s")
        rec.strict_ = true;
    }
  }

  if (auto const n = tags.find("n"))
    rec.notes_ = *n;

  auto const p = tags.find("p");
  if (!p) {
    msg = "key record has no p= tag";
    return false;
  }
  auto const pub = strip_fws(*p);
  if (pub.empty()) {
    rec.revoked_ = true;
  }
  else {
    try {
      rec.public_key_ = Base64::dec(pub);
    }
    catch (std::invalid_argument const& e) {
      msg = fmt::format("p= {}", e.what());
      return false;
    }
  }

  *this = std::move(rec);
  return true;
}

bool key_record::hash_allowed(hash_alg hash) const
{
  if (!hash_restricted_)
    return true;
  return std::find(begin(hashes_), end(hashes_), hash) != end(hashes_);
}

bool key_record::allows(algorithm alg) const
{
  return key_ && (*key_ == key_type_of(alg)) && hash_allowed(hash_of(alg));
}

bool key_record::email_allowed() const
{
  return std::any_of(begin(services_), end(services_), [](auto const& s) {
    return s == "*" || iequal(s, "email");
  });
}

} // namespace DKIM

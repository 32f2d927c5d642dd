#include "DKIM-sig.hpp"

#include "Base64.hpp"
#include "DKIM-tags.hpp"
#include "iequal.hpp"

#include <algorithm>
#include <charconv>

#include <fmt/format.h>

#include <glog/logging.h>

namespace {
// Longest line we'll produce when folding, separator included.
auto constexpr max_line = 76;

// Tags this code understands, everything else is kept but ignored.
constexpr char const* known_tags[]{
    "v", "a", "b", "bh", "c", "d", "h", "i", "l", "q", "s", "t", "x", "z",
};

bool is_known(std::string_view name)
{
  return std::find(std::begin(known_tags), std::end(known_tags), name) !=
         std::end(known_tags);
}

// RFC 6376 limits these to 12 digits, but we take whatever fits.
std::optional<uint64_t> to_uint(std::string_view s)
{
  if (s.empty() || s.size() > 20)
    return {};
  uint64_t   value{};
  auto const end = s.data() + s.size();
  auto const [ptr, ec] = std::from_chars(s.data(), end, value);
  if (ec != std::errc() || ptr != end)
    return {};
  return value;
}
} // namespace

namespace DKIM {

bool is_same_or_subdomain(std::string_view dom, std::string_view parent)
{
  if (!dom.empty() && dom.back() == '.')
    dom.remove_suffix(1);
  if (!parent.empty() && parent.back() == '.')
    parent.remove_suffix(1);
  if (parent.empty())
    return false;
  if (iequal(dom, parent))
    return true;
  return dom.size() > parent.size() && iends_with(dom, parent) &&
         dom[dom.size() - parent.size() - 1] == '.';
}

signature::signature(std::string_view value)
{
  std::string msg;
  if (!set_(value, msg))
    throw error(status::header_parse_error, msg);
}

bool signature::validate(std::string_view value,
                         std::string&     msg,
                         signature&       sig)
{
  return sig.set_(value, msg);
}

bool signature::set_(std::string_view value, std::string& msg)
{
  tag_list tags;
  if (!tags.parse(value)) {
    msg = "DKIM-Signature tag-list syntax error";
    return false;
  }

  for (auto name : {"v", "a", "b", "bh", "d", "h", "s"}) {
    if (!tags.find(name)) {
      msg = fmt::format("missing required tag {}=", name);
      return false;
    }
  }

  fields f;

  if (auto const v = strip_fws(*tags.find("v")); v != "1") {
    msg = fmt::format("unknown version v={}", v);
    return false;
  }

  auto const a   = strip_fws(*tags.find("a"));
  auto const alg = algorithm_from(a);
  if (!alg) {
    msg = fmt::format("unknown signing algorithm a={}", a);
    return false;
  }
  f.alg = *alg;

  if (auto const c = tags.find("c")) {
    auto const canon = strip_fws(*c);
    auto const slash = canon.find('/');
    auto const hdr   = canon_from(std::string_view(canon).substr(0, slash));
    if (!hdr) {
      msg = fmt::format("unknown canonicalization c={}", canon);
      return false;
    }
    f.header_canon = *hdr;
    if (slash != std::string::npos) {
      auto const body = canon_from(std::string_view(canon).substr(slash + 1));
      if (!body) {
        msg = fmt::format("unknown canonicalization c={}", canon);
        return false;
      }
      f.body_canon = *body;
    }
  }

  f.domain = strip_fws(*tags.find("d"));
  if (f.domain.empty()) {
    msg = "empty d=";
    return false;
  }

  f.selector = strip_fws(*tags.find("s"));
  if (f.selector.empty()) {
    msg = "empty s=";
    return false;
  }

  f.headers = split_colon_list(*tags.find("h"));
  if (std::none_of(begin(f.headers), end(f.headers),
                   [](auto const& h) { return iequal(h, "from"); })) {
    msg = "h= does not include From";
    return false;
  }

  f.body_hash = strip_fws(*tags.find("bh"));
  if (f.body_hash.empty() || !Base64::is_valid(f.body_hash)) {
    msg = fmt::format("bad body hash bh={}", f.body_hash);
    return false;
  }

  f.sig = strip_fws(*tags.find("b"));
  if (f.sig.empty()) {
    msg = "empty b=";
    return false;
  }
  if (!Base64::is_valid(f.sig)) {
    msg = "b= is not valid base64";
    return false;
  }

  struct {
    char const*              name;
    std::optional<uint64_t>& value;
  } const numbers[]{
      {"l", f.length},
      {"t", f.timestamp},
      {"x", f.expiration},
  };
  for (auto const& num : numbers) {
    if (auto const val = tags.find(num.name)) {
      auto const str = strip_fws(*val);
      num.value      = to_uint(str);
      if (!num.value) {
        msg = fmt::format("bad number {}={}", num.name, str);
        return false;
      }
    }
  }
  if (f.timestamp && f.expiration && *f.expiration <= *f.timestamp) {
    msg = fmt::format("x={} not after t={}", *f.expiration, *f.timestamp);
    return false;
  }

  if (auto const i = tags.find("i")) {
    f.identity     = strip_fws(*i);
    auto const at  = f.identity->rfind('@');
    if (at == std::string::npos) {
      msg = fmt::format("i={} has no @", *f.identity);
      return false;
    }
    auto const dom = std::string_view(*f.identity).substr(at + 1);
    if (!is_same_or_subdomain(dom, f.domain)) {
      msg = fmt::format("i={} not within d={}", *f.identity, f.domain);
      return false;
    }
  }

  if (auto const q = tags.find("q")) {
    f.query = strip_fws(*q);
    auto const methods = split_colon_list(*f.query);
    if (std::none_of(begin(methods), end(methods),
                     [](auto const& m) { return iequal(m, "dns/txt"); })) {
      msg = fmt::format("unknown query method q={}", *f.query);
      return false;
    }
  }

  if (auto const z = tags.find("z"))
    f.copied_headers = strip_fws(*z);

  std::vector<std::pair<std::string, std::string>> unknown;
  for (auto const& t : tags.tags()) {
    if (is_known(t.name))
      continue;
    if (std::any_of(begin(unknown), end(unknown),
                    [&t](auto const& u) { return u.first == t.name; }))
      continue;
    unknown.emplace_back(t.name, t.value);
  }

  f_       = std::move(f);
  unknown_ = std::move(unknown);
  return true;
}

std::string signature::body_hash() const { return Base64::dec(f_.body_hash); }

std::string signature::sig() const { return Base64::dec(f_.sig); }

std::string signature::effective_identity() const
{
  if (f_.identity)
    return *f_.identity;
  return fmt::format("@{}", f_.domain);
}

std::string signature::as_field() const
{
  auto ret = fmt::format("DKIM-Signature: ");

  std::string::size_type col   = ret.size();
  bool                   first = true;

  // Separator, then the start of a tag; fold if the start won't fit.
  auto start = [&](std::string_view text) {
    if (!first) {
      if (col + 2 + text.size() >= max_line) {
        ret += ";\r\n\t";
        col = 1;
      }
      else {
        ret += "; ";
        col += 2;
      }
    }
    first = false;
    ret += text;
    col += text.size();
  };

  auto add = [&](std::string_view name, std::string_view value) {
    start(fmt::format("{}={}", name, value));
  };

  add("v", "1");
  add("a", c_str(f_.alg));
  add("d", f_.domain);
  add("s", f_.selector);
  add("c", fmt::format("{}/{}", c_str(f_.header_canon),
                       c_str(f_.body_canon)));
  if (f_.query)
    add("q", *f_.query);
  if (f_.identity)
    add("i", *f_.identity);
  if (f_.length)
    add("l", fmt::format("{}", *f_.length));
  if (f_.timestamp)
    add("t", fmt::format("{}", *f_.timestamp));
  if (f_.expiration)
    add("x", fmt::format("{}", *f_.expiration));
  if (f_.copied_headers)
    add("z", *f_.copied_headers);

  for (size_t n = 0; n < f_.headers.size(); ++n) {
    auto const& hdr = f_.headers[n];
    if (n == 0) {
      start(fmt::format("h={}", hdr));
    }
    else if (col + 1 + hdr.size() >= max_line) {
      ret += ":\r\n\t";
      ret += hdr;
      col = 1 + hdr.size();
    }
    else {
      ret += ':';
      ret += hdr;
      col += 1 + hdr.size();
    }
  }

  add("bh", f_.body_hash);

  start("b=");
  for (auto ch : f_.sig) {
    if (col >= max_line) {
      ret += "\r\n\t";
      col = 1;
    }
    ret += ch;
    ++col;
  }

  return ret;
}

} // namespace DKIM

#include "DKIM-hash.hpp"

#include "DKIM-canon.hpp"
#include "Hash.hpp"
#include "esc.hpp"
#include "iequal.hpp"

#include <map>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_bool(log_dkim_hash_input,
            false,
            "log the canonical octets fed to the DKIM header hash");

namespace DKIM {

std::string body_hash(hash_alg                alg,
                      canon_alg               canon,
                      std::string_view        body,
                      std::optional<uint64_t> length,
                      line_ending             eol)
{
  auto const canonical = canon_body(canon, body, eol);

  std::string_view hashed{canonical};
  if (length) {
    if (*length < hashed.size())
      hashed = hashed.substr(0, *length);
    else if (*length > hashed.size())
      LOG(INFO) << "l=" << *length << " is more than the " << hashed.size()
                << " octets of canonical body";
  }

  return Hash::digest(alg, hashed);
}

std::vector<std::size_t>
select_headers(message::parsed const&          msg,
               std::vector<std::string> const& names,
               std::optional<std::size_t>      exclude)
{
  // Field indices by name, top of the message first.
  std::map<std::string_view, std::vector<std::size_t>, ci_less> by_name;
  for (std::size_t i = 0; i < msg.headers.size(); ++i) {
    if (exclude && *exclude == i)
      continue;
    by_name[msg.headers[i].name].push_back(i);
  }

  std::vector<std::size_t> selected;
  for (auto const& name : names) {
    auto const group = by_name.find(name);
    if (group == by_name.end() || group->second.empty())
      continue;
    selected.push_back(group->second.back());
    group->second.pop_back();
  }
  return selected;
}

std::string header_hash_input(message::parsed const&          msg,
                              std::vector<std::string> const& names,
                              canon_alg                       canon,
                              std::string_view                sig_field,
                              line_ending                     eol,
                              std::optional<std::size_t>      exclude)
{
  std::string input;
  for (auto const idx : select_headers(msg, names, exclude))
    input += canon_header(canon, msg.headers[idx].as_view(), eol);

  auto sig = canon_header(canon, sig_field, eol);
  CHECK_GE(sig.size(), 2);
  sig.resize(sig.size() - 2); // no CRLF on this one
  input += sig;

  if (FLAGS_log_dkim_hash_input)
    LOG(INFO) << "header hash input:\n"
              << esc(input, esc_line_option::multi);

  return input;
}

std::string header_hash(hash_alg                        alg,
                        message::parsed const&          msg,
                        std::vector<std::string> const& names,
                        canon_alg                       canon,
                        std::string_view                sig_field,
                        line_ending                     eol,
                        std::optional<std::size_t>      exclude)
{
  return Hash::digest(
      alg, header_hash_input(msg, names, canon, sig_field, eol, exclude));
}

} // namespace DKIM

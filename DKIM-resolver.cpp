#include "DKIM-resolver.hpp"

#include <fmt/format.h>

#include <glog/logging.h>

namespace DKIM {

std::string key_resolver::query_name(std::string_view selector,
                                     std::string_view domain)
{
  return fmt::format("{}._domainkey.{}", selector, domain);
}

key_lookup key_resolver::resolve(std::string_view          selector,
                                 std::string_view          domain,
                                 std::chrono::milliseconds timeout) const
{
  auto const name = query_name(selector, domain);

  key_lookup ret;

  txt_answer answer;
  try {
    answer = dns_.lookup_txt(name, timeout);
  }
  catch (std::exception const& e) {
    LOG(WARNING) << "TXT lookup for " << name << " threw: " << e.what();
    ret.st     = status::dns_failure;
    ret.detail = fmt::format("{}: {}", name, e.what());
    return ret;
  }

  switch (answer.status) {
  case lookup_status::ok: break;

  case lookup_status::not_found:
    ret.st     = status::no_key;
    ret.detail = fmt::format("no key at {}", name);
    return ret;

  case lookup_status::failure:
    LOG(WARNING) << "TXT lookup for " << name << " failed: " << answer.detail;
    ret.st     = status::dns_failure;
    ret.detail = fmt::format("{}: {}", name, answer.detail);
    return ret;
  }

  if (answer.records.size() <= selected_record) {
    ret.st     = status::no_key;
    ret.detail = fmt::format("no TXT record at {}", name);
    return ret;
  }
  if (answer.records.size() > 1) {
    LOG(WARNING) << answer.records.size() << " TXT records at " << name
                 << ", using number " << selected_record;
  }

  // RFC 6376 section 3.6.2.2, strings are concatenated without separator.
  std::string txt;
  for (auto const& s : answer.records[selected_record])
    txt += s;

  std::string msg;
  if (!key_record::validate(txt, msg, ret.key)) {
    LOG(WARNING) << "bad key record at " << name << ": " << msg;
    ret.st     = status::key_malformed;
    ret.detail = fmt::format("{}: {}", name, msg);
    return ret;
  }
  if (ret.key.revoked()) {
    ret.st     = status::key_revoked;
    ret.detail = fmt::format("key at {} revoked", name);
    return ret;
  }

  ret.st = status::pass;
  return ret;
}

std::future<key_lookup>
key_resolver::resolve_async(std::string               selector,
                            std::string               domain,
                            std::chrono::milliseconds timeout) const
{
  return std::async(std::launch::async,
                    [this, selector = std::move(selector),
                     domain = std::move(domain), timeout] {
                      return resolve(selector, domain, timeout);
                    });
}

} // namespace DKIM

#ifndef DKIM_RESOLVER_DOT_HPP
#define DKIM_RESOLVER_DOT_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <string>
#include <string_view>
#include <vector>

#include "DKIM-key.hpp"
#include "DKIM-types.hpp"

namespace DKIM {

enum class lookup_status : uint8_t {
  ok,
  not_found, // NXDOMAIN or NODATA
  failure,   // timeout, SERVFAIL, anything else
};

struct txt_answer {
  lookup_status status{lookup_status::failure};

  // One entry per TXT RR in response order, each holding that RR's
  // character-strings.
  std::vector<std::vector<std::string>> records;

  std::string detail;
};

// The one thing we need from DNS.  Implementations must return within
// (about) the timeout, reporting lookup_status::failure when it runs
// out, and be callable from several threads at once.  Nothing above
// this interface enforces the timeout.
class txt_resolver {
public:
  virtual ~txt_resolver() = default;

  virtual txt_answer lookup_txt(std::string const&        name,
                                std::chrono::milliseconds timeout) const = 0;
};

struct key_lookup {
  status      st{status::dns_failure}; // pass when key is usable
  key_record  key;
  std::string detail;
};

class key_resolver {
public:
  // With more than one TXT record at the name, use this one.
  static constexpr std::size_t selected_record = 0;

  // The txt_resolver must outlive this object.
  explicit key_resolver(txt_resolver const& dns)
    : dns_(dns)
  {
  }
  explicit key_resolver(txt_resolver&&) = delete;

  // <selector>._domainkey.<domain>
  static std::string query_name(std::string_view selector,
                                std::string_view domain);

  key_lookup resolve(std::string_view          selector,
                     std::string_view          domain,
                     std::chrono::milliseconds timeout) const;

  std::future<key_lookup> resolve_async(std::string               selector,
                                        std::string               domain,
                                        std::chrono::milliseconds timeout) const;

private:
  txt_resolver const& dns_;
};

} // namespace DKIM

#endif // DKIM_RESOLVER_DOT_HPP

#ifndef DKIM_MEMORY_RESOLVER_DOT_HPP
#define DKIM_MEMORY_RESOLVER_DOT_HPP

#include <atomic>
#include <map>
#include <thread>
#include <string>
#include <vector>

#include "DKIM-resolver.hpp"
#include "iequal.hpp"

// A txt_resolver serving a fixed table, for the tests.

namespace DKIM {

class memory_resolver : public txt_resolver {
public:
  // One TXT record made of one string.
  void add(std::string const& name, std::string const& txt)
  {
    auto& answer  = table_[name];
    answer.status = lookup_status::ok;
    answer.records.push_back({txt});
  }

  // One TXT record made of several strings.
  void add(std::string const& name, std::vector<std::string> const& strings)
  {
    auto& answer  = table_[name];
    answer.status = lookup_status::ok;
    answer.records.push_back(strings);
  }

  void fail(std::string const& name, std::string const& detail)
  {
    auto& answer  = table_[name];
    answer.status = lookup_status::failure;
    answer.detail = detail;
  }

  // The answer for name takes this long; a lookup with a shorter
  // timeout gives up after the timeout and fails.
  void delay(std::string const& name, std::chrono::milliseconds d)
  {
    delays_[name] = d;
  }

  txt_answer lookup_txt(std::string const&        name,
                        std::chrono::milliseconds timeout) const override
  {
    ++lookups_;

    auto const slow = delays_.find(name);
    if (slow != delays_.end()) {
      if (slow->second > timeout) {
        std::this_thread::sleep_for(timeout);
        txt_answer late;
        late.status = lookup_status::failure;
        late.detail = "timed out";
        return late;
      }
      std::this_thread::sleep_for(slow->second);
    }

    auto const answer = table_.find(name);
    if (answer == table_.end()) {
      txt_answer nx;
      nx.status = lookup_status::not_found;
      return nx;
    }
    return answer->second;
  }

  int lookups() const { return lookups_; }

private:
  std::map<std::string, txt_answer, ci_less>                table_;
  std::map<std::string, std::chrono::milliseconds, ci_less> delays_;

  mutable std::atomic<int> lookups_{0};
};

} // namespace DKIM

#endif // DKIM_MEMORY_RESOLVER_DOT_HPP

#ifndef DNS_LDNS_DOT_HPP
#define DNS_LDNS_DOT_HPP

#include <chrono>
#include <string>
#include <vector>

#include "DKIM-resolver.hpp"

// forward decl
typedef struct ldns_struct_pkt      ldns_pkt;
typedef struct ldns_struct_rdf      ldns_rdf;
typedef struct ldns_struct_resolver ldns_resolver;

namespace DNS_ldns {

class Domain {
public:
  Domain(Domain const&) = delete;
  Domain& operator=(Domain const&) = delete;

  // Throws std::invalid_argument if ldns won't take it as a name.
  explicit Domain(std::string const& domain);
  ~Domain();

  std::string const& str() const { return str_; }
  ldns_rdf*          get() const { return rdfp_; }

private:
  std::string str_;
  ldns_rdf*   rdfp_;
};

// One stub resolver, configured from /etc/resolv.conf, that gives up
// after about the timeout: a single try of each nameserver, one retry.
class Resolver {
public:
  Resolver(Resolver const&) = delete;
  Resolver& operator=(Resolver const&) = delete;

  // Throws std::runtime_error if there is no usable configuration.
  explicit Resolver(std::chrono::milliseconds timeout);
  ~Resolver();

  ldns_resolver* get() const { return res_; }

private:
  ldns_resolver* res_;
};

class Query {
public:
  Query(Query const&) = delete;
  Query& operator=(Query const&) = delete;

  Query(Resolver const& res, std::string const& name);
  ~Query();

  bool nx_domain() const { return nx_domain_; }
  bool failed() const { return failed_; }

  std::string const& error() const { return error_; }

  // The TXT RRs of the answer section, in order, each as its list of
  // character-strings.
  std::vector<std::vector<std::string>> get_txt() const;

private:
  ldns_pkt* p_{nullptr};

  bool nx_domain_{false};
  bool failed_{false};

  std::string error_;
};

// The DKIM key lookup capability, backed by ldns.  A new resolver is
// set up for each lookup, so any number of threads can use one of these.
class TXT_resolver : public DKIM::txt_resolver {
public:
  DKIM::txt_answer lookup_txt(std::string const&        name,
                              std::chrono::milliseconds timeout) const override;
};

} // namespace DNS_ldns

#endif // DNS_LDNS_DOT_HPP

#include "DNS-ldns.hpp"

#include <stdexcept>

#include <cstdbool> // needs to be above ldns includes
#include <ldns/ldns.h>
#include <ldns/packet.h>
#include <ldns/rr.h>

#include <sys/time.h>

#include <glog/logging.h>

#include <fmt/format.h>

namespace DNS_ldns {

// A character-string: one length octet, then the data.
std::string rr_str(ldns_rdf const* rdf)
{
  CHECK_NOTNULL(rdf);

  auto const sz = ldns_rdf_size(rdf);
  if (sz == 0)
    return "";

  auto const data = reinterpret_cast<char const*>(ldns_rdf_data(rdf));
  auto const len  = static_cast<unsigned char>(data[0]);
  if (len + 1u > sz) {
    LOG(WARNING) << "TXT character-string length " << unsigned(len)
                 << " exceeds rdata size " << sz;
    return std::string(data + 1, sz - 1);
  }

  return std::string(data + 1, len);
}

Domain::Domain(std::string const& domain)
  : str_(domain)
  , rdfp_(ldns_dname_new_frm_str(domain.c_str()))
{
  if (!rdfp_)
    throw std::invalid_argument(fmt::format("bad domain name «{}»", domain));
}

Domain::~Domain() { ldns_rdf_deep_free(rdfp_); }

Resolver::Resolver(std::chrono::milliseconds timeout)
{
  auto status = ldns_resolver_new_frm_file(&res_, nullptr);
  if (status != LDNS_STATUS_OK) {
    throw std::runtime_error(fmt::format("failed to initialize DNS resolver: {}",
                                         ldns_get_errorstr_by_id(status)));
  }

  timeval tv;
  tv.tv_sec  = timeout.count() / 1000;
  tv.tv_usec = (timeout.count() % 1000) * 1000;
  ldns_resolver_set_timeout(res_, tv);
  ldns_resolver_set_retry(res_, 1);
}

Resolver::~Resolver() { ldns_resolver_deep_free(res_); }

Query::Query(Resolver const& res, std::string const& name)
{
  Domain dom(name);

  ldns_status status =
      ldns_resolver_query_status(&p_, res.get(), dom.get(), LDNS_RR_TYPE_TXT,
                                 LDNS_RR_CLASS_IN, LDNS_RD | LDNS_AD);

  if (status != LDNS_STATUS_OK) {
    failed_ = true;
    error_  = ldns_get_errorstr_by_id(status);
  }

  if (p_) {
    auto const rcode = ldns_pkt_get_rcode(p_);

    switch (rcode) {
    case LDNS_RCODE_NOERROR: break;

    case LDNS_RCODE_NXDOMAIN: nx_domain_ = true; break;

    case LDNS_RCODE_SERVFAIL:
      failed_ = true;
      error_  = "SERVFAIL";
      break;

    default:
      failed_ = true;
      error_  = fmt::format("rcode {}", static_cast<int>(rcode));
      LOG(WARNING) << "DNS unknown error (" << dom.str() << "/TXT), rcode = "
                   << rcode;
      break;
    }
  }
  else if (!failed_) {
    failed_ = true;
    error_  = "no response";
  }
}

Query::~Query()
{
  if (p_)
    ldns_pkt_free(p_);
}

std::vector<std::vector<std::string>> Query::get_txt() const
{
  std::vector<std::vector<std::string>> ret;
  if (!p_)
    return ret;

  // no clones, so no frees required
  auto const answer = ldns_pkt_answer(p_);
  if (!answer)
    return ret;

  for (unsigned i = 0; i < ldns_rr_list_rr_count(answer); ++i) {
    auto const rr = ldns_rr_list_rr(answer, i);
    if (!rr || ldns_rr_get_type(rr) != LDNS_RR_TYPE_TXT)
      continue; // CNAMEs on the way

    std::vector<std::string> strings;
    for (unsigned j = 0; j < ldns_rr_rd_count(rr); ++j) {
      auto const rdf = ldns_rr_rdf(rr, j);
      CHECK_EQ(ldns_rdf_get_type(rdf), LDNS_RDF_TYPE_STR);
      strings.push_back(rr_str(rdf));
    }
    ret.push_back(std::move(strings));
  }

  return ret;
}

DKIM::txt_answer
TXT_resolver::lookup_txt(std::string const&        name,
                         std::chrono::milliseconds timeout) const
{
  DKIM::txt_answer answer;

  try {
    Resolver res(timeout);
    Query    q(res, name);

    if (q.nx_domain()) {
      answer.status = DKIM::lookup_status::not_found;
      return answer;
    }
    if (q.failed()) {
      answer.status = DKIM::lookup_status::failure;
      answer.detail = q.error();
      return answer;
    }

    answer.records = q.get_txt();
    answer.status  = answer.records.empty() ? DKIM::lookup_status::not_found
                                            : DKIM::lookup_status::ok;
  }
  catch (std::invalid_argument const& e) {
    // No such name can exist.
    answer.status = DKIM::lookup_status::not_found;
    answer.detail = e.what();
  }
  catch (std::runtime_error const& e) {
    answer.status = DKIM::lookup_status::failure;
    answer.detail = e.what();
  }

  return answer;
}

} // namespace DNS_ldns
